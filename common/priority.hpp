#pragma once

// ============================================================
// priority.hpp -- Transfer priority levels
// ============================================================

#include "platform.hpp"
#include "utils.hpp"
#include <string>
#include <stdexcept>

// Lower value is serviced first
enum class Priority : u8 {
    CRITICAL = 1,
    HIGH     = 2,
    NORMAL   = 3,
    LOW      = 4,
};

inline const char* priority_name(Priority p) {
    switch (p) {
        case Priority::CRITICAL: return "CRITICAL";
        case Priority::HIGH:     return "HIGH";
        case Priority::NORMAL:   return "NORMAL";
        case Priority::LOW:      return "LOW";
    }
    return "UNKNOWN";
}

inline bool priority_valid(int v) {
    return v >= 1 && v <= 4;
}

inline Priority priority_from_int(int v) {
    if (!priority_valid(v)) {
        throw std::runtime_error("Priority out of range 1..4: " + std::to_string(v));
    }
    return static_cast<Priority>(v);
}

// Accepts "1".."4" or a level name, case-insensitive
inline Priority parse_priority(const std::string& text) {
    if (text.size() == 1 && text[0] >= '0' && text[0] <= '9') {
        return priority_from_int(text[0] - '0');
    }
    std::string up = utils::to_upper(text);
    if (up == "CRITICAL") return Priority::CRITICAL;
    if (up == "HIGH")     return Priority::HIGH;
    if (up == "NORMAL")   return Priority::NORMAL;
    if (up == "LOW")      return Priority::LOW;
    throw std::runtime_error("Unknown priority: " + text);
}
