#pragma once

// ============================================================
// logger.hpp -- Thread-safe logger with structured events
// ============================================================

#include "platform.hpp"
#include <string>
#include <mutex>
#include <fstream>
#include <iostream>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <memory>
#include <utility>
#include <vector>
#include <filesystem>
#include <stdexcept>

enum class LogLevel {
    DEBUG = 0,
    INFO  = 1,
    WARN  = 2,
    ERR   = 3,
};

// One key=value pair of a structured event
using LogField = std::pair<std::string, std::string>;

class Logger {
public:
    static Logger& get() {
        static Logger instance;
        return instance;
    }

    void set_level(LogLevel lvl) {
        std::lock_guard<std::mutex> lk(mutex_);
        level_ = lvl;
    }

    LogLevel level() const { return level_; }

    // Accepts DEBUG, INFO, WARN/WARNING, ERROR (case-insensitive)
    static LogLevel parse_level(const std::string& name) {
        std::string up = name;
        for (auto& c : up) {
            if (c >= 'a' && c <= 'z') c = (char)(c - 32);
        }
        if (up == "DEBUG") return LogLevel::DEBUG;
        if (up == "INFO")  return LogLevel::INFO;
        if (up == "WARN" || up == "WARNING") return LogLevel::WARN;
        if (up == "ERROR" || up == "CRITICAL") return LogLevel::ERR;
        throw std::runtime_error("Unknown log level: " + name);
    }

    void set_level_from_string(const std::string& name) {
        set_level(parse_level(name));
    }

    // Mirror every line to 'path'; transfer errors go to a sibling
    // transfer_errors.log in the same directory.
    void set_log_file(const std::string& path) {
        std::lock_guard<std::mutex> lk(mutex_);
        if (file_.is_open()) file_.close();
        file_.open(path, std::ios::app);
        if (!file_.is_open()) {
            throw std::runtime_error("Cannot open log file: " + path);
        }
        auto dir = std::filesystem::path(path).parent_path();
        transfer_err_path_ = (dir / "transfer_errors.log").string();
        if (transfer_err_file_.is_open()) transfer_err_file_.close();
    }

    void log(LogLevel lvl, const std::string& msg) {
        if (lvl < level_) return;
        std::string line = format_line(lvl, msg);
        std::lock_guard<std::mutex> lk(mutex_);
        if (lvl >= LogLevel::WARN) {
            std::cerr << line << "\n";
        } else {
            std::cout << line << "\n";
        }
        if (file_.is_open()) {
            file_ << line << "\n";
            file_.flush();
        }
    }

    void info(const std::string& msg)  { log(LogLevel::INFO, msg); }
    void warn(const std::string& msg)  { log(LogLevel::WARN, msg); }
    void error(const std::string& msg) { log(LogLevel::ERR,  msg); }
    void debug(const std::string& msg) { log(LogLevel::DEBUG, msg); }

    // Structured event: "event=<name> k1=v1 k2=v2"
    // Values containing spaces are quoted.
    void event(LogLevel lvl, const std::string& name,
               const std::vector<LogField>& fields) {
        if (lvl < level_) return;
        std::string msg = "event=" + name;
        for (const auto& f : fields) {
            msg += ' ';
            msg += f.first;
            msg += '=';
            if (f.second.find(' ') != std::string::npos || f.second.empty()) {
                msg += '"' + f.second + '"';
            } else {
                msg += f.second;
            }
        }
        log(lvl, msg);
    }

    // Log transfer error to a dedicated error log
    void transfer_error(const std::string& msg) {
        std::string line = format_line(LogLevel::ERR, "[TRANSFER] " + msg);
        std::lock_guard<std::mutex> lk(mutex_);
        std::cerr << line << "\n";
        if (file_.is_open()) {
            file_ << line << "\n";
            file_.flush();
        }
        if (!transfer_err_file_.is_open()) {
            transfer_err_file_.open(transfer_err_path_, std::ios::app);
        }
        if (transfer_err_file_.is_open()) {
            transfer_err_file_ << line << "\n";
            transfer_err_file_.flush();
        }
    }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

private:
    Logger() : level_(LogLevel::INFO), transfer_err_path_("transfer_errors.log") {}

    std::string format_line(LogLevel lvl, const std::string& msg) {
        auto now = std::chrono::system_clock::now();
        auto t   = std::chrono::system_clock::to_time_t(now);
        auto ms  = std::chrono::duration_cast<std::chrono::milliseconds>(
                       now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
        localtime_r(&t, &tm_buf);
        std::ostringstream ss;
        ss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
        ss << '.' << std::setfill('0') << std::setw(3) << ms.count();
        ss << " [" << level_str(lvl) << "] " << msg;
        return ss.str();
    }

    static const char* level_str(LogLevel lvl) {
        switch (lvl) {
            case LogLevel::DEBUG: return "DEBUG";
            case LogLevel::INFO:  return "INFO ";
            case LogLevel::WARN:  return "WARN ";
            case LogLevel::ERR:   return "ERROR";
        }
        return "?????";
    }

    std::mutex    mutex_;
    LogLevel      level_;
    std::ofstream file_;
    std::string   transfer_err_path_;
    std::ofstream transfer_err_file_;
};

// Convenience macros
#define LOG_INFO(msg)  Logger::get().info(msg)
#define LOG_WARN(msg)  Logger::get().warn(msg)
#define LOG_ERROR(msg) Logger::get().error(msg)
#define LOG_DEBUG(msg) Logger::get().debug(msg)
#define LOG_EVENT(lvl, name, ...) Logger::get().event(lvl, name, __VA_ARGS__)
