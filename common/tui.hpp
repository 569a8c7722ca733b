#pragma once

// ============================================================
// tui.hpp -- ANSI progress display
// ============================================================

#include "platform.hpp"
#include <string>
#include <atomic>
#include <thread>
#include <mutex>
#include <vector>
#include <chrono>

// Counters shared between the transfer loop and the progress display
struct ProgressState {
    std::atomic<u64> bytes_done{0};
    std::atomic<u64> bytes_total{0};
    std::atomic<u32> chunks_done{0};
    std::atomic<u32> chunks_total{0};
    std::atomic<u32> files_done{0};
    std::atomic<u32> files_total{0};
    std::string current_file;
    std::string current_state;
    std::mutex current_file_mutex;
    std::string transfer_label{"Sent"};  // "Sent" for sender, "Recv" for receiver
};

class Tui {
public:
    explicit Tui(ProgressState& state);
    ~Tui();

    // Start background refresh thread (100ms interval)
    void start();

    // Stop and print final line
    void stop();

    // Render one frame to stdout
    void render();

    static bool is_tty();

private:
    ProgressState& state_;
    std::thread thread_;
    std::atomic<bool> running_{false};
    bool stopped_{true};

    // For speed calculation
    u64 last_bytes_{0};
    std::chrono::steady_clock::time_point last_time_;
    double smooth_speed_{0.0};

    // Track number of lines printed for cursor-up overwrite
    int lines_printed_{0};

    void clear_lines(int n);
    std::string build_progress_bar(double pct, int width) const;
};
