#pragma once

// ============================================================
// tui.hpp -- Job status line for the client
//   TTY: bar + job label + status, redrawn every 100ms
//   otherwise: one plain line per status change
// ============================================================

#include "../common/platform.hpp"
#include <string>
#include <atomic>
#include <thread>
#include <mutex>
#include <chrono>

struct TuiState {
    std::atomic<u32> percent{0};  // 0..100 of the current status
    std::string      status;
    std::mutex       status_mutex;
    std::string      job_label;   // e.g. "transcode http://host/clip.avi"

    void set(const std::string& text, u32 pct) {
        {
            std::lock_guard<std::mutex> lk(status_mutex);
            status = text;
        }
        percent.store(pct > 100 ? 100 : pct);
    }

    std::string current_status() {
        std::lock_guard<std::mutex> lk(status_mutex);
        return status;
    }
};

class Tui {
public:
    explicit Tui(TuiState& state);
    ~Tui();

    void start();

    // Stop refreshing and print the final frame
    void stop();

    void render();

    static bool is_tty();

private:
    void clear_lines(int n);
    std::string build_progress_bar(u32 pct, int width) const;

    TuiState&         state_;
    std::thread       thread_;
    std::atomic<bool> running_{false};
    bool              stopped_{false};

    std::chrono::steady_clock::time_point started_;
    std::string last_plain_;
    int         lines_printed_{0};
};
