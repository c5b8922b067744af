// ============================================================
// tui.cpp
// ============================================================

#include "tui.hpp"
#include "../common/utils.hpp"
#include <iostream>
#include <iomanip>
#include <sstream>
#include <cstdio>
#include <unistd.h>

bool Tui::is_tty() {
    return isatty(fileno(stdout)) != 0;
}

Tui::Tui(TuiState& state)
    : state_(state)
    , started_(std::chrono::steady_clock::now())
{}

Tui::~Tui() {
    stop();
}

void Tui::start() {
    if (running_.exchange(true)) return;
    stopped_ = false;
    started_ = std::chrono::steady_clock::now();
    thread_ = std::thread([this] {
        while (running_.load()) {
            render();
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    });
}

void Tui::stop() {
    if (stopped_) return;
    stopped_ = true;
    running_.store(false);
    if (thread_.joinable()) {
        thread_.join();
    }
    render();
    std::cout.flush();
}

void Tui::clear_lines(int n) {
    for (int i = 0; i < n; ++i) {
        std::cout << "\x1b[A\x1b[2K";
    }
    if (n > 0) std::cout << "\r";
    lines_printed_ = 0;
}

std::string Tui::build_progress_bar(u32 pct, int width) const {
    int fill = utils::clamp((int)(pct * (u32)width / 100), 0, width);
    std::string bar = "[";
    bar.append((size_t)fill, '#');
    bar.append((size_t)(width - fill), '.');
    bar += "]";
    return bar;
}

void Tui::render() {
    u32 pct = state_.percent.load();
    std::string status = state_.current_status();
    if (status.size() > 70) {
        status = status.substr(0, 67) + "...";
    }

    if (!is_tty()) {
        std::string plain = status + " " + std::to_string(pct) + "%";
        if (!status.empty() && plain != last_plain_) {
            std::cout << plain << "\n";
            std::cout.flush();
            last_plain_ = plain;
        }
        return;
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now() - started_).count();

    std::ostringstream ss;
    ss << build_progress_bar(pct, 40) << " " << std::setw(3) << pct << "%  "
       << elapsed << "s\n"
       << "  " << state_.job_label << "\n"
       << "  > " << status << "\n";

    clear_lines(lines_printed_);
    std::cout << ss.str();
    std::cout.flush();
    lines_printed_ = 3;
}
