#pragma once

// ============================================================
// serial_executor.hpp -- One background thread running tasks
//                        strictly in submission order
// ============================================================

#include "logger.hpp"
#include <thread>
#include <queue>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <stdexcept>
#include <string>

class SerialExecutor {
public:
    explicit SerialExecutor(std::string name) : name_(std::move(name)) {
        thread_ = std::thread([this] {
            for (;;) {
                std::function<void()> task;
                {
                    std::unique_lock<std::mutex> lock(mutex_);
                    cv_.wait(lock, [this] { return stop_ || !tasks_.empty(); });
                    if (stop_ && tasks_.empty()) return;
                    task = std::move(tasks_.front());
                    tasks_.pop();
                }
                task();
            }
        });
    }

    // Runs what is already queued, then joins
    ~SerialExecutor() {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            stop_ = true;
        }
        cv_.notify_all();
        if (thread_.joinable()) thread_.join();
    }

    // Fire-and-forget; an escaping exception is logged
    void post(std::function<void()> f) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            if (stop_) throw std::runtime_error(name_ + " executor is stopped");
            tasks_.emplace([f = std::move(f), this]() {
                try {
                    f();
                } catch (const std::exception& e) {
                    LOG_ERROR(name_ + " task failed: " + e.what());
                }
            });
        }
        cv_.notify_one();
    }

    // Drop tasks that have not started; returns how many were dropped
    size_t discard_pending() {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t n = tasks_.size();
        std::queue<std::function<void()>>().swap(tasks_);
        return n;
    }

    SerialExecutor(const SerialExecutor&) = delete;
    SerialExecutor& operator=(const SerialExecutor&) = delete;

private:
    std::string                       name_;
    std::thread                       thread_;
    std::queue<std::function<void()>> tasks_;
    std::mutex                        mutex_;
    std::condition_variable           cv_;
    bool                              stop_{false};
};
