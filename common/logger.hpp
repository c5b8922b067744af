#pragma once

// ============================================================
// logger.hpp -- Thread-safe logger shared by all three contexts
// ============================================================

#include "platform.hpp"
#include <string>
#include <mutex>
#include <fstream>
#include <iostream>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <ctime>

enum class LogLevel {
    DEBUG = 0,
    INFO  = 1,
    WARN  = 2,
    ERR   = 3,
};

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

    // Tag printed on every line: "client", "dispatcher" or "worker"
    void set_context(const std::string& name) {
        std::lock_guard<std::mutex> lk(mutex_);
        context_ = name;
    }

    void set_log_file(const std::string& path) {
        std::lock_guard<std::mutex> lk(mutex_);
        if (file_.is_open()) file_.close();
        file_.open(path, std::ios::app);
    }

    void log(LogLevel lvl, const std::string& msg) {
        std::lock_guard<std::mutex> lk(mutex_);
        if (lvl < level_) return;
        std::string line = format_line(lvl, msg);
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

    // Failed jobs also go to a dedicated log so they survive a noisy console
    void job_error(const std::string& msg) {
        std::lock_guard<std::mutex> lk(mutex_);
        std::string line = format_line(LogLevel::ERR, "[JOB] " + msg);
        std::cerr << line << "\n";
        if (!job_err_file_.is_open()) {
            job_err_file_.open("job_errors.log", std::ios::app);
        }
        if (job_err_file_.is_open()) {
            job_err_file_ << line << "\n";
            job_err_file_.flush();
        }
    }

    static bool parse_level(const std::string& s, LogLevel& out) {
        if (s == "debug") { out = LogLevel::DEBUG; return true; }
        if (s == "info")  { out = LogLevel::INFO;  return true; }
        if (s == "warn")  { out = LogLevel::WARN;  return true; }
        if (s == "error") { out = LogLevel::ERR;   return true; }
        return false;
    }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

private:
    Logger() : level_(LogLevel::INFO) {}

    // Caller holds mutex_
    std::string format_line(LogLevel lvl, const std::string& msg) const {
        auto now = std::chrono::system_clock::now();
        auto t   = std::chrono::system_clock::to_time_t(now);
        auto ms  = std::chrono::duration_cast<std::chrono::milliseconds>(
                       now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
        localtime_r(&t, &tm_buf);

        std::ostringstream ss;
        ss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
        ss << '.' << std::setfill('0') << std::setw(3) << ms.count();
        ss << " [" << level_str(lvl) << "]";
        if (!context_.empty()) ss << " [" << context_ << "]";
        ss << " " << msg;
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

    mutable std::mutex mutex_;
    LogLevel      level_;
    std::string   context_;
    std::ofstream file_;
    std::ofstream job_err_file_;
};

// Convenience macros
#define LOG_INFO(msg)  Logger::get().info(msg)
#define LOG_WARN(msg)  Logger::get().warn(msg)
#define LOG_ERROR(msg) Logger::get().error(msg)
#define LOG_DEBUG(msg) Logger::get().debug(msg)
