#pragma once

// ============================================================
// utils.hpp -- Utility functions
// ============================================================

#include "platform.hpp"
#include <string>
#include <chrono>
#include <cstdint>
#include <sstream>
#include <iomanip>
#include <atomic>

namespace utils {

// Current time in milliseconds since epoch
inline u64 now_ms() {
    using namespace std::chrono;
    return (u64)duration_cast<milliseconds>(
        system_clock::now().time_since_epoch()
    ).count();
}

// Format bytes as human-readable (e.g., "1.23 MB")
inline std::string format_bytes(u64 bytes) {
    if (bytes < 1024ULL) {
        return std::to_string(bytes) + " B";
    } else if (bytes < 1024ULL * 1024) {
        std::ostringstream ss;
        ss << std::fixed << std::setprecision(2) << (double)bytes / 1024.0 << " KB";
        return ss.str();
    } else if (bytes < 1024ULL * 1024 * 1024) {
        std::ostringstream ss;
        ss << std::fixed << std::setprecision(2) << (double)bytes / (1024.0 * 1024) << " MB";
        return ss.str();
    } else {
        std::ostringstream ss;
        ss << std::fixed << std::setprecision(2) << (double)bytes / (1024.0 * 1024 * 1024) << " GB";
        return ss.str();
    }
}

// Validate that a path is non-empty and doesn't contain null bytes
inline bool validate_path(const std::string& path) {
    if (path.empty()) return false;
    for (char c : path) {
        if (c == '\0') return false;
    }
    return true;
}

// 64-bit mixed value, never 0
inline u64 random_u64() {
    using namespace std::chrono;
    u64 t = (u64)high_resolution_clock::now().time_since_epoch().count();
    static std::atomic<u64> counter{0};
    u64 c = counter.fetch_add(1) + 1;
    t ^= c * 0x9e3779b97f4a7c15ULL;
    t ^= (t >> 30) * 0xbf58476d1ce4e5b9ULL;
    t ^= (t >> 27) * 0x94d049bb133111ebULL;
    t ^= (t >> 31);
    return t == 0 ? 1 : t;
}

// Caller-generated transfer token: "<ms since epoch>-<16 hex digits>"
inline std::string generate_transfer_id() {
    std::ostringstream ss;
    ss << now_ms() << '-' << std::hex << std::setw(16) << std::setfill('0') << random_u64();
    return ss.str();
}

// Integer percentage in 0..100
inline int percent(u64 done, u64 total) {
    if (total == 0) return 100;
    u64 p = (done * 100 + total / 2) / total;
    return p > 100 ? 100 : (int)p;
}

// Clamp value
template<typename T>
inline T clamp(T val, T lo, T hi) {
    return val < lo ? lo : (val > hi ? hi : val);
}

inline std::string to_lower(std::string s) {
    for (auto& c : s) {
        if (c >= 'A' && c <= 'Z') c = (char)(c + 32);
    }
    return s;
}

inline bool starts_with(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

inline bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace utils
