#pragma once

// ============================================================
// ffmpeg_engine.hpp -- ConversionEngine backed by the ffmpeg CLI
// ============================================================

#include "engine.hpp"
#include <mutex>
#include <atomic>

class FfmpegEngine : public ConversionEngine {
public:
    FfmpegEngine(std::string ffmpeg_path, std::string ffprobe_path);

    void load() override;
    bool loaded() const override { return loaded_.load(); }
    std::vector<u8> run(const EngineJob& job, const ProgressFn& progress) override;

    // Media duration in microseconds from ffprobe; 0 when unknown
    u64 probe_duration_us(const std::string& path) const;

    // "out_time_us=12345" style line from -progress output; returns
    // false for other keys
    static bool parse_progress_line(const std::string& line, u64& out_time_us, bool& finished);

private:
    std::string       ffmpeg_path_;
    std::string       ffprobe_path_;
    std::atomic<bool> loaded_{false};
    std::mutex        load_mutex_;
};
