// ============================================================
// ffmpeg_engine.cpp
// ============================================================

#include "ffmpeg_engine.hpp"
#include "subprocess.hpp"
#include "../common/errors.hpp"
#include "../common/file_io.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include <cstdlib>

FfmpegEngine::FfmpegEngine(std::string ffmpeg_path, std::string ffprobe_path)
    : ffmpeg_path_(std::move(ffmpeg_path))
    , ffprobe_path_(std::move(ffprobe_path))
{}

void FfmpegEngine::load() {
    std::lock_guard<std::mutex> lk(load_mutex_);
    if (loaded_) return;
    try {
        std::vector<u8> out = subprocess::capture({ffmpeg_path_, "-hide_banner", "-version"});
        std::string first(out.begin(), out.end());
        first = first.substr(0, first.find('\n'));
        LOG_INFO("Engine: " + first);
    } catch (const std::runtime_error& e) {
        throw RelayError(ErrorKind::ENGINE_FAILURE,
                         "Engine failed to load: " + std::string(e.what()));
    }
    loaded_ = true;
}

bool FfmpegEngine::parse_progress_line(const std::string& line, u64& out_time_us, bool& finished) {
    size_t eq = line.find('=');
    if (eq == std::string::npos) return false;
    std::string key = line.substr(0, eq);
    std::string val = line.substr(eq + 1);
    if (key == "out_time_us" || key == "out_time_ms") {
        // ffmpeg reports microseconds under both names
        char* end = nullptr;
        long long v = std::strtoll(val.c_str(), &end, 10);
        if (end == val.c_str() || v < 0) return false;
        out_time_us = (u64)v;
        return true;
    }
    if (key == "progress") {
        finished = (val == "end");
        return true;
    }
    return false;
}

u64 FfmpegEngine::probe_duration_us(const std::string& path) const {
    try {
        std::vector<u8> out = subprocess::capture({
            ffprobe_path_, "-v", "error",
            "-show_entries", "format=duration",
            "-of", "default=nw=1:nk=1",
            path
        });
        std::string s(out.begin(), out.end());
        double secs = std::strtod(s.c_str(), nullptr);
        return secs > 0 ? (u64)(secs * 1e6) : 0;
    } catch (const std::runtime_error& e) {
        LOG_DEBUG(std::string("ffprobe failed: ") + e.what());
        return 0;
    }
}

std::vector<u8> FfmpegEngine::run(const EngineJob& job, const ProgressFn& progress) {
    if (!loaded_) load();

    file_io::TempDir scratch("vidbridge-ff-");
    fs::path in_path  = file_io::safe_join(scratch.path(), job.input_name);
    fs::path out_path = file_io::safe_join(scratch.path(), job.output_name);
    file_io::write_file(in_path.string(), job.input);

    u64 duration_us = probe_duration_us(in_path.string());

    std::vector<std::string> argv = {ffmpeg_path_, "-hide_banner", "-nostdin", "-y",
                                     "-progress", "pipe:1", "-nostats"};
    argv.insert(argv.end(), job.args.begin(), job.args.end());

    if (progress) progress(0.0);
    subprocess::Result res;
    try {
        res = subprocess::run(argv, scratch.path().string(), [&](const std::string& line) {
            u64 t = 0;
            bool finished = false;
            if (!parse_progress_line(line, t, finished) || !progress) return;
            if (finished) {
                progress(1.0);
            } else if (t > 0 && duration_us > 0) {
                progress(utils::clamp((double)t / (double)duration_us, 0.0, 1.0));
            }
        });
    } catch (const std::runtime_error& e) {
        throw RelayError(ErrorKind::ENGINE_FAILURE, e.what());
    }

    if (res.exit_code != 0) {
        std::string tail = res.err_tail;
        while (!tail.empty() && (tail.back() == '\n' || tail.back() == '\r')) tail.pop_back();
        size_t nl = tail.find_last_of('\n');
        if (nl != std::string::npos) tail = tail.substr(nl + 1);
        throw RelayError(ErrorKind::ENGINE_FAILURE,
                         "ffmpeg exited with code " + std::to_string(res.exit_code) +
                         (tail.empty() ? "" : ": " + tail));
    }

    try {
        return file_io::read_file(out_path.string());
    } catch (const std::runtime_error& e) {
        throw RelayError(ErrorKind::ENGINE_FAILURE, std::string("No engine output: ") + e.what());
    }
}
