#pragma once

// ============================================================
// config.hpp -- Relay configuration shared by all contexts
// ============================================================

#include "platform.hpp"
#include "protocol.hpp"
#include <string>

struct RelayConfig {
    // Encoded text allowed in one message; upload and download thresholds
    // both read this value.
    u64 transport_ceiling        = DEFAULT_TRANSPORT_CEILING;

    u32 job_timeout_ms           = 5 * 60 * 1000;   // transcode, archive jobs
    u32 large_job_timeout_ms     = 10 * 60 * 1000;  // chunked upload "process"
    u32 ready_timeout_ms         = 5000;
    u32 connect_poll_interval_ms = 100;
    u32 connect_poll_attempts    = 50;

    u32 transfer_ttl_ms          = 10 * 60 * 1000;
    u32 max_staged_transfers     = 16;
    u32 result_ttl_ms            = 10 * 60 * 1000;

    bool compress_frames         = true;

    std::string log_file;
    std::string log_level        = "info";

    std::string ffmpeg_path      = "ffmpeg";
    std::string ffprobe_path     = "ffprobe";
    std::string unzip_path       = "unzip";
};

namespace config {

// Reads a flat YAML mapping ("transport_ceiling: 4194304") into cfg.
// Unknown keys are logged and skipped; malformed values throw
// std::runtime_error naming the line.
void load_file(const std::string& path, RelayConfig& cfg);

// Applies one key/value pair. Returns false for an unknown key and
// throws std::invalid_argument for a bad value.
bool apply(RelayConfig& cfg, const std::string& key, const std::string& value);

// Push log_level and log_file into the Logger singleton
void apply_logging(const RelayConfig& cfg);

} // namespace config
