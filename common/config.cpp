// ============================================================
// config.cpp -- YAML configuration loader
// ============================================================

#include "config.hpp"
#include "logger.hpp"
#include <yaml-cpp/yaml.h>
#include <stdexcept>

namespace {

// Typed assignment of one key. Returns false for an unknown key;
// conversion failures throw YAML::Exception, range failures
// std::invalid_argument.
bool set(RelayConfig& cfg, const std::string& key, const YAML::Node& v) {
    if (key == "transport_ceiling") {
        u64 ceiling = v.as<u64>();
        if (ceiling == 0) {
            throw std::invalid_argument(key + ": must be at least 1");
        }
        cfg.transport_ceiling = ceiling;
    } else if (key == "job_timeout_ms") {
        cfg.job_timeout_ms = v.as<u32>();
    } else if (key == "large_job_timeout_ms") {
        cfg.large_job_timeout_ms = v.as<u32>();
    } else if (key == "ready_timeout_ms") {
        cfg.ready_timeout_ms = v.as<u32>();
    } else if (key == "connect_poll_interval_ms") {
        cfg.connect_poll_interval_ms = v.as<u32>();
    } else if (key == "connect_poll_attempts") {
        cfg.connect_poll_attempts = v.as<u32>();
    } else if (key == "transfer_ttl_ms") {
        cfg.transfer_ttl_ms = v.as<u32>();
    } else if (key == "max_staged_transfers") {
        cfg.max_staged_transfers = v.as<u32>();
    } else if (key == "result_ttl_ms") {
        cfg.result_ttl_ms = v.as<u32>();
    } else if (key == "compress_frames") {
        cfg.compress_frames = v.as<bool>();
    } else if (key == "log_file") {
        cfg.log_file = v.as<std::string>();
    } else if (key == "log_level") {
        std::string level = v.as<std::string>();
        LogLevel lvl;
        if (!Logger::parse_level(level, lvl)) {
            throw std::invalid_argument(key + ": unknown level: " + level);
        }
        cfg.log_level = level;
    } else if (key == "ffmpeg_path") {
        cfg.ffmpeg_path = v.as<std::string>();
    } else if (key == "ffprobe_path") {
        cfg.ffprobe_path = v.as<std::string>();
    } else if (key == "unzip_path") {
        cfg.unzip_path = v.as<std::string>();
    } else {
        return false;
    }
    return true;
}

} // namespace

namespace config {

bool apply(RelayConfig& cfg, const std::string& key, const std::string& value) {
    try {
        return set(cfg, key, YAML::Node(value));
    } catch (const YAML::Exception&) {
        throw std::invalid_argument(key + ": bad value: " + value);
    }
}

void load_file(const std::string& path, RelayConfig& cfg) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::BadFile&) {
        throw std::runtime_error("Cannot open config file: " + path);
    } catch (const YAML::ParserException& e) {
        throw std::runtime_error(path + ": " + e.what());
    }
    if (root.IsNull()) return;
    if (!root.IsMap()) {
        throw std::runtime_error(path + ": expected a mapping of key: value");
    }

    for (const auto& kv : root) {
        std::string key = kv.first.as<std::string>();
        std::string where = path + ":" + std::to_string(kv.first.Mark().line + 1);
        try {
            if (!set(cfg, key, kv.second)) {
                LOG_WARN(where + ": unknown key '" + key + "'");
            }
        } catch (const YAML::Exception&) {
            throw std::runtime_error(where + ": " + key + ": bad value");
        } catch (const std::invalid_argument& e) {
            throw std::runtime_error(where + ": " + e.what());
        }
    }
}

void apply_logging(const RelayConfig& cfg) {
    LogLevel lvl = LogLevel::INFO;
    if (Logger::parse_level(cfg.log_level, lvl)) {
        Logger::get().set_level(lvl);
    }
    if (!cfg.log_file.empty()) {
        Logger::get().set_log_file(cfg.log_file);
    }
}

} // namespace config
