// ============================================================
// client/main.cpp -- vidbridge client entry point
// ============================================================

#include "../common/platform.hpp"
#include "../common/logger.hpp"
#include "../common/config.hpp"
#include "client_app.hpp"
#include <iostream>
#include <string>
#include <cstdlib>
#include <cstring>
#include <csignal>

static ClientApp* g_app = nullptr;

static void sig_handler(int /*sig*/) {
    if (g_app) g_app->stop();
}

static void print_usage(const char* prog) {
    std::cerr
        << "Usage: " << prog << " <socket> <mode> <url> <out_dir> [options]\n"
        << "\n"
        << "  socket          dispatcher Unix socket path\n"
        << "  mode            transcode | extract | extract-remote\n"
        << "  url             http://..., file://... or a local path\n"
        << "  out_dir         directory for the playable result\n"
        << "\nOptions:\n"
        << "  --config FILE   read YAML settings\n"
        << "  --retry N       seconds to retry connecting (default: 10)\n"
        << "  --tab N         tab id progress is reported for (default: 1)\n"
        << "  --ceiling N     transport ceiling in bytes of encoded text\n"
        << "  --no-compress   disable frame compression\n"
        << "  --verbose       enable debug logging\n"
        << "\nExamples:\n"
        << "  " << prog << " /tmp/vidbridge.sock transcode http://host/clip.avi ./out\n"
        << "  " << prog << " /tmp/vidbridge.sock extract /data/videos.zip ./out\n";
}

int main(int argc, char* argv[]) {
    platform::ignore_sigpipe();
    Logger::get().set_context("client");

    if (argc < 5) {
        print_usage(argv[0]);
        return 1;
    }

    ClientConfig cfg;
    cfg.socket_path = argv[1];
    std::string mode = argv[2];
    cfg.url     = argv[3];
    cfg.out_dir = argv[4];

    if (mode == "transcode") {
        cfg.mode = ClientMode::TRANSCODE;
    } else if (mode == "extract") {
        cfg.mode = ClientMode::EXTRACT;
    } else if (mode == "extract-remote") {
        cfg.mode = ClientMode::EXTRACT_REMOTE;
    } else {
        std::cerr << "Unknown mode: " << mode << "\n";
        print_usage(argv[0]);
        return 1;
    }

    bool verbose = false;
    try {
        for (int i = 5; i < argc; ++i) {
            if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
                config::load_file(argv[++i], cfg.relay);
            } else if (std::strcmp(argv[i], "--retry") == 0 && i + 1 < argc) {
                cfg.retry_secs = std::atoi(argv[++i]);
            } else if (std::strcmp(argv[i], "--tab") == 0 && i + 1 < argc) {
                cfg.tab_id = (u32)std::strtoul(argv[++i], nullptr, 10);
            } else if (std::strcmp(argv[i], "--ceiling") == 0 && i + 1 < argc) {
                config::apply(cfg.relay, "transport_ceiling", argv[++i]);
            } else if (std::strcmp(argv[i], "--no-compress") == 0) {
                cfg.relay.compress_frames = false;
            } else if (std::strcmp(argv[i], "--verbose") == 0) {
                verbose = true;
            } else {
                std::cerr << "Unknown option: " << argv[i] << "\n";
                print_usage(argv[0]);
                return 1;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        return 1;
    }

    if (cfg.retry_secs < 0 || cfg.retry_secs > 3600) {
        std::cerr << "ERROR: --retry must be 0-3600\n";
        return 1;
    }
    if (verbose) cfg.relay.log_level = "debug";
    config::apply_logging(cfg.relay);

    try {
        ClientApp app(std::move(cfg));
        g_app = &app;

        std::signal(SIGINT,  sig_handler);
        std::signal(SIGTERM, sig_handler);

        int rc = app.run();
        g_app = nullptr;
        return rc;
    } catch (const std::exception& e) {
        std::cerr << "FATAL: " << e.what() << "\n";
        return 2;
    }
}
