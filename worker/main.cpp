// ============================================================
// worker/main.cpp -- vidbridge worker entry point
//   Normally started by the dispatcher with an inherited
//   socketpair descriptor (--fd N).
// ============================================================

#include "../common/platform.hpp"
#include "../common/logger.hpp"
#include "../common/config.hpp"
#include "../common/socket.hpp"
#include "../common/message_port.hpp"
#include "../common/source_fetcher.hpp"
#include "ffmpeg_engine.hpp"
#include "unzip_archive.hpp"
#include "worker_runtime.hpp"
#include <iostream>
#include <string>
#include <cstring>
#include <cstdlib>

static void print_usage(const char* prog) {
    std::cerr
        << "Usage: " << prog << " (--fd N | --connect SOCKET) [options]\n"
        << "\n"
        << "  --fd N           use inherited connected socket descriptor N\n"
        << "  --connect PATH   connect to a dispatcher's worker socket\n"
        << "\nOptions:\n"
        << "  --config FILE    read YAML settings\n"
        << "  --ffmpeg PATH    ffmpeg binary (default: ffmpeg)\n"
        << "  --ffprobe PATH   ffprobe binary (default: ffprobe)\n"
        << "  --unzip PATH     unzip binary (default: unzip)\n"
        << "  --ceiling N      transport ceiling in bytes of encoded text\n"
        << "  --no-compress    disable frame compression\n"
        << "  --verbose        enable debug logging\n";
}

int main(int argc, char* argv[]) {
    platform::ignore_sigpipe();
    Logger::get().set_context("worker");

    RelayConfig cfg;
    int fd = -1;
    std::string connect_path;
    bool verbose = false;

    try {
        for (int i = 1; i < argc; ++i) {
            if (std::strcmp(argv[i], "--fd") == 0 && i + 1 < argc) {
                fd = std::atoi(argv[++i]);
            } else if (std::strcmp(argv[i], "--connect") == 0 && i + 1 < argc) {
                connect_path = argv[++i];
            } else if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
                config::load_file(argv[++i], cfg);
            } else if (std::strcmp(argv[i], "--ffmpeg") == 0 && i + 1 < argc) {
                cfg.ffmpeg_path = argv[++i];
            } else if (std::strcmp(argv[i], "--ffprobe") == 0 && i + 1 < argc) {
                cfg.ffprobe_path = argv[++i];
            } else if (std::strcmp(argv[i], "--unzip") == 0 && i + 1 < argc) {
                cfg.unzip_path = argv[++i];
            } else if (std::strcmp(argv[i], "--ceiling") == 0 && i + 1 < argc) {
                config::apply(cfg, "transport_ceiling", argv[++i]);
            } else if (std::strcmp(argv[i], "--no-compress") == 0) {
                cfg.compress_frames = false;
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

    if (fd < 0 && connect_path.empty()) {
        print_usage(argv[0]);
        return 1;
    }
    if (verbose) cfg.log_level = "debug";
    config::apply_logging(cfg);

    try {
        StreamSocket sock = fd >= 0 ? StreamSocket(fd) : StreamSocket::connect_unix(connect_path);
        ::fcntl(sock.native(), F_SETFD, FD_CLOEXEC);

        auto port = std::make_shared<SocketPort>(std::move(sock), cfg.compress_frames);
        FfmpegEngine       engine(cfg.ffmpeg_path, cfg.ffprobe_path);
        UnzipArchiveReader archives(cfg.unzip_path);
        UrlSourceFetcher   fetcher;

        WorkerRuntime runtime(port, engine, archives, fetcher, cfg);
        runtime.start();
        runtime.wait_closed();
        LOG_INFO("Worker exiting");
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "FATAL: " << e.what() << "\n";
        return 2;
    }
}
