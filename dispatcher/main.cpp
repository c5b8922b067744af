// ============================================================
// dispatcher/main.cpp -- vidbridge dispatcher entry point
// ============================================================

#include "../common/platform.hpp"
#include "../common/logger.hpp"
#include "../common/config.hpp"
#include "../common/source_fetcher.hpp"
#include "../worker/ffmpeg_engine.hpp"
#include "../worker/unzip_archive.hpp"
#include "../worker/worker_runtime.hpp"
#include "worker_host.hpp"
#include "worker_manager.hpp"
#include "transfer_store.hpp"
#include "result_store.hpp"
#include "dispatcher.hpp"
#include "dispatcher_server.hpp"
#include <iostream>
#include <string>
#include <vector>
#include <memory>
#include <cstring>
#include <csignal>

static DispatcherServer* g_server = nullptr;

static void sig_handler(int /*sig*/) {
    if (g_server) g_server->stop();
}

static void print_usage(const char* prog) {
    std::cerr
        << "Usage: " << prog << " <socket> [options]\n"
        << "\n"
        << "  socket           Unix socket path to serve clients on\n"
        << "\nOptions:\n"
        << "  --worker PATH    worker executable (default: vidbridge_worker next to this one)\n"
        << "  --in-process     run the worker on a thread of this process\n"
        << "  --config FILE    read YAML settings\n"
        << "  --ffmpeg PATH    ffmpeg binary (default: ffmpeg)\n"
        << "  --ffprobe PATH   ffprobe binary (default: ffprobe)\n"
        << "  --unzip PATH     unzip binary (default: unzip)\n"
        << "  --ceiling N      transport ceiling in bytes of encoded text\n"
        << "  --no-compress    disable frame compression\n"
        << "  --verbose        enable debug logging\n"
        << "\nExample:\n"
        << "  " << prog << " /tmp/vidbridge.sock --in-process\n";
}

static std::string sibling_worker(const char* argv0) {
    std::string self = argv0;
    size_t slash = self.rfind('/');
    if (slash == std::string::npos) return "vidbridge_worker";
    return self.substr(0, slash + 1) + "vidbridge_worker";
}

namespace {

// Everything the in-process worker needs, kept alive together
struct InProcessWorker {
    FfmpegEngine       engine;
    UnzipArchiveReader archives;
    UrlSourceFetcher   fetcher;
    WorkerRuntime      runtime;

    InProcessWorker(std::shared_ptr<MessagePort> port, const RelayConfig& cfg)
        : engine(cfg.ffmpeg_path, cfg.ffprobe_path)
        , archives(cfg.unzip_path)
        , runtime(std::move(port), engine, archives, fetcher, cfg)
    {
        runtime.start();
    }
};

} // namespace

int main(int argc, char* argv[]) {
    platform::ignore_sigpipe();
    Logger::get().set_context("dispatcher");

    if (argc < 2 || argv[1][0] == '-') {
        print_usage(argv[0]);
        return 1;
    }

    RelayConfig cfg;
    std::string socket_path = argv[1];
    std::string worker_path = sibling_worker(argv[0]);
    std::vector<std::string> worker_args;
    bool in_process = false;
    bool verbose = false;

    try {
        for (int i = 2; i < argc; ++i) {
            if (std::strcmp(argv[i], "--worker") == 0 && i + 1 < argc) {
                worker_path = argv[++i];
            } else if (std::strcmp(argv[i], "--in-process") == 0) {
                in_process = true;
            } else if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
                config::load_file(argv[i + 1], cfg);
                worker_args.push_back("--config");
                worker_args.push_back(argv[++i]);
            } else if (std::strcmp(argv[i], "--ffmpeg") == 0 && i + 1 < argc) {
                cfg.ffmpeg_path = argv[++i];
                worker_args.push_back("--ffmpeg");
                worker_args.push_back(cfg.ffmpeg_path);
            } else if (std::strcmp(argv[i], "--ffprobe") == 0 && i + 1 < argc) {
                cfg.ffprobe_path = argv[++i];
                worker_args.push_back("--ffprobe");
                worker_args.push_back(cfg.ffprobe_path);
            } else if (std::strcmp(argv[i], "--unzip") == 0 && i + 1 < argc) {
                cfg.unzip_path = argv[++i];
                worker_args.push_back("--unzip");
                worker_args.push_back(cfg.unzip_path);
            } else if (std::strcmp(argv[i], "--ceiling") == 0 && i + 1 < argc) {
                config::apply(cfg, "transport_ceiling", argv[++i]);
                worker_args.push_back("--ceiling");
                worker_args.push_back(argv[i]);
            } else if (std::strcmp(argv[i], "--no-compress") == 0) {
                cfg.compress_frames = false;
            } else if (std::strcmp(argv[i], "--verbose") == 0) {
                verbose = true;
                worker_args.push_back("--verbose");
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

    if (verbose) cfg.log_level = "debug";
    config::apply_logging(cfg);

    try {
        std::unique_ptr<WorkerHost> host;
        if (in_process) {
            host = std::make_unique<ThreadWorkerHost>([cfg](std::shared_ptr<MessagePort> port) {
                return std::static_pointer_cast<void>(
                    std::make_shared<InProcessWorker>(std::move(port), cfg));
            });
        } else {
            host = std::make_unique<ProcessWorkerHost>(worker_path, worker_args, cfg.compress_frames);
        }

        WorkerManager  workers(*host, cfg);
        TransferStore  transfers(cfg);
        ResultStore    results(cfg);
        ProgressRouter router;
        Dispatcher     dispatcher(workers, transfers, results, router, cfg);

        DispatcherServer server(socket_path, dispatcher, router, cfg);
        server.listen();
        g_server = &server;

        std::signal(SIGINT,  sig_handler);
        std::signal(SIGTERM, sig_handler);

        int rc = server.run();
        g_server = nullptr;
        host->destroy_context();
        return rc;
    } catch (const std::exception& e) {
        std::cerr << "FATAL: " << e.what() << "\n";
        return 2;
    }
}
