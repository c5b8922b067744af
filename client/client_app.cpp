// ============================================================
// client_app.cpp
// ============================================================

#include "client_app.hpp"
#include "dispatcher_link.hpp"
#include "transfer_orchestrator.hpp"
#include "../common/errors.hpp"
#include "../common/file_io.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include <iostream>

namespace {

const char* mode_label(ClientMode m) {
    switch (m) {
        case ClientMode::TRANSCODE:      return "transcode";
        case ClientMode::EXTRACT:        return "extract";
        case ClientMode::EXTRACT_REMOTE: return "extract-remote";
    }
    return "?";
}

std::string extension_for_mime(const std::string& mime) {
    if (mime == "video/webm") return "webm";
    if (mime == "video/ogg")  return "ogg";
    return "mp4";
}

} // namespace

ClientApp::ClientApp(ClientConfig cfg)
    : cfg_(std::move(cfg))
{}

void ClientApp::stop() {
    stop_.store(true);
}

std::string ClientApp::output_name(const std::string& name, const std::string& mime_type) {
    std::string want = extension_for_mime(mime_type);
    size_t slash = name.find_last_of('/');
    size_t dot = name.find_last_of('.');
    std::string stem = name;
    std::string ext;
    if (dot != std::string::npos && (slash == std::string::npos || dot > slash)) {
        stem = name.substr(0, dot);
        ext  = utils::to_lower(name.substr(dot + 1));
    }
    if (stem.empty() || stem.back() == '/') stem += "video";
    // m4v is already MP4
    if (ext == want || (want == "mp4" && ext == "m4v")) return name;
    return stem + "." + want;
}

std::vector<std::string> ClientApp::write_result(const JobResult& result,
                                                 const std::string& out_dir,
                                                 const std::string& source_url) {
    std::vector<std::string> written;
    auto write_one = [&](const std::string& rel, const std::vector<u8>& data) {
        fs::path p = file_io::safe_join(out_dir, rel);
        file_io::ensure_parent_dirs(p.string());
        file_io::write_file(p.string(), data);
        written.push_back(p.string());
    };

    std::visit(overloaded{
        [&](const SingleMedia& m) {
            std::string path = url::file_path_of(source_url);
            path = path.substr(0, path.find_first_of("?#"));
            std::string base = fs::path(path).filename().string();
            if (base.empty()) base = "video";
            write_one(output_name(base, m.mime_type), m.data);
        },
        [&](const MultiMedia& mm) {
            for (const auto& item : mm.items) {
                write_one(output_name(item.name, item.mime_type), item.data);
            }
        },
    }, result);
    return written;
}

int ClientApp::run() {
    tui_state_.job_label = std::string(mode_label(cfg_.mode)) + " " + cfg_.url;
    Tui tui(tui_state_);

    try {
        LOG_INFO("Connecting to dispatcher at " + cfg_.socket_path + " ...");
        auto link = DispatcherLink::connect(cfg_.socket_path, cfg_.retry_secs,
                                            cfg_.relay.compress_frames, &stop_);

        TransferOrchestrator orch(*link, fetcher_, cfg_.relay, cfg_.tab_id);
        orch.set_status_handler([this](const std::string& text, u32 pct) {
            tui_state_.set(text, pct);
        });

        tui.start();
        JobResult result;
        switch (cfg_.mode) {
            case ClientMode::TRANSCODE:
                result = orch.transcode(cfg_.url);
                break;
            case ClientMode::EXTRACT:
                result = orch.extract_archive(cfg_.url);
                break;
            case ClientMode::EXTRACT_REMOTE:
                result = orch.extract_archive_remote(cfg_.url);
                break;
        }
        tui_state_.set("Done!", 100);
        tui.stop();

        std::vector<std::string> files = write_result(result, cfg_.out_dir, cfg_.url);
        std::cout << "ready to play:";
        for (const auto& f : files) std::cout << " " << f;
        std::cout << "\n";
        return 0;
    } catch (const RelayError& e) {
        tui.stop();
        Logger::get().job_error(std::string(mode_label(cfg_.mode)) + " " + cfg_.url + " " +
                                error_kind_name(e.kind()) + ": " + e.what());
        std::cerr << "ERROR: " << error_kind_name(e.kind()) << ": " << e.what() << "\n";
    } catch (const std::exception& e) {
        tui.stop();
        Logger::get().job_error(std::string(mode_label(cfg_.mode)) + " " + cfg_.url + ": " + e.what());
        std::cerr << "ERROR: " << e.what() << "\n";
    }
    std::cout << "failed, offer raw download: " << cfg_.url << "\n";
    return 1;
}
