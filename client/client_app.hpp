#pragma once

// ============================================================
// client_app.hpp -- vidbridge client: submits one job to the
//   dispatcher, shows progress and writes the playable result
// ============================================================

#include "../common/platform.hpp"
#include "../common/config.hpp"
#include "../common/media.hpp"
#include "../common/source_fetcher.hpp"
#include "../common/tui.hpp"
#include <string>
#include <vector>
#include <atomic>

enum class ClientMode {
    TRANSCODE,
    EXTRACT,          // fetch here, upload the archive
    EXTRACT_REMOTE,   // worker fetches the archive
};

struct ClientConfig {
    std::string socket_path;
    ClientMode  mode{ClientMode::TRANSCODE};
    std::string url;
    std::string out_dir;
    int         retry_secs{10};
    u32         tab_id{1};
    RelayConfig relay;
};

class ClientApp {
public:
    explicit ClientApp(ClientConfig cfg);

    // 0 when the result was written ("ready to play"), 1 otherwise
    // ("failed, offer raw download")
    int run();

    void stop();

    // Write a result under out_dir; returns the written paths
    static std::vector<std::string> write_result(const JobResult& result,
                                                 const std::string& out_dir,
                                                 const std::string& source_url);

    // "clip.avi" + "video/mp4" -> "clip.mp4"
    static std::string output_name(const std::string& name, const std::string& mime_type);

private:
    ClientConfig      cfg_;
    std::atomic<bool> stop_{false};
    UrlSourceFetcher  fetcher_;
    TuiState          tui_state_;
};
