// ============================================================
// source_fetcher.cpp -- File and HTTP(S) fetching
// ============================================================

#include "source_fetcher.hpp"
#include "file_io.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "utils.hpp"
#include <curl/curl.h>
#include <exception>
#include <memory>
#include <mutex>
#include <stdexcept>

static constexpr long MAX_REDIRECTS       = 5;
static constexpr long CONNECT_TIMEOUT_S   = 15;
static constexpr long LOW_SPEED_LIMIT_BPS = 1000;
static constexpr long LOW_SPEED_TIME_S    = 30;

namespace {

[[noreturn]] void fetch_failed(const std::string& why) {
    throw RelayError(ErrorKind::NETWORK_FAILURE, "Fetch failed: " + why);
}

struct CurlDeleter {
    void operator()(CURL* curl) const {
        if (curl) curl_easy_cleanup(curl);
    }
};

std::once_flag curl_init_once;

void init_curl() {
    std::call_once(curl_init_once, [] {
        CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
        if (rc != CURLE_OK) {
            fetch_failed(std::string("curl_global_init: ") + curl_easy_strerror(rc));
        }
    });
}

// Shared by the write and progress callbacks of one transfer
struct Transfer {
    std::vector<u8>                   body;
    const SourceFetcher::ProgressFn*  progress{nullptr};
    u64                               last_reported{0};
    // An exception thrown by the progress callback, rethrown after
    // curl_easy_perform returns
    std::exception_ptr                callback_error;
};

size_t write_body(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* t = static_cast<Transfer*>(userdata);
    size_t n = size * nmemb;
    t->body.insert(t->body.end(), reinterpret_cast<u8*>(ptr), reinterpret_cast<u8*>(ptr) + n);
    return n;
}

int report_progress(void* userdata, curl_off_t dl_total, curl_off_t dl_now,
                    curl_off_t /*ul_total*/, curl_off_t /*ul_now*/) {
    auto* t = static_cast<Transfer*>(userdata);
    if (!t->progress || !*t->progress || dl_now <= 0) return 0;
    if ((u64)dl_now == t->last_reported) return 0;
    t->last_reported = (u64)dl_now;
    try {
        (*t->progress)((u64)dl_now, dl_total > 0 ? (u64)dl_total : 0);
    } catch (const std::exception&) {
        t->callback_error = std::current_exception();
        return 1;  // aborts the transfer
    }
    return 0;
}

} // namespace

// ---------------------------------------------------------------
// url helpers
// ---------------------------------------------------------------

namespace url {

std::string file_path_of(const std::string& u) {
    const std::string scheme = "file://";
    if (utils::starts_with(u, scheme)) return u.substr(scheme.size());
    return u;
}

} // namespace url

// ---------------------------------------------------------------
// UrlSourceFetcher
// ---------------------------------------------------------------

std::vector<u8> UrlSourceFetcher::fetch(const std::string& u, const ProgressFn& progress) {
    std::string lower = utils::to_lower(u.substr(0, 8));
    if (utils::starts_with(lower, "http://") || utils::starts_with(lower, "https://")) {
        return fetch_http(u, progress);
    }
    return fetch_file(url::file_path_of(u), progress);
}

std::vector<u8> UrlSourceFetcher::fetch_file(const std::string& path, const ProgressFn& progress) {
    if (!utils::validate_path(path)) fetch_failed("invalid path");
    try {
        return file_io::read_file(path, progress);
    } catch (const std::runtime_error& e) {
        fetch_failed(e.what());
    }
}

std::vector<u8> UrlSourceFetcher::fetch_http(const std::string& u, const ProgressFn& progress) {
    init_curl();

    std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
    if (!curl) fetch_failed("curl_easy_init failed");
    CURL* h = curl.get();

    Transfer transfer;
    transfer.progress = &progress;
    char errbuf[CURL_ERROR_SIZE] = {0};

    curl_easy_setopt(h, CURLOPT_URL, u.c_str());
    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, +write_body);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &transfer);
    curl_easy_setopt(h, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(h, CURLOPT_MAXREDIRS, MAX_REDIRECTS);
    curl_easy_setopt(h, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(h, CURLOPT_XFERINFOFUNCTION, +report_progress);
    curl_easy_setopt(h, CURLOPT_XFERINFODATA, &transfer);
    curl_easy_setopt(h, CURLOPT_USERAGENT, "vidbridge/1");
    curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT, CONNECT_TIMEOUT_S);
    curl_easy_setopt(h, CURLOPT_LOW_SPEED_LIMIT, LOW_SPEED_LIMIT_BPS);
    curl_easy_setopt(h, CURLOPT_LOW_SPEED_TIME, LOW_SPEED_TIME_S);
    curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(h, CURLOPT_ERRORBUFFER, errbuf);

    LOG_DEBUG("GET " + u);
    CURLcode rc = curl_easy_perform(h);

    if (transfer.callback_error) std::rethrow_exception(transfer.callback_error);
    if (rc != CURLE_OK) {
        fetch_failed(errbuf[0] ? std::string(errbuf) : std::string(curl_easy_strerror(rc)));
    }

    long status = 0;
    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &status);
    if (status < 200 || status >= 300) {
        fetch_failed(std::to_string(status));
    }
    LOG_DEBUG("GET " + u + " -> " + std::to_string(status) + ", " +
              utils::format_bytes(transfer.body.size()));
    return std::move(transfer.body);
}
