#pragma once

// ============================================================
// source_fetcher.hpp -- Fetch source bytes by URL
//   file:///abs/path and plain paths from disk,
//   http:// and https:// through libcurl
// ============================================================

#include "platform.hpp"
#include <string>
#include <vector>
#include <functional>

class SourceFetcher {
public:
    // total == 0 when the length is not known in advance
    using ProgressFn = std::function<void(u64 done, u64 total)>;

    virtual ~SourceFetcher() = default;

    // Throws RelayError(NETWORK_FAILURE, "Fetch failed: ...")
    virtual std::vector<u8> fetch(const std::string& url, const ProgressFn& progress) = 0;
};

class UrlSourceFetcher : public SourceFetcher {
public:
    std::vector<u8> fetch(const std::string& url, const ProgressFn& progress) override;

private:
    std::vector<u8> fetch_file(const std::string& path, const ProgressFn& progress);
    std::vector<u8> fetch_http(const std::string& url, const ProgressFn& progress);
};

namespace url {

// "file:///a/b" -> "/a/b"; any other string is returned unchanged
std::string file_path_of(const std::string& url);

} // namespace url
