// ============================================================
// media_selector.cpp
// ============================================================

#include "media_selector.hpp"
#include "../common/utils.hpp"
#include <algorithm>

namespace {

const char* const kNative[]     = {"mp4", "webm", "ogg", "m4v"};
const char* const kTranscode[]  = {"avi", "mkv", "flv", "wmv", "mov"};
// Order matters: the first alternative matching at the leftmost dot wins
const char* const kUrlHints[]   = {"avi", "mkv", "flv", "wmv", "mov", "mp4", "webm"};

template<size_t N>
bool contains(const char* const (&list)[N], const std::string& ext) {
    for (const char* e : list) {
        if (ext == e) return true;
    }
    return false;
}

} // namespace

namespace media_select {

bool is_native(const std::string& ext) {
    return contains(kNative, ext);
}

bool is_transcodable(const std::string& ext) {
    return contains(kTranscode, ext);
}

std::string mime_for(const std::string& ext) {
    if (ext == "webm") return "video/webm";
    if (ext == "ogg")  return "video/ogg";
    return "video/mp4";
}

bool skip_entry(const ArchiveEntry& entry) {
    std::string lower = utils::to_lower(entry.name);
    return entry.is_dir || utils::starts_with(lower, "__macosx") || utils::starts_with(lower, ".");
}

std::string media_extension(const std::string& name) {
    std::string lower = utils::to_lower(name);
    for (const char* e : kNative) {
        if (utils::ends_with(lower, std::string(".") + e)) return e;
    }
    for (const char* e : kTranscode) {
        if (utils::ends_with(lower, std::string(".") + e)) return e;
    }
    return "";
}

const ArchiveEntry* first_media(const std::vector<ArchiveEntry>& entries) {
    for (const auto& e : entries) {
        if (skip_entry(e)) continue;
        if (!media_extension(e.name).empty()) return &e;
    }
    return nullptr;
}

std::vector<const ArchiveEntry*> all_media(const std::vector<ArchiveEntry>& entries) {
    std::vector<const ArchiveEntry*> out;
    for (const auto& e : entries) {
        if (skip_entry(e)) continue;
        if (!media_extension(e.name).empty()) out.push_back(&e);
    }
    std::stable_sort(out.begin(), out.end(), [](const ArchiveEntry* a, const ArchiveEntry* b) {
        return a->name < b->name;
    });
    return out;
}

std::string input_extension(const std::string& url) {
    std::string lower = utils::to_lower(url);
    for (size_t pos = lower.find('.'); pos != std::string::npos; pos = lower.find('.', pos + 1)) {
        for (const char* e : kUrlHints) {
            if (lower.compare(pos + 1, std::char_traits<char>::length(e), e) == 0) return e;
        }
    }
    return "avi";
}

std::vector<std::string> transcode_args(const std::string& input_name,
                                        const std::string& output_name) {
    return {
        "-i", input_name,
        "-c:v", "libx264",
        "-preset", "ultrafast",
        "-crf", "28",
        "-c:a", "aac",
        "-b:a", "128k",
        output_name,
    };
}

} // namespace media_select
