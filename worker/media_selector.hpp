#pragma once

// ============================================================
// media_selector.hpp -- Which archive entries are videos, and
//                       how each one is made playable
// ============================================================

#include "archive.hpp"
#include <string>
#include <vector>

namespace media_select {

// mp4, webm, ogg, m4v: passed through unchanged
bool is_native(const std::string& ext);

// avi, mkv, flv, wmv, mov: transcoded to mp4
bool is_transcodable(const std::string& ext);

// Mime type of a native extension ("m4v" -> "video/mp4")
std::string mime_for(const std::string& ext);

// Directories, __MACOSX metadata and dot-files are never media
bool skip_entry(const ArchiveEntry& entry);

// Recognised extension of an entry name (lower case), or empty
std::string media_extension(const std::string& name);

// First recognised entry in archive order; nullptr when none
const ArchiveEntry* first_media(const std::vector<ArchiveEntry>& entries);

// Every recognised entry, sorted by name
std::vector<const ArchiveEntry*> all_media(const std::vector<ArchiveEntry>& entries);

// Container hint for a source URL; "avi" when the URL names none
std::string input_extension(const std::string& url);

// ffmpeg arguments converting input_name to H.264/AAC mp4 output_name
std::vector<std::string> transcode_args(const std::string& input_name,
                                        const std::string& output_name);

} // namespace media_select
