#pragma once

// ============================================================
// media.hpp -- Job results in raw and transport (base64) form
// ============================================================

#include "platform.hpp"
#include "protocol_io.hpp"
#include <string>
#include <vector>
#include <variant>

// ---- Raw form: what the worker produces and the client consumes ----

struct SingleMedia {
    std::vector<u8> data;
    std::string     mime_type;
};

struct MediaItem {
    std::string     name;
    std::vector<u8> data;
    std::string     mime_type;
};

struct MultiMedia {
    std::vector<MediaItem> items;  // sorted by name
};

using JobResult = std::variant<SingleMedia, MultiMedia>;

// ---- Transport form: every byte blob as base64 text ----

struct EncodedMedia {
    std::string name;       // empty for single media
    std::string mime_type;
    std::string base64;
};

struct EncodedResult {
    bool                      multiple{false};
    std::vector<EncodedMedia> items;  // exactly one when !multiple
};

namespace media {

EncodedResult encode_result(const JobResult& result);

// Throws std::invalid_argument on malformed base64
JobResult decode_result(const EncodedResult& encoded);

// Sum of the base64 lengths of all items (before any serialization)
u64 encoded_size(const EncodedResult& encoded);

// Multi-media payload as a single text string (netstring fields:
// "<len>:<bytes>,"), safe to chunk at arbitrary byte offsets.
std::string serialize_multi(const EncodedResult& encoded);

// Throws RelayError(PROTOCOL) on malformed text
EncodedResult parse_multi(const std::string& text);

// Single media rebuilt from a reassembled base64 blob
EncodedResult single_from_base64(std::string base64, std::string mime_type);

void write_encoded_result(proto::WireWriter& w, const EncodedResult& r);
EncodedResult read_encoded_result(proto::WireReader& r);

} // namespace media
