// ============================================================
// media.cpp
// ============================================================

#include "media.hpp"
#include "base64.hpp"
#include "errors.hpp"
#include <type_traits>

namespace {

const char kMultiTag[] = "vidbridge-media/1";

void put_netstring(std::string& out, const std::string& field) {
    out += std::to_string(field.size());
    out += ':';
    out += field;
    out += ',';
}

std::string take_netstring(const std::string& text, size_t& pos) {
    size_t colon = text.find(':', pos);
    if (colon == std::string::npos || colon == pos || colon - pos > 19) {
        throw RelayError(ErrorKind::PROTOCOL, "Malformed media payload: bad length at " +
                                              std::to_string(pos));
    }
    u64 len = 0;
    for (size_t i = pos; i < colon; ++i) {
        char c = text[i];
        if (c < '0' || c > '9') {
            throw RelayError(ErrorKind::PROTOCOL, "Malformed media payload: bad length at " +
                                                  std::to_string(pos));
        }
        len = len * 10 + (u64)(c - '0');
    }
    size_t start = colon + 1;
    if (len > text.size() - start || start + len >= text.size() || text[start + len] != ',') {
        throw RelayError(ErrorKind::PROTOCOL, "Malformed media payload: truncated field at " +
                                              std::to_string(pos));
    }
    pos = start + (size_t)len + 1;
    return text.substr(start, (size_t)len);
}

} // namespace

namespace media {

EncodedResult encode_result(const JobResult& result) {
    EncodedResult out;
    std::visit([&out](const auto& r) {
        using T = std::decay_t<decltype(r)>;
        if constexpr (std::is_same_v<T, SingleMedia>) {
            out.multiple = false;
            out.items.push_back(EncodedMedia{"", r.mime_type, base64::encode(r.data)});
        } else {
            out.multiple = true;
            out.items.reserve(r.items.size());
            for (const auto& item : r.items) {
                out.items.push_back(EncodedMedia{item.name, item.mime_type,
                                                 base64::encode(item.data)});
            }
        }
    }, result);
    return out;
}

JobResult decode_result(const EncodedResult& encoded) {
    if (!encoded.multiple) {
        if (encoded.items.size() != 1) {
            throw RelayError(ErrorKind::PROTOCOL, "Single media result with " +
                             std::to_string(encoded.items.size()) + " items");
        }
        const auto& it = encoded.items.front();
        return SingleMedia{base64::decode(it.base64), it.mime_type};
    }
    MultiMedia multi;
    multi.items.reserve(encoded.items.size());
    for (const auto& it : encoded.items) {
        multi.items.push_back(MediaItem{it.name, base64::decode(it.base64), it.mime_type});
    }
    return multi;
}

u64 encoded_size(const EncodedResult& encoded) {
    u64 total = 0;
    for (const auto& it : encoded.items) total += it.base64.size();
    return total;
}

std::string serialize_multi(const EncodedResult& encoded) {
    size_t reserve = 64;
    for (const auto& it : encoded.items) {
        reserve += it.name.size() + it.mime_type.size() + it.base64.size() + 64;
    }
    std::string out;
    out.reserve(reserve);
    put_netstring(out, kMultiTag);
    put_netstring(out, std::to_string(encoded.items.size()));
    for (const auto& it : encoded.items) {
        put_netstring(out, it.name);
        put_netstring(out, it.mime_type);
        put_netstring(out, it.base64);
    }
    return out;
}

EncodedResult parse_multi(const std::string& text) {
    size_t pos = 0;
    if (take_netstring(text, pos) != kMultiTag) {
        throw RelayError(ErrorKind::PROTOCOL, "Malformed media payload: unknown tag");
    }
    std::string count_str = take_netstring(text, pos);
    u64 count = 0;
    try {
        count = std::stoull(count_str);
    } catch (const std::exception&) {
        throw RelayError(ErrorKind::PROTOCOL, "Malformed media payload: bad item count");
    }

    EncodedResult out;
    out.multiple = true;
    for (u64 i = 0; i < count; ++i) {
        EncodedMedia m;
        m.name      = take_netstring(text, pos);
        m.mime_type = take_netstring(text, pos);
        m.base64    = take_netstring(text, pos);
        out.items.push_back(std::move(m));
    }
    if (pos != text.size()) {
        throw RelayError(ErrorKind::PROTOCOL, "Malformed media payload: trailing data");
    }
    return out;
}

EncodedResult single_from_base64(std::string base64, std::string mime_type) {
    EncodedResult out;
    out.multiple = false;
    out.items.push_back(EncodedMedia{"", std::move(mime_type), std::move(base64)});
    return out;
}

void write_encoded_result(proto::WireWriter& w, const EncodedResult& r) {
    w.boolean(r.multiple);
    w.u32v((u32)r.items.size());
    for (const auto& it : r.items) {
        w.str(it.name);
        w.str(it.mime_type);
        w.str(it.base64);
    }
}

EncodedResult read_encoded_result(proto::WireReader& r) {
    EncodedResult out;
    out.multiple = r.boolean();
    u32 n = r.u32v();
    // Each item needs at least three length prefixes
    if ((u64)n * 12 > r.remaining()) {
        throw std::runtime_error("Result item count exceeds payload: " + std::to_string(n));
    }
    out.items.reserve(n);
    for (u32 i = 0; i < n; ++i) {
        EncodedMedia m;
        m.name      = r.str();
        m.mime_type = r.str();
        m.base64    = r.str();
        out.items.push_back(std::move(m));
    }
    return out;
}

} // namespace media
