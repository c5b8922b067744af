#pragma once

// ============================================================
// protocol_io.hpp -- Frame header and field codec with
//                    byte-order handling
// ============================================================

#include "protocol.hpp"
#include <vector>
#include <string>
#include <stdexcept>
#include <endian.h>

namespace proto {

// ---- Byte-order helpers ----

inline u16 hton16(u16 v) { return htobe16(v); }
inline u32 hton32(u32 v) { return htobe32(v); }
inline u64 hton64(u64 v) { return htobe64(v); }
inline u16 ntoh16(u16 v) { return be16toh(v); }
inline u32 ntoh32(u32 v) { return be32toh(v); }
inline u64 ntoh64(u64 v) { return be64toh(v); }

// ---- Serialise / deserialise FrameHeader ----

inline void encode_header(const FrameHeader& h, u8 buf[8]) {
    u16 mt = hton16(h.msg_type);
    u16 fl = hton16(h.flags);
    u32 pl = hton32(h.payload_len);
    std::memcpy(buf,     &mt, 2);
    std::memcpy(buf + 2, &fl, 2);
    std::memcpy(buf + 4, &pl, 4);
}

inline FrameHeader decode_header(const u8 buf[8]) {
    FrameHeader h;
    u16 mt, fl; u32 pl;
    std::memcpy(&mt, buf,     2);
    std::memcpy(&fl, buf + 2, 2);
    std::memcpy(&pl, buf + 4, 4);
    h.msg_type    = ntoh16(mt);
    h.flags       = ntoh16(fl);
    h.payload_len = ntoh32(pl);
    return h;
}

// ---- Payload field writer (host -> network) ----
class WireWriter {
public:
    void u8v(u8 v)   { buf_.push_back(v); }
    void boolean(bool v) { buf_.push_back(v ? 1 : 0); }
    void u16v(u16 v) { v = hton16(v); append(&v, 2); }
    void u32v(u32 v) { v = hton32(v); append(&v, 4); }
    void u64v(u64 v) { v = hton64(v); append(&v, 8); }

    // u32 length prefix + bytes
    void str(const std::string& s) {
        if (s.size() > 0xFFFFFFFFull) {
            throw std::length_error("string field too long for wire");
        }
        u32v((u32)s.size());
        append(s.data(), s.size());
    }

    std::vector<u8>& buffer() { return buf_; }
    std::vector<u8> take() { return std::move(buf_); }

private:
    void append(const void* p, size_t n) {
        const u8* b = static_cast<const u8*>(p);
        buf_.insert(buf_.end(), b, b + n);
    }

    std::vector<u8> buf_;
};

// ---- Payload field reader (network -> host); throws on short payload ----
class WireReader {
public:
    WireReader(const u8* data, size_t len) : data_(data), len_(len) {}
    explicit WireReader(const std::vector<u8>& v) : data_(v.data()), len_(v.size()) {}

    u8 u8v() {
        need(1);
        return data_[pos_++];
    }

    bool boolean() { return u8v() != 0; }

    u16 u16v() { u16 v; copy(&v, 2); return ntoh16(v); }
    u32 u32v() { u32 v; copy(&v, 4); return ntoh32(v); }
    u64 u64v() { u64 v; copy(&v, 8); return ntoh64(v); }

    std::string str() {
        u32 n = u32v();
        need(n);
        std::string s(reinterpret_cast<const char*>(data_ + pos_), n);
        pos_ += n;
        return s;
    }

    size_t remaining() const { return len_ - pos_; }

    // Trailing garbage means the peer speaks a different layout
    void expect_end() const {
        if (pos_ != len_) {
            throw std::runtime_error("Trailing bytes in payload: " +
                                     std::to_string(len_ - pos_));
        }
    }

private:
    void need(size_t n) const {
        if (len_ - pos_ < n) {
            throw std::runtime_error("Short payload: need " + std::to_string(n) +
                                     " bytes, have " + std::to_string(len_ - pos_));
        }
    }

    void copy(void* dst, size_t n) {
        need(n);
        std::memcpy(dst, data_ + pos_, n);
        pos_ += n;
    }

    const u8* data_;
    size_t    len_;
    size_t    pos_{0};
};

} // namespace proto
