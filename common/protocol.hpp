#pragma once

// protocol.hpp -- Wire protocol definitions for vidbridge

#include "platform.hpp"
#include <cstring>

// Hard platform limit for one frame. Anything larger is rejected on read.
static constexpr u32 MAX_FRAME_LEN = 64u * 1024u * 1024u;
// Encoded text allowed in one message (32 MB keeps frames well under MAX_FRAME_LEN).
// This is only the default of RelayConfig::transport_ceiling; call sites read the config.
static constexpr u64 DEFAULT_TRANSPORT_CEILING = 32ull * 1024ull * 1024ull;
// Largest encoded payload the dispatcher stages from client uploads.
// Bounds the chunk count an upload may declare at a given ceiling.
static constexpr u64 MAX_STAGED_PAYLOAD = 4ull * 1024ull * 1024ull * 1024ull;
// Frame payloads at least this large are zstd-compressed when enabled.
static constexpr u32 COMPRESS_MIN_PAYLOAD = 64u * 1024u;

// ---- Message Types (all prefixed MT_) ----
enum class MsgType : u16 {
    // client <-> dispatcher
    MT_JOB_REQUEST        = 0x0001,
    MT_UPLOAD_CHUNK       = 0x0002,
    MT_UPLOAD_ACK         = 0x0003,
    MT_UPLOAD_PROCESS     = 0x0004,
    MT_GET_RESULT_CHUNK   = 0x0005,
    MT_RESULT_CHUNK_REPLY = 0x0006,
    MT_JOB_RESPONSE       = 0x0007,

    MT_PROGRESS           = 0x0010,  // worker -> dispatcher -> client

    // worker lifecycle
    MT_WORKER_HELLO       = 0x0020,  // connection handle is live
    MT_WORKER_READY       = 0x0021,  // one-time engine init finished

    // dispatcher -> worker
    MT_JOB_START          = 0x0030,
    MT_JOB_DATA_START     = 0x0031,
    MT_JOB_DATA_CHUNK     = 0x0032,
    MT_JOB_DATA_END       = 0x0033,

    // worker -> dispatcher
    MT_RESULT             = 0x0040,
    MT_RESULT_START       = 0x0041,
    MT_RESULT_CHUNK       = 0x0042,
    MT_RESULT_END         = 0x0043,

    MT_ERROR_REPLY        = 0x00FF,
};

// ---- Frame Header (8 bytes, big-endian on wire) ----
struct FrameHeader {
    u16 msg_type;
    u16 flags;
    u32 payload_len;
};
static_assert(sizeof(FrameHeader) == 8, "FrameHeader must be 8 bytes");

// ---- Frame flags ----
enum FrameFlags : u16 {
    FRAME_FLAG_ZSTD = 0x0001,  // payload = u32 raw_len + zstd block
};

// ---- Job kinds ----
enum class JobKind : u8 {
    TRANSCODE            = 1,  // source_url
    EXTRACT_ARCHIVE_URL  = 2,  // source_url
    EXTRACT_ARCHIVE_DATA = 3,  // payload (base64 archive bytes)
};

inline const char* job_kind_name(JobKind k) {
    switch (k) {
        case JobKind::TRANSCODE:            return "transcode";
        case JobKind::EXTRACT_ARCHIVE_URL:  return "extract-url";
        case JobKind::EXTRACT_ARCHIVE_DATA: return "extract-data";
    }
    return "?";
}

inline bool job_kind_valid(u8 v) {
    return v >= (u8)JobKind::TRANSCODE && v <= (u8)JobKind::EXTRACT_ARCHIVE_DATA;
}
