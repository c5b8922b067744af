#pragma once

// ============================================================
// message.hpp -- Typed messages exchanged between contexts
//
// Every frame kind of protocol.hpp has one struct here; a Message
// is the variant over all of them. Handlers match with std::visit,
// so adding a kind breaks every switch that forgot it.
// ============================================================

#include "platform.hpp"
#include "protocol.hpp"
#include "errors.hpp"
#include "media.hpp"
#include <string>
#include <vector>
#include <variant>

// ---- client <-> dispatcher ----

struct JobRequest {
    static constexpr MsgType kType = MsgType::MT_JOB_REQUEST;
    JobKind     kind{JobKind::TRANSCODE};
    u32         tab_id{0};
    std::string source_url;  // TRANSCODE, EXTRACT_ARCHIVE_URL
    std::string payload;     // EXTRACT_ARCHIVE_DATA (base64)
};

struct UploadChunk {
    static constexpr MsgType kType = MsgType::MT_UPLOAD_CHUNK;
    std::string transfer_id;
    u32         chunk_index{0};
    u32         total_chunks{0};
    u32         checksum{0};  // xxh3_32(chunk)
    std::string chunk;
};

struct UploadAck {
    static constexpr MsgType kType = MsgType::MT_UPLOAD_ACK;
    u32 received{0};
    u32 total{0};
};

struct UploadProcess {
    static constexpr MsgType kType = MsgType::MT_UPLOAD_PROCESS;
    std::string transfer_id;
    u32         tab_id{0};
};

struct GetResultChunk {
    static constexpr MsgType kType = MsgType::MT_GET_RESULT_CHUNK;
    std::string result_id;
    u32         chunk_index{0};
};

struct ResultChunkReply {
    static constexpr MsgType kType = MsgType::MT_RESULT_CHUNK_REPLY;
    std::string chunk;
    u32         checksum{0};
    bool        is_last{false};
};

// Either the inline result, or a descriptor of a stored result that
// must be pulled chunk by chunk with GetResultChunk.
struct JobResponse {
    static constexpr MsgType kType = MsgType::MT_JOB_RESPONSE;
    bool          chunked{false};
    EncodedResult result;        // !chunked
    std::string   result_id;     // chunked
    u32           total_chunks{0};
    u64           total_length{0};
    bool          multiple{false};
    std::string   mime_type;     // chunked single media
};

struct ErrorReply {
    static constexpr MsgType kType = MsgType::MT_ERROR_REPLY;
    ErrorKind   kind{ErrorKind::PROTOCOL};
    std::string message;
};

struct Progress {
    static constexpr MsgType kType = MsgType::MT_PROGRESS;
    u32         tab_id{0};
    std::string status;
    u32         progress{0};  // 0..100
};

// ---- worker lifecycle ----

struct WorkerHello {
    static constexpr MsgType kType = MsgType::MT_WORKER_HELLO;
    u32 pid{0};
};

struct WorkerReady {
    static constexpr MsgType kType = MsgType::MT_WORKER_READY;
};

// ---- dispatcher -> worker ----

struct JobStart {
    static constexpr MsgType kType = MsgType::MT_JOB_START;
    u64         job_id{0};
    JobKind     kind{JobKind::TRANSCODE};
    u32         tab_id{0};
    std::string source_url;
    std::string payload;
};

// Archive bytes too large for one JobStart (always EXTRACT_ARCHIVE_DATA)
struct JobDataStart {
    static constexpr MsgType kType = MsgType::MT_JOB_DATA_START;
    u64 job_id{0};
    u32 tab_id{0};
    u32 total_chunks{0};
    u64 total_length{0};
};

struct JobDataChunk {
    static constexpr MsgType kType = MsgType::MT_JOB_DATA_CHUNK;
    u32         chunk_index{0};
    u32         checksum{0};
    std::string chunk;
};

struct JobDataEnd {
    static constexpr MsgType kType = MsgType::MT_JOB_DATA_END;
};

// ---- worker -> dispatcher ----

struct WorkerResult {
    static constexpr MsgType kType = MsgType::MT_RESULT;
    u64           job_id{0};
    bool          ok{false};
    EncodedResult result;  // ok
    std::string   error;   // !ok
    ErrorKind     error_kind{ErrorKind::ENGINE_FAILURE};
};

struct ResultStart {
    static constexpr MsgType kType = MsgType::MT_RESULT_START;
    u64         job_id{0};
    bool        multiple{false};
    std::string mime_type;
    u32         total_chunks{0};
    u64         total_length{0};
};

struct ResultChunk {
    static constexpr MsgType kType = MsgType::MT_RESULT_CHUNK;
    u32         chunk_index{0};
    u32         checksum{0};
    std::string chunk;
};

struct ResultEnd {
    static constexpr MsgType kType = MsgType::MT_RESULT_END;
};

using Message = std::variant<
    JobRequest, UploadChunk, UploadAck, UploadProcess,
    GetResultChunk, ResultChunkReply, JobResponse, ErrorReply,
    Progress, WorkerHello, WorkerReady,
    JobStart, JobDataStart, JobDataChunk, JobDataEnd,
    WorkerResult, ResultStart, ResultChunk, ResultEnd>;

// Helper for std::visit with a set of lambdas
template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

namespace proto {

MsgType message_type(const Message& msg);
const char* message_name(MsgType type);

// Payload bytes (without frame header)
std::vector<u8> encode_payload(const Message& msg);

// Throws std::runtime_error on unknown type or malformed payload
Message decode_payload(MsgType type, const u8* data, size_t len);

} // namespace proto
