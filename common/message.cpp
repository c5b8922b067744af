// ============================================================
// message.cpp -- Payload codec for every Message kind
// ============================================================

#include "message.hpp"
#include "protocol_io.hpp"
#include <stdexcept>

namespace {

using proto::WireWriter;
using proto::WireReader;

// ---- writers ----

void write(WireWriter& w, const JobRequest& m) {
    w.u8v((u8)m.kind);
    w.u32v(m.tab_id);
    w.str(m.source_url);
    w.str(m.payload);
}

void write(WireWriter& w, const UploadChunk& m) {
    w.str(m.transfer_id);
    w.u32v(m.chunk_index);
    w.u32v(m.total_chunks);
    w.u32v(m.checksum);
    w.str(m.chunk);
}

void write(WireWriter& w, const UploadAck& m) {
    w.u32v(m.received);
    w.u32v(m.total);
}

void write(WireWriter& w, const UploadProcess& m) {
    w.str(m.transfer_id);
    w.u32v(m.tab_id);
}

void write(WireWriter& w, const GetResultChunk& m) {
    w.str(m.result_id);
    w.u32v(m.chunk_index);
}

void write(WireWriter& w, const ResultChunkReply& m) {
    w.str(m.chunk);
    w.u32v(m.checksum);
    w.boolean(m.is_last);
}

void write(WireWriter& w, const JobResponse& m) {
    w.boolean(m.chunked);
    if (m.chunked) {
        w.str(m.result_id);
        w.u32v(m.total_chunks);
        w.u64v(m.total_length);
        w.boolean(m.multiple);
        w.str(m.mime_type);
    } else {
        media::write_encoded_result(w, m.result);
    }
}

void write(WireWriter& w, const ErrorReply& m) {
    w.u8v((u8)m.kind);
    w.str(m.message);
}

void write(WireWriter& w, const Progress& m) {
    w.u32v(m.tab_id);
    w.str(m.status);
    w.u32v(m.progress);
}

void write(WireWriter& w, const WorkerHello& m) {
    w.u32v(m.pid);
}

void write(WireWriter&, const WorkerReady&) {}

void write(WireWriter& w, const JobStart& m) {
    w.u64v(m.job_id);
    w.u8v((u8)m.kind);
    w.u32v(m.tab_id);
    w.str(m.source_url);
    w.str(m.payload);
}

void write(WireWriter& w, const JobDataStart& m) {
    w.u64v(m.job_id);
    w.u32v(m.tab_id);
    w.u32v(m.total_chunks);
    w.u64v(m.total_length);
}

void write(WireWriter& w, const JobDataChunk& m) {
    w.u32v(m.chunk_index);
    w.u32v(m.checksum);
    w.str(m.chunk);
}

void write(WireWriter&, const JobDataEnd&) {}

void write(WireWriter& w, const WorkerResult& m) {
    w.u64v(m.job_id);
    w.boolean(m.ok);
    if (m.ok) {
        media::write_encoded_result(w, m.result);
    } else {
        w.u8v((u8)m.error_kind);
        w.str(m.error);
    }
}

void write(WireWriter& w, const ResultStart& m) {
    w.u64v(m.job_id);
    w.boolean(m.multiple);
    w.str(m.mime_type);
    w.u32v(m.total_chunks);
    w.u64v(m.total_length);
}

void write(WireWriter& w, const ResultChunk& m) {
    w.u32v(m.chunk_index);
    w.u32v(m.checksum);
    w.str(m.chunk);
}

void write(WireWriter&, const ResultEnd&) {}

// ---- readers ----

JobKind read_job_kind(WireReader& r) {
    u8 v = r.u8v();
    if (!job_kind_valid(v)) {
        throw std::runtime_error("Unknown job kind: " + std::to_string(v));
    }
    return (JobKind)v;
}

Message read(MsgType type, WireReader& r) {
    switch (type) {
        case MsgType::MT_JOB_REQUEST: {
            JobRequest m;
            m.kind       = read_job_kind(r);
            m.tab_id     = r.u32v();
            m.source_url = r.str();
            m.payload    = r.str();
            return m;
        }
        case MsgType::MT_UPLOAD_CHUNK: {
            UploadChunk m;
            m.transfer_id  = r.str();
            m.chunk_index  = r.u32v();
            m.total_chunks = r.u32v();
            m.checksum     = r.u32v();
            m.chunk        = r.str();
            return m;
        }
        case MsgType::MT_UPLOAD_ACK: {
            UploadAck m;
            m.received = r.u32v();
            m.total    = r.u32v();
            return m;
        }
        case MsgType::MT_UPLOAD_PROCESS: {
            UploadProcess m;
            m.transfer_id = r.str();
            m.tab_id      = r.u32v();
            return m;
        }
        case MsgType::MT_GET_RESULT_CHUNK: {
            GetResultChunk m;
            m.result_id   = r.str();
            m.chunk_index = r.u32v();
            return m;
        }
        case MsgType::MT_RESULT_CHUNK_REPLY: {
            ResultChunkReply m;
            m.chunk    = r.str();
            m.checksum = r.u32v();
            m.is_last  = r.boolean();
            return m;
        }
        case MsgType::MT_JOB_RESPONSE: {
            JobResponse m;
            m.chunked = r.boolean();
            if (m.chunked) {
                m.result_id    = r.str();
                m.total_chunks = r.u32v();
                m.total_length = r.u64v();
                m.multiple     = r.boolean();
                m.mime_type    = r.str();
            } else {
                m.result = media::read_encoded_result(r);
            }
            return m;
        }
        case MsgType::MT_ERROR_REPLY: {
            ErrorReply m;
            m.kind    = error_kind_from_wire(r.u8v());
            m.message = r.str();
            return m;
        }
        case MsgType::MT_PROGRESS: {
            Progress m;
            m.tab_id   = r.u32v();
            m.status   = r.str();
            m.progress = r.u32v();
            return m;
        }
        case MsgType::MT_WORKER_HELLO: {
            WorkerHello m;
            m.pid = r.u32v();
            return m;
        }
        case MsgType::MT_WORKER_READY:
            return WorkerReady{};
        case MsgType::MT_JOB_START: {
            JobStart m;
            m.job_id     = r.u64v();
            m.kind       = read_job_kind(r);
            m.tab_id     = r.u32v();
            m.source_url = r.str();
            m.payload    = r.str();
            return m;
        }
        case MsgType::MT_JOB_DATA_START: {
            JobDataStart m;
            m.job_id       = r.u64v();
            m.tab_id       = r.u32v();
            m.total_chunks = r.u32v();
            m.total_length = r.u64v();
            return m;
        }
        case MsgType::MT_JOB_DATA_CHUNK: {
            JobDataChunk m;
            m.chunk_index = r.u32v();
            m.checksum    = r.u32v();
            m.chunk       = r.str();
            return m;
        }
        case MsgType::MT_JOB_DATA_END:
            return JobDataEnd{};
        case MsgType::MT_RESULT: {
            WorkerResult m;
            m.job_id = r.u64v();
            m.ok     = r.boolean();
            if (m.ok) {
                m.result = media::read_encoded_result(r);
            } else {
                m.error_kind = error_kind_from_wire(r.u8v());
                m.error      = r.str();
            }
            return m;
        }
        case MsgType::MT_RESULT_START: {
            ResultStart m;
            m.job_id       = r.u64v();
            m.multiple     = r.boolean();
            m.mime_type    = r.str();
            m.total_chunks = r.u32v();
            m.total_length = r.u64v();
            return m;
        }
        case MsgType::MT_RESULT_CHUNK: {
            ResultChunk m;
            m.chunk_index = r.u32v();
            m.checksum    = r.u32v();
            m.chunk       = r.str();
            return m;
        }
        case MsgType::MT_RESULT_END:
            return ResultEnd{};
    }
    throw std::runtime_error("Unknown message type: 0x" +
                             std::to_string((unsigned)type));
}

} // namespace

namespace proto {

MsgType message_type(const Message& msg) {
    return std::visit([](const auto& m) {
        return std::decay_t<decltype(m)>::kType;
    }, msg);
}

const char* message_name(MsgType type) {
    switch (type) {
        case MsgType::MT_JOB_REQUEST:        return "JOB_REQUEST";
        case MsgType::MT_UPLOAD_CHUNK:       return "UPLOAD_CHUNK";
        case MsgType::MT_UPLOAD_ACK:         return "UPLOAD_ACK";
        case MsgType::MT_UPLOAD_PROCESS:     return "UPLOAD_PROCESS";
        case MsgType::MT_GET_RESULT_CHUNK:   return "GET_RESULT_CHUNK";
        case MsgType::MT_RESULT_CHUNK_REPLY: return "RESULT_CHUNK_REPLY";
        case MsgType::MT_JOB_RESPONSE:       return "JOB_RESPONSE";
        case MsgType::MT_ERROR_REPLY:        return "ERROR_REPLY";
        case MsgType::MT_PROGRESS:           return "PROGRESS";
        case MsgType::MT_WORKER_HELLO:       return "WORKER_HELLO";
        case MsgType::MT_WORKER_READY:       return "WORKER_READY";
        case MsgType::MT_JOB_START:          return "JOB_START";
        case MsgType::MT_JOB_DATA_START:     return "JOB_DATA_START";
        case MsgType::MT_JOB_DATA_CHUNK:     return "JOB_DATA_CHUNK";
        case MsgType::MT_JOB_DATA_END:       return "JOB_DATA_END";
        case MsgType::MT_RESULT:             return "RESULT";
        case MsgType::MT_RESULT_START:       return "RESULT_START";
        case MsgType::MT_RESULT_CHUNK:       return "RESULT_CHUNK";
        case MsgType::MT_RESULT_END:         return "RESULT_END";
    }
    return "UNKNOWN";
}

std::vector<u8> encode_payload(const Message& msg) {
    WireWriter w;
    std::visit([&w](const auto& m) { write(w, m); }, msg);
    return w.take();
}

Message decode_payload(MsgType type, const u8* data, size_t len) {
    WireReader r(data, len);
    Message msg = read(type, r);
    r.expect_end();
    return msg;
}

} // namespace proto
