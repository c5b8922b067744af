// ============================================================
// result_store.cpp
// ============================================================

#include "result_store.hpp"
#include "../common/chunking.hpp"
#include "../common/errors.hpp"
#include "../common/hash.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"

ResultStore::ResultStore(const RelayConfig& cfg, Clock clock)
    : cfg_(cfg)
    , clock_(clock ? std::move(clock) : Clock(utils::now_ms))
{}

JobResponse ResultStore::store(const std::string& result_id, const EncodedResult& encoded) {
    if (encoded.items.empty()) {
        throw RelayError(ErrorKind::PROTOCOL, "Cannot store an empty result");
    }

    JobResponse resp;
    resp.chunked   = true;
    resp.result_id = result_id;
    resp.multiple  = encoded.multiple;

    Stored s;
    if (encoded.multiple) {
        s.text = media::serialize_multi(encoded);
    } else {
        resp.mime_type = encoded.items.front().mime_type;
        s.text = encoded.items.front().base64;
    }
    s.total_chunks = s.text.empty() ? 1 : chunking::chunk_count(s.text.size(), cfg_.transport_ceiling);
    s.created_ms   = clock_();

    resp.total_chunks = s.total_chunks;
    resp.total_length = s.text.size();

    LOG_INFO("Stored result " + result_id + " (" + utils::format_bytes(s.text.size()) + ", " +
             std::to_string(s.total_chunks) + " chunks)");

    std::lock_guard<std::mutex> lk(mutex_);
    results_[result_id] = std::move(s);
    return resp;
}

ResultChunkReply ResultStore::pull(const std::string& result_id, u32 chunk_index) {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = results_.find(result_id);
    if (it == results_.end()) {
        throw RelayError(ErrorKind::TRANSFER_NOT_FOUND, "Result not found: " + result_id);
    }
    Stored& s = it->second;
    if (chunk_index >= s.total_chunks) {
        throw RelayError(ErrorKind::PROTOCOL,
                         "Chunk index " + std::to_string(chunk_index) +
                         " out of range (total " + std::to_string(s.total_chunks) + ")");
    }

    ResultChunkReply reply;
    reply.chunk    = s.text.empty() ? std::string()
                                    : chunking::chunk_at(s.text, chunk_index, cfg_.transport_ceiling);
    reply.checksum = hash::xxh3_32(reply.chunk);
    reply.is_last  = chunk_index + 1 == s.total_chunks;
    if (reply.is_last) {
        results_.erase(it);
        LOG_DEBUG("Result " + result_id + " fully pulled");
    }
    return reply;
}

size_t ResultStore::evict_expired() {
    u64 now = clock_();
    size_t n = 0;
    std::lock_guard<std::mutex> lk(mutex_);
    for (auto it = results_.begin(); it != results_.end();) {
        if (now > it->second.created_ms && now - it->second.created_ms > cfg_.result_ttl_ms) {
            LOG_WARN("Evicting unclaimed result " + it->first);
            it = results_.erase(it);
            ++n;
        } else {
            ++it;
        }
    }
    return n;
}

size_t ResultStore::size() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return results_.size();
}

bool ResultStore::contains(const std::string& result_id) const {
    std::lock_guard<std::mutex> lk(mutex_);
    return results_.count(result_id) > 0;
}
