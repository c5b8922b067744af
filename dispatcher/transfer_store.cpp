// ============================================================
// transfer_store.cpp
// ============================================================

#include "transfer_store.hpp"
#include "../common/errors.hpp"
#include "../common/logger.hpp"
#include "../common/protocol.hpp"
#include "../common/utils.hpp"

// ceil(MAX_STAGED_PAYLOAD / ceiling)
static u64 max_upload_chunks(u64 ceiling) {
    if (ceiling == 0) return 0;
    return (MAX_STAGED_PAYLOAD + ceiling - 1) / ceiling;
}

TransferStore::TransferStore(const RelayConfig& cfg, Clock clock)
    : cfg_(cfg)
    , clock_(clock ? std::move(clock) : Clock(utils::now_ms))
{}

UploadAck TransferStore::put_chunk(const UploadChunk& chunk) {
    if (chunk.transfer_id.empty()) {
        throw RelayError(ErrorKind::PROTOCOL, "Upload chunk without transfer id");
    }
    if (chunk.total_chunks == 0) {
        throw RelayError(ErrorKind::PROTOCOL, "Upload chunk declares zero chunks");
    }
    if (chunk.total_chunks > max_upload_chunks(cfg_.transport_ceiling)) {
        throw RelayError(ErrorKind::PROTOCOL,
                         "Upload declares " + std::to_string(chunk.total_chunks) +
                         " chunks, limit is " +
                         std::to_string(max_upload_chunks(cfg_.transport_ceiling)));
    }
    if (chunk.chunk_index >= chunk.total_chunks) {
        throw RelayError(ErrorKind::PROTOCOL,
                         "Chunk index " + std::to_string(chunk.chunk_index) +
                         " out of range (total " + std::to_string(chunk.total_chunks) + ")");
    }

    u64 now = clock_();
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = entries_.find(chunk.transfer_id);
    if (it == entries_.end()) {
        if (cfg_.max_staged_transfers > 0 && entries_.size() >= cfg_.max_staged_transfers) {
            evict_oldest_locked();
        }
        it = entries_.emplace(chunk.transfer_id, Entry(chunk.total_chunks, now)).first;
        LOG_DEBUG("Transfer " + chunk.transfer_id + " started, " +
                  std::to_string(chunk.total_chunks) + " chunks");
    } else if (it->second.chunks.total() != chunk.total_chunks) {
        throw RelayError(ErrorKind::PROTOCOL,
                         "Transfer " + chunk.transfer_id + " declared " +
                         std::to_string(it->second.chunks.total()) + " chunks, now " +
                         std::to_string(chunk.total_chunks));
    }

    Entry& e = it->second;
    if (!e.chunks.put_verified(chunk.chunk_index, chunk.chunk, chunk.checksum)) {
        LOG_DEBUG("Transfer " + chunk.transfer_id + " chunk " +
                  std::to_string(chunk.chunk_index) + " replaced");
    }
    e.touched_ms = now;

    UploadAck ack;
    ack.received = e.chunks.received();
    ack.total    = e.chunks.total();
    return ack;
}

std::string TransferStore::take(const std::string& transfer_id) {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = entries_.find(transfer_id);
    if (it == entries_.end()) {
        throw RelayError(ErrorKind::TRANSFER_NOT_FOUND, "Transfer not found: " + transfer_id);
    }
    std::string text = it->second.chunks.assemble();
    entries_.erase(it);
    LOG_INFO("Transfer " + transfer_id + " reassembled (" + utils::format_bytes(text.size()) + ")");
    return text;
}

bool TransferStore::abandon(const std::string& transfer_id) {
    std::lock_guard<std::mutex> lk(mutex_);
    return entries_.erase(transfer_id) > 0;
}

size_t TransferStore::evict_expired() {
    u64 now = clock_();
    size_t n = 0;
    std::lock_guard<std::mutex> lk(mutex_);
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (now > it->second.touched_ms && now - it->second.touched_ms > cfg_.transfer_ttl_ms) {
            LOG_WARN("Evicting idle transfer " + it->first + " (" +
                     std::to_string(it->second.chunks.received()) + "/" +
                     std::to_string(it->second.chunks.total()) + " chunks)");
            it = entries_.erase(it);
            ++n;
        } else {
            ++it;
        }
    }
    return n;
}

void TransferStore::evict_oldest_locked() {
    auto oldest = entries_.end();
    for (auto it = entries_.begin(); it != entries_.end(); ++it) {
        if (oldest == entries_.end() || it->second.touched_ms < oldest->second.touched_ms) {
            oldest = it;
        }
    }
    if (oldest == entries_.end()) return;
    LOG_WARN("Transfer store full, evicting " + oldest->first);
    entries_.erase(oldest);
}

size_t TransferStore::size() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return entries_.size();
}

bool TransferStore::contains(const std::string& transfer_id) const {
    std::lock_guard<std::mutex> lk(mutex_);
    return entries_.count(transfer_id) > 0;
}
