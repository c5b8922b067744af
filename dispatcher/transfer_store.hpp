#pragma once

// ============================================================
// transfer_store.hpp -- Chunked uploads staged by transfer id
//
// An entry lives from its first chunk until it is taken whole,
// abandoned, idle longer than transfer_ttl_ms, or pushed out as the
// least recently touched entry when max_staged_transfers is reached.
// ============================================================

#include "../common/platform.hpp"
#include "../common/config.hpp"
#include "../common/chunking.hpp"
#include "../common/message.hpp"
#include <string>
#include <unordered_map>
#include <functional>
#include <mutex>

class TransferStore {
public:
    using Clock = std::function<u64()>;

    explicit TransferStore(const RelayConfig& cfg, Clock clock = nullptr);

    // Verify and stage one chunk. Throws RelayError(PROTOCOL) on a checksum
    // mismatch, a bad index or a total that disagrees with earlier chunks.
    UploadAck put_chunk(const UploadChunk& chunk);

    // Reassembled text; the entry is removed. Throws
    // RelayError(TRANSFER_NOT_FOUND) or RelayError(INCOMPLETE_TRANSFER),
    // in which case the entry stays.
    std::string take(const std::string& transfer_id);

    // Returns false if the id is unknown
    bool abandon(const std::string& transfer_id);

    // Drop entries idle longer than the TTL; returns how many went
    size_t evict_expired();

    size_t size() const;
    bool contains(const std::string& transfer_id) const;

private:
    struct Entry {
        ChunkAssembler chunks;
        u64            touched_ms{0};

        Entry(u32 total, u64 now) : chunks(total), touched_ms(now) {}
    };

    void evict_oldest_locked();

    RelayConfig cfg_;
    Clock       clock_;

    mutable std::mutex                     mutex_;
    std::unordered_map<std::string, Entry> entries_;
};
