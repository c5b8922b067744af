#pragma once

// ============================================================
// chunking.hpp -- Split oversized text payloads into ordered,
//                 size-bounded chunks and reassemble them
//
// Boundaries are pure byte-offset cuts:
//   chunk[i] = data[i*max, min((i+1)*max, len))
//   count    = ceil(len / max)
// Reassembly is by explicit chunk index, never by arrival order.
// ============================================================

#include "platform.hpp"
#include <string>
#include <vector>

namespace chunking {

// ceil(total_len / max_chunk). Throws std::invalid_argument if max_chunk == 0
// and std::length_error if the count does not fit in u32.
u32 chunk_count(u64 total_len, u64 max_chunk);

// A payload travels whole when its encoded size is at or below the ceiling
inline bool needs_chunking(u64 encoded_len, u64 ceiling) {
    return encoded_len > ceiling;
}

// Throws std::out_of_range if index >= chunk_count(data.size(), max_chunk)
std::string chunk_at(const std::string& data, u32 index, u64 max_chunk);

std::vector<std::string> split(const std::string& data, u64 max_chunk);

std::string join(const std::vector<std::string>& chunks);

} // namespace chunking

// Index-addressed staging buffer for one chunked payload.
// A duplicate index replaces the slot without counting twice, so
// received() <= total() always holds.
class ChunkAssembler {
public:
    explicit ChunkAssembler(u32 total_chunks);

    // Returns true when the slot was empty before. Throws std::out_of_range.
    bool put(u32 index, std::string chunk);

    // Same as put() after checking the xxh3_32 checksum of the chunk;
    // throws RelayError(PROTOCOL) on mismatch.
    bool put_verified(u32 index, std::string chunk, u32 checksum);

    u32 received() const { return received_; }
    u32 total() const { return (u32)slots_.size(); }
    bool complete() const { return received_ == slots_.size(); }

    // Concatenate in index order. Throws RelayError(INCOMPLETE_TRANSFER)
    // while any slot is still empty.
    std::string assemble() const;

private:
    std::vector<std::string> slots_;
    std::vector<bool>        filled_;
    u32                      received_{0};
    u64                      staged_bytes_{0};
};
