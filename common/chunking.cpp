// ============================================================
// chunking.cpp
// ============================================================

#include "chunking.hpp"
#include "errors.hpp"
#include "hash.hpp"
#include <algorithm>
#include <stdexcept>

namespace chunking {

u32 chunk_count(u64 total_len, u64 max_chunk) {
    if (max_chunk == 0) {
        throw std::invalid_argument("chunk size must be at least 1");
    }
    u64 n = total_len / max_chunk + (total_len % max_chunk != 0 ? 1 : 0);
    if (n > 0xFFFFFFFFull) {
        throw std::length_error("too many chunks: " + std::to_string(n));
    }
    return (u32)n;
}

std::string chunk_at(const std::string& data, u32 index, u64 max_chunk) {
    u32 n = chunk_count(data.size(), max_chunk);
    if (index >= n) {
        throw std::out_of_range("chunk index " + std::to_string(index) +
                                " out of range (count " + std::to_string(n) + ")");
    }
    u64 start = (u64)index * max_chunk;
    u64 len   = std::min<u64>(max_chunk, (u64)data.size() - start);
    return data.substr((size_t)start, (size_t)len);
}

std::vector<std::string> split(const std::string& data, u64 max_chunk) {
    u32 n = chunk_count(data.size(), max_chunk);
    std::vector<std::string> out;
    out.reserve(n);
    for (u32 i = 0; i < n; ++i) {
        out.push_back(chunk_at(data, i, max_chunk));
    }
    return out;
}

std::string join(const std::vector<std::string>& chunks) {
    size_t total = 0;
    for (const auto& c : chunks) total += c.size();
    std::string out;
    out.reserve(total);
    for (const auto& c : chunks) out += c;
    return out;
}

} // namespace chunking

// ---------------------------------------------------------------
// ChunkAssembler
// ---------------------------------------------------------------

ChunkAssembler::ChunkAssembler(u32 total_chunks)
    : slots_(total_chunks)
    , filled_(total_chunks, false)
{}

bool ChunkAssembler::put(u32 index, std::string chunk) {
    if (index >= slots_.size()) {
        throw std::out_of_range("chunk index " + std::to_string(index) +
                                " out of range (total " + std::to_string(slots_.size()) + ")");
    }
    bool fresh = !filled_[index];
    if (!fresh) {
        staged_bytes_ -= slots_[index].size();
    }
    staged_bytes_ += chunk.size();
    slots_[index] = std::move(chunk);
    if (fresh) {
        filled_[index] = true;
        ++received_;
    }
    return fresh;
}

bool ChunkAssembler::put_verified(u32 index, std::string chunk, u32 checksum) {
    if (hash::xxh3_32(chunk) != checksum) {
        throw RelayError(ErrorKind::PROTOCOL,
                         "Chunk checksum mismatch at index " + std::to_string(index));
    }
    return put(index, std::move(chunk));
}

std::string ChunkAssembler::assemble() const {
    if (!complete()) {
        throw RelayError(ErrorKind::INCOMPLETE_TRANSFER,
                         "Incomplete transfer: received " + std::to_string(received_) +
                         "/" + std::to_string(slots_.size()) + " chunks");
    }
    std::string out;
    out.reserve((size_t)staged_bytes_);
    for (const auto& s : slots_) out += s;
    return out;
}
