#pragma once

// ============================================================
// result_store.hpp -- Results too large for one reply, kept for
//                     the client to pull chunk by chunk
// ============================================================

#include "../common/platform.hpp"
#include "../common/config.hpp"
#include "../common/message.hpp"
#include "../common/media.hpp"
#include <string>
#include <unordered_map>
#include <functional>
#include <mutex>

class ResultStore {
public:
    using Clock = std::function<u64()>;

    explicit ResultStore(const RelayConfig& cfg, Clock clock = nullptr);

    // Store the encoded result under result_id and return the chunked
    // JobResponse descriptor the client needs to pull it
    JobResponse store(const std::string& result_id, const EncodedResult& encoded);

    // The entry is removed after its last chunk is pulled. Throws
    // RelayError(TRANSFER_NOT_FOUND) "Result not found: <id>" or
    // RelayError(PROTOCOL) for an index past the end.
    ResultChunkReply pull(const std::string& result_id, u32 chunk_index);

    size_t evict_expired();

    size_t size() const;
    bool contains(const std::string& result_id) const;

private:
    struct Stored {
        std::string text;  // base64, or the serialized multi-media payload
        u32         total_chunks{0};
        u64         created_ms{0};
    };

    RelayConfig cfg_;
    Clock       clock_;

    mutable std::mutex                      mutex_;
    std::unordered_map<std::string, Stored> results_;
};
