#pragma once

// ============================================================
// hash.hpp -- xxHash3 wrappers for chunk integrity
// ============================================================

#include "platform.hpp"
#include <cstddef>
#include <string>

// XXH3 API
#define XXH_STATIC_LINKING_ONLY
#include <xxhash.h>

namespace hash {

// Compute 32-bit checksum (low 32 bits of XXH3_64bits)
inline u32 xxh3_32(const void* data, size_t len) {
    return (u32)(XXH3_64bits(data, len) & 0xFFFFFFFFu);
}

inline u32 xxh3_32(const std::string& s) {
    return xxh3_32(s.data(), s.size());
}

} // namespace hash
