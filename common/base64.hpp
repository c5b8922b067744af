#pragma once

// ============================================================
// base64.hpp -- Transport-safe text encoding of raw bytes
//   (RFC 4648 alphabet, '=' padding)
// ============================================================

#include "platform.hpp"
#include <string>
#include <vector>

namespace base64 {

// Length of the encoded text for n raw bytes
inline u64 encoded_length(u64 n) {
    return ((n + 2) / 3) * 4;
}

std::string encode(const u8* data, size_t len);

inline std::string encode(const std::vector<u8>& data) {
    return encode(data.data(), data.size());
}

// Throws std::invalid_argument on characters outside the alphabet,
// misplaced padding or a length that is not a multiple of 4.
std::vector<u8> decode(const std::string& text);

} // namespace base64
