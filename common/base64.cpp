// ============================================================
// base64.cpp
// ============================================================

#include "base64.hpp"
#include <array>
#include <stdexcept>

namespace {

const char kAlphabet[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

// 0xFF = not in alphabet
std::array<u8, 256> build_reverse_table() {
    std::array<u8, 256> t{};
    t.fill(0xFF);
    for (u8 i = 0; i < 64; ++i) {
        t[(u8)kAlphabet[i]] = i;
    }
    return t;
}

const std::array<u8, 256>& reverse_table() {
    static const std::array<u8, 256> table = build_reverse_table();
    return table;
}

} // namespace

namespace base64 {

std::string encode(const u8* data, size_t len) {
    std::string out;
    out.resize((size_t)encoded_length(len));

    size_t i = 0, o = 0;
    while (i + 3 <= len) {
        u32 v = ((u32)data[i] << 16) | ((u32)data[i + 1] << 8) | data[i + 2];
        out[o++] = kAlphabet[(v >> 18) & 0x3F];
        out[o++] = kAlphabet[(v >> 12) & 0x3F];
        out[o++] = kAlphabet[(v >> 6) & 0x3F];
        out[o++] = kAlphabet[v & 0x3F];
        i += 3;
    }

    size_t rest = len - i;
    if (rest == 1) {
        u32 v = (u32)data[i] << 16;
        out[o++] = kAlphabet[(v >> 18) & 0x3F];
        out[o++] = kAlphabet[(v >> 12) & 0x3F];
        out[o++] = '=';
        out[o++] = '=';
    } else if (rest == 2) {
        u32 v = ((u32)data[i] << 16) | ((u32)data[i + 1] << 8);
        out[o++] = kAlphabet[(v >> 18) & 0x3F];
        out[o++] = kAlphabet[(v >> 12) & 0x3F];
        out[o++] = kAlphabet[(v >> 6) & 0x3F];
        out[o++] = '=';
    }
    return out;
}

std::vector<u8> decode(const std::string& text) {
    if (text.size() % 4 != 0) {
        throw std::invalid_argument("base64: length " + std::to_string(text.size()) +
                                    " is not a multiple of 4");
    }
    const auto& rev = reverse_table();

    std::vector<u8> out;
    out.reserve(text.size() / 4 * 3);

    for (size_t i = 0; i < text.size(); i += 4) {
        bool last_quad = (i + 4 == text.size());
        u32 v = 0;
        int pad = 0;
        for (size_t k = 0; k < 4; ++k) {
            char c = text[i + k];
            if (c == '=') {
                // Padding only in the last two positions of the final quad
                if (!last_quad || k < 2) {
                    throw std::invalid_argument("base64: misplaced padding at offset " +
                                                std::to_string(i + k));
                }
                ++pad;
                v <<= 6;
                continue;
            }
            if (pad > 0) {
                throw std::invalid_argument("base64: data after padding at offset " +
                                            std::to_string(i + k));
            }
            u8 d = rev[(u8)c];
            if (d == 0xFF) {
                throw std::invalid_argument("base64: invalid character at offset " +
                                            std::to_string(i + k));
            }
            v = (v << 6) | d;
        }
        out.push_back((u8)(v >> 16));
        if (pad < 2) out.push_back((u8)(v >> 8));
        if (pad < 1) out.push_back((u8)v);
    }
    return out;
}

} // namespace base64
