#pragma once

#include "lanshare/core/result.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace lanshare::codec {

/**
 * @brief Compress into a gzip member (RFC 1952)
 *
 * @param level zlib level 1..9; out-of-range values fall back to 6
 */
Result<std::vector<uint8_t>> gzip_compress(const uint8_t* data, size_t length, int level = 6);

inline Result<std::vector<uint8_t>> gzip_compress(const std::string& text, int level = 6) {
    return gzip_compress(reinterpret_cast<const uint8_t*>(text.data()), text.size(), level);
}

/**
 * @brief Decompress gzip or zlib-wrapped data
 *
 * @param max_output Refuse to inflate beyond this many bytes
 */
Result<std::vector<uint8_t>> gzip_decompress(const uint8_t* data, size_t length,
                                             size_t max_output = 256 * 1024 * 1024);

inline Result<std::vector<uint8_t>> gzip_decompress(const std::vector<uint8_t>& data) {
    return gzip_decompress(data.data(), data.size());
}

/**
 * @brief True when the buffer starts with the gzip magic bytes
 */
inline bool looks_like_gzip(const uint8_t* data, size_t length) {
    return length >= 2 && data[0] == 0x1f && data[1] == 0x8b;
}

} // namespace lanshare::codec
