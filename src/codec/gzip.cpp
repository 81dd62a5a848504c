#include "lanshare/codec/gzip.hpp"

#include <zlib.h>

#include <algorithm>
#include <climits>

namespace lanshare::codec {

namespace {

constexpr int kGzipWindowBits = 15 + 16;    // gzip wrapper on output
constexpr int kAutoWindowBits = 15 + 32;    // accept gzip or zlib on input
constexpr size_t kChunk = 64 * 1024;

} // namespace

Result<std::vector<uint8_t>> gzip_compress(const uint8_t* data, size_t length, int level) {
    if (level < 1 || level > 9) {
        level = 6;
    }
    if (length > UINT_MAX) {
        return Err<std::vector<uint8_t>>(std::string("Input too large for single-shot gzip"));
    }

    z_stream stream{};
    if (deflateInit2(&stream, level, Z_DEFLATED, kGzipWindowBits, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
        return Err<std::vector<uint8_t>>(std::string("deflateInit2 failed"));
    }

    std::vector<uint8_t> out(deflateBound(&stream, static_cast<uLong>(length)));
    stream.next_in = const_cast<Bytef*>(data);
    stream.avail_in = static_cast<uInt>(length);
    stream.next_out = out.data();
    stream.avail_out = static_cast<uInt>(out.size());

    int rc = deflate(&stream, Z_FINISH);
    const size_t produced = out.size() - stream.avail_out;
    deflateEnd(&stream);

    if (rc != Z_STREAM_END) {
        return Err<std::vector<uint8_t>>("deflate failed: " + std::to_string(rc));
    }

    out.resize(produced);
    return Ok(std::move(out));
}

Result<std::vector<uint8_t>> gzip_decompress(const uint8_t* data, size_t length, size_t max_output) {
    if (length > UINT_MAX) {
        return Err<std::vector<uint8_t>>(std::string("Input too large"));
    }

    z_stream stream{};
    if (inflateInit2(&stream, kAutoWindowBits) != Z_OK) {
        return Err<std::vector<uint8_t>>(std::string("inflateInit2 failed"));
    }

    stream.next_in = const_cast<Bytef*>(data);
    stream.avail_in = static_cast<uInt>(length);

    std::vector<uint8_t> out;
    std::vector<uint8_t> chunk(kChunk);
    int rc = Z_OK;
    while (rc != Z_STREAM_END) {
        stream.next_out = chunk.data();
        stream.avail_out = static_cast<uInt>(chunk.size());
        rc = inflate(&stream, Z_NO_FLUSH);
        if (rc != Z_OK && rc != Z_STREAM_END) {
            std::string message = stream.msg ? stream.msg : "error " + std::to_string(rc);
            inflateEnd(&stream);
            return Err<std::vector<uint8_t>>("inflate failed: " + message);
        }
        const size_t produced = chunk.size() - stream.avail_out;
        if (out.size() + produced > max_output) {
            inflateEnd(&stream);
            return Err<std::vector<uint8_t>>(std::string("Decompressed data exceeds limit"));
        }
        out.insert(out.end(), chunk.begin(), chunk.begin() + static_cast<std::ptrdiff_t>(produced));

        if (rc == Z_OK && produced == 0 && stream.avail_in == 0) {
            inflateEnd(&stream);
            return Err<std::vector<uint8_t>>(std::string("Truncated gzip stream"));
        }
    }

    inflateEnd(&stream);
    return Ok(std::move(out));
}

} // namespace lanshare::codec
