#include "test_support.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <fstream>
#include <random>
#include <sstream>
#include <system_error>
#include <unistd.h>
#include <zlib.h>

namespace fs = std::filesystem;

namespace lanshare::testing {

TempDir::TempDir(const std::string& prefix) {
    static std::atomic<uint64_t> counter{0};
    path_ = fs::temp_directory_path() /
            (prefix + "_" + std::to_string(::getpid()) + "_" + std::to_string(counter.fetch_add(1)));
    fs::remove_all(path_);
    fs::create_directories(path_);
}

TempDir::~TempDir() {
    std::error_code ec;
    fs::remove_all(path_, ec);
}

void write_file(const fs::path& path, const std::string& content) {
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path());
    }
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

std::string read_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::ostringstream oss;
    oss << in.rdbuf();
    return oss.str();
}

std::string pattern_bytes(size_t size, unsigned seed) {
    std::mt19937 rng(seed);
    std::string bytes(size, '\0');
    for (auto& c : bytes) {
        c = static_cast<char>(rng() & 0xFF);
    }
    return bytes;
}

std::string collect_body(const network::HttpResponse& response) {
    if (!response.is_streamed()) {
        return std::string(response.body.begin(), response.body.end());
    }
    std::string body;
    auto written = response.body_writer([&body](const uint8_t* data, size_t length) -> Result<void> {
        body.append(reinterpret_cast<const char*>(data), length);
        return Ok();
    });
    EXPECT_TRUE(written.is_ok()) << (written.is_error() ? written.error() : "");
    return body;
}

namespace {

uint32_t le32(const std::string& bytes, size_t at) {
    return static_cast<uint32_t>(static_cast<uint8_t>(bytes[at])) |
           static_cast<uint32_t>(static_cast<uint8_t>(bytes[at + 1])) << 8 |
           static_cast<uint32_t>(static_cast<uint8_t>(bytes[at + 2])) << 16 |
           static_cast<uint32_t>(static_cast<uint8_t>(bytes[at + 3])) << 24;
}

uint16_t le16(const std::string& bytes, size_t at) {
    return static_cast<uint16_t>(static_cast<uint8_t>(bytes[at]) |
                                 static_cast<uint8_t>(bytes[at + 1]) << 8);
}

std::string inflate_raw(const std::string& compressed, size_t expected) {
    std::string out(expected, '\0');
    z_stream stream{};
    if (inflateInit2(&stream, -MAX_WBITS) != Z_OK) {
        ADD_FAILURE() << "inflateInit2 failed";
        return {};
    }
    stream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(compressed.data()));
    stream.avail_in = static_cast<uInt>(compressed.size());
    stream.next_out = reinterpret_cast<Bytef*>(out.data());
    stream.avail_out = static_cast<uInt>(out.size());
    const int rc = inflate(&stream, Z_FINISH);
    inflateEnd(&stream);
    EXPECT_EQ(rc, Z_STREAM_END);
    return out;
}

} // namespace

std::vector<ZipEntry> read_zip(const fs::path& path) {
    std::vector<ZipEntry> entries;
    const std::string bytes = read_file(path);
    if (bytes.size() < 22) {
        ADD_FAILURE() << path << " is too small to be a zip archive";
        return entries;
    }

    const size_t eocd = bytes.rfind(std::string("PK\x05\x06", 4));
    if (eocd == std::string::npos || eocd + 22 > bytes.size()) {
        ADD_FAILURE() << "No end of central directory record in " << path;
        return entries;
    }
    const uint16_t count = le16(bytes, eocd + 10);
    size_t pos = le32(bytes, eocd + 16);

    for (uint16_t i = 0; i < count; ++i) {
        if (pos + 46 > bytes.size() || le32(bytes, pos) != 0x02014b50) {
            ADD_FAILURE() << "Bad central directory record " << i;
            return entries;
        }
        const uint16_t method = le16(bytes, pos + 10);
        const uint32_t crc = le32(bytes, pos + 16);
        const uint32_t compressed_size = le32(bytes, pos + 20);
        const uint32_t size = le32(bytes, pos + 24);
        const uint16_t name_len = le16(bytes, pos + 28);
        const uint16_t extra_len = le16(bytes, pos + 30);
        const uint16_t comment_len = le16(bytes, pos + 32);
        const uint32_t local = le32(bytes, pos + 42);

        ZipEntry entry;
        entry.name = bytes.substr(pos + 46, name_len);
        entry.crc = crc;
        entry.flags = le16(bytes, pos + 8);

        const size_t data_at = local + 30 + le16(bytes, local + 26) + le16(bytes, local + 28);
        const std::string raw = bytes.substr(data_at, compressed_size);
        entry.data = method == 8 ? inflate_raw(raw, size) : raw;

        const uLong actual = crc32(crc32(0L, Z_NULL, 0),
                                   reinterpret_cast<const Bytef*>(entry.data.data()),
                                   static_cast<uInt>(entry.data.size()));
        EXPECT_EQ(static_cast<uint32_t>(actual), crc) << entry.name;

        entries.push_back(std::move(entry));
        pos += 46 + name_len + extra_len + comment_len;
    }
    return entries;
}

RunningServer::RunningServer(const fs::path& root, server::ServerOptions options, events::EventBus* bus) {
    options.root = root;
    options.port = 0;
    options.address = "127.0.0.1";
    if (options.http.worker_threads == 0) {
        options.http.worker_threads = 4;
    }
    server_ = std::make_unique<server::ShareServer>(options, bus);
    auto started = server_->start();
    EXPECT_TRUE(started.is_ok()) << (started.is_error() ? started.error() : "");
}

RunningServer::~RunningServer() {
    server_->stop();
}

} // namespace lanshare::testing
