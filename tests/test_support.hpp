#pragma once

#include "lanshare/server/share_server.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace lanshare::testing {

/**
 * @brief Directory under the system temp dir, removed on destruction
 */
class TempDir {
public:
    explicit TempDir(const std::string& prefix = "lanshare_test");
    ~TempDir();

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }
    std::filesystem::path operator/(const std::string& relative) const { return path_ / relative; }

private:
    std::filesystem::path path_;
};

/// Write `content` to `path`, creating parent directories
void write_file(const std::filesystem::path& path, const std::string& content);

std::string read_file(const std::filesystem::path& path);

/// Deterministic pseudo-random bytes, handy for ranged transfers
std::string pattern_bytes(size_t size, unsigned seed = 7);

/// Body of a response, running its body writer when streamed
std::string collect_body(const network::HttpResponse& response);

struct ZipEntry {
    std::string name;
    std::string data;       // Inflated content, empty for directories
    uint32_t crc = 0;       // As recorded in the central directory
    uint16_t flags = 0;     // General purpose bits from the central directory
};

/**
 * @brief Minimal reader for archives without ZIP64 records
 *
 * Walks the central directory, inflates each entry and fails the current
 * test (returning what it has so far) on any structural problem.
 */
std::vector<ZipEntry> read_zip(const std::filesystem::path& path);

/**
 * @brief A ShareServer over `root` on an ephemeral loopback port
 */
class RunningServer {
public:
    explicit RunningServer(const std::filesystem::path& root,
                           server::ServerOptions options = server::ServerOptions{},
                           events::EventBus* bus = nullptr);
    ~RunningServer();

    uint16_t port() const { return server_->port(); }
    server::ShareServer& server() { return *server_; }

private:
    std::unique_ptr<server::ShareServer> server_;
};

} // namespace lanshare::testing
