/**
 * @file events.hpp
 * @brief Event type definitions for the share server and download engines
 *
 * NAMING CONVENTION:
 * - Events are past-tense: IndexRebuiltEvent, FileDownloadCompletedEvent
 */

#pragma once

#include "lanshare/core/error.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace lanshare::events {

// ════════════════════════════════════════════════════════
// Server Events
// ════════════════════════════════════════════════════════

struct ServerStartedEvent {
    uint16_t port;
    std::string address;
    std::string root;
    std::chrono::system_clock::time_point timestamp;

    ServerStartedEvent(uint16_t p, std::string addr, std::string r)
        : port(p),
          address(std::move(addr)),
          root(std::move(r)),
          timestamp(std::chrono::system_clock::now())
    {}
};

struct ServerShuttingDownEvent {
    std::string reason;
    std::chrono::system_clock::time_point timestamp;

    explicit ServerShuttingDownEvent(std::string r = "normal shutdown")
        : reason(std::move(r)),
          timestamp(std::chrono::system_clock::now())
    {}
};

/**
 * @brief Emitted when the directory indexer walked a root instead of reusing its snapshot
 *
 * WHO SUBSCRIBES:
 * - Logger
 * - Metrics (rebuild count, walk time)
 */
struct IndexRebuiltEvent {
    std::string root;
    size_t entry_count = 0;
    size_t skipped = 0;                       // Entries dropped by permission or I/O errors
    bool used_fallback_walk = false;
    std::chrono::milliseconds duration{0};
};

// ════════════════════════════════════════════════════════
// Client Events
// ════════════════════════════════════════════════════════

/**
 * @brief One listing attempt against a remote endpoint
 *
 * This is the hook for connection-history persistence: the engine only
 * reports attempts, a subscriber stores them.
 */
struct EndpointAttemptEvent {
    std::string host;
    uint16_t port = 0;
    bool success = false;
    size_t file_count = 0;
    std::string error;
    std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();
};

struct ListingFetchedEvent {
    std::string endpoint;
    size_t entry_count = 0;
    bool compressed = false;
    uint64_t body_bytes = 0;
};

struct DownloadStartedEvent {
    std::string remote_path;
    std::string local_path;
    uint64_t resume_offset = 0;
};

struct DownloadRetryEvent {
    std::string remote_path;
    uint32_t attempt = 0;                     // 1-based retry number
    std::chrono::milliseconds delay{0};
    std::string reason;
};

struct FileDownloadCompletedEvent {
    std::string remote_path;
    std::string local_path;
    uint64_t total_bytes = 0;
    uint64_t transferred_bytes = 0;           // Excludes bytes reused from a partial
    bool already_up_to_date = false;
    std::chrono::milliseconds duration{0};
};

struct FileDownloadFailedEvent {
    std::string remote_path;
    ErrorCode code = ErrorCode::Unexpected;
    std::string message;
};

struct BatchCompletedEvent {
    size_t succeeded = 0;
    size_t failed = 0;
    std::chrono::milliseconds duration{0};
};

} // namespace lanshare::events
