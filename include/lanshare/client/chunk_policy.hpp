#pragma once

/**
 * @file chunk_policy.hpp
 * @brief Read-size and retry-delay rules for client transfers
 *
 * Both are pure functions of their inputs so the download loops stay free of
 * tuning logic and the rules can be tested without a network.
 */

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace lanshare::client {

struct ChunkPolicy {
    size_t floor;                 ///< Never shrink below this
    size_t ceiling;               ///< Never grow above this
    double slow_bytes_per_sec;    ///< Below: halve
    double fast_bytes_per_sec;    ///< Above: double
    size_t ramp_chunks;           ///< Chunks worth of bytes before adapting
};

/// 32 KB..8 MB, halve below 100 KB/s, double above 10 MB/s, after 10 chunks
ChunkPolicy file_chunk_policy();

/// 1 MB..8 MB, halve below 1 MB/s, double above 20 MB/s, after 5 chunks
ChunkPolicy archive_chunk_policy();

/**
 * @brief Starting read size by total transfer size: 64 KB, 1 MB or 4 MB
 */
size_t initial_chunk_size(uint64_t total_bytes);

/**
 * @brief Chunk size after observing `throughput` bytes per second
 */
size_t next_chunk_size(size_t current, double throughput, const ChunkPolicy& policy);

struct BackoffPolicy {
    std::chrono::milliseconds base{1000};
    std::chrono::milliseconds cap{10000};
};

/**
 * @brief Delay before retry number `attempt` (1-based): min(base * 2^attempt, cap)
 */
std::chrono::milliseconds backoff_delay(uint32_t attempt, const BackoffPolicy& policy);

} // namespace lanshare::client
