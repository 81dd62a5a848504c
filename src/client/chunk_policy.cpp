#include "lanshare/client/chunk_policy.hpp"

#include <algorithm>

namespace lanshare::client {

namespace {
constexpr size_t KB = 1024;
constexpr size_t MB = 1024 * 1024;
}

ChunkPolicy file_chunk_policy() {
    return ChunkPolicy{32 * KB, 8 * MB, 100.0 * KB, 10.0 * MB, 10};
}

ChunkPolicy archive_chunk_policy() {
    return ChunkPolicy{1 * MB, 8 * MB, 1.0 * MB, 20.0 * MB, 5};
}

size_t initial_chunk_size(uint64_t total_bytes) {
    if (total_bytes < 1 * MB) {
        return 64 * KB;
    }
    if (total_bytes < 100 * MB) {
        return 1 * MB;
    }
    return 4 * MB;
}

size_t next_chunk_size(size_t current, double throughput, const ChunkPolicy& policy) {
    if (throughput < policy.slow_bytes_per_sec) {
        return std::max(policy.floor, current / 2);
    }
    if (throughput > policy.fast_bytes_per_sec) {
        return std::min(policy.ceiling, current * 2);
    }
    return current;
}

std::chrono::milliseconds backoff_delay(uint32_t attempt, const BackoffPolicy& policy) {
    // 2^30 base units already exceeds any sensible cap
    const uint32_t exponent = std::min<uint32_t>(attempt, 30);
    const auto scaled = policy.base.count() * (int64_t{1} << exponent);
    return std::chrono::milliseconds(std::min<int64_t>(scaled, policy.cap.count()));
}

} // namespace lanshare::client
