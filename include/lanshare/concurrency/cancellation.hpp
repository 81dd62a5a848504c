#pragma once

#include <atomic>
#include <memory>

namespace lanshare::concurrency {

/**
 * @brief Cooperative stop flag shared between a caller and running transfers
 *
 * Engines poll it between chunks, before retry sleeps and between batches.
 * Nothing is interrupted mid-write.
 */
class CancellationToken {
public:
    void cancel() noexcept { cancelled_.store(true, std::memory_order_release); }
    bool is_cancelled() const noexcept { return cancelled_.load(std::memory_order_acquire); }

    static std::shared_ptr<CancellationToken> create() {
        return std::make_shared<CancellationToken>();
    }

private:
    std::atomic<bool> cancelled_{false};
};

using CancellationTokenPtr = std::shared_ptr<CancellationToken>;

inline bool is_cancelled(const CancellationTokenPtr& token) {
    return token && token->is_cancelled();
}

} // namespace lanshare::concurrency
