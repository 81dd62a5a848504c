#pragma once

#include "lanshare/core/result.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace lanshare::client {

/**
 * @brief Phases of one file transfer
 *
 *   Start ──► ResumeCheck ──► Streaming ──► Complete
 *     │                         │  ▲
 *     └──────────► Streaming    ▼  │
 *                            Retrying
 *   Any non-terminal phase may go to Failed.
 */
enum class TransferPhase {
    Start,
    ResumeCheck,
    Streaming,
    Retrying,
    Complete,
    Failed
};

const char* transfer_phase_name(TransferPhase phase);

struct TransferState {
    std::string remote_path;
    std::string local_path;
    uint64_t bytes_done = 0;
    uint64_t total_bytes = 0;
    uint64_t resumable_offset = 0;
    std::string etag;
    uint32_t retries_used = 0;
    TransferPhase phase = TransferPhase::Start;
    std::string last_error;
};

/**
 * @brief Owns the TransferState of one transfer and guards its phase changes
 *
 * Only the thread running the transfer touches a session.
 */
class TransferSession {
public:
    TransferSession(std::string remote_path, std::string local_path);

    [[nodiscard]] const TransferState& state() const noexcept { return state_; }
    [[nodiscard]] TransferPhase phase() const noexcept { return state_.phase; }
    [[nodiscard]] bool is_terminal() const noexcept {
        return state_.phase == TransferPhase::Complete || state_.phase == TransferPhase::Failed;
    }

    Result<void> transition_to(TransferPhase next);
    Result<void> mark_failed(std::string error_message);

    /**
     * @brief Begin streaming a response: resume offset plus declared remaining length
     */
    void begin_stream(uint64_t resume_offset, uint64_t remaining_bytes, std::string etag);

    void add_bytes(uint64_t count) { state_.bytes_done += count; }

    /// Counts one retry and records why
    void note_retry(std::string reason);

    [[nodiscard]] std::chrono::steady_clock::time_point started_at() const noexcept { return started_at_; }

private:
    [[nodiscard]] bool can_transition(TransferPhase target) const noexcept;

    TransferState state_;
    std::chrono::steady_clock::time_point started_at_;
};

} // namespace lanshare::client
