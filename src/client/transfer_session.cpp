#include "lanshare/client/transfer_session.hpp"

#include <algorithm>
#include <unordered_map>
#include <vector>

namespace lanshare::client {
namespace {

bool is_allowed(TransferPhase current, TransferPhase target) {
    static const std::unordered_map<TransferPhase, std::vector<TransferPhase>> transitions {
        {TransferPhase::Start, {TransferPhase::ResumeCheck, TransferPhase::Streaming}},
        {TransferPhase::ResumeCheck, {TransferPhase::Streaming, TransferPhase::Complete, TransferPhase::Retrying}},
        {TransferPhase::Streaming, {TransferPhase::Complete, TransferPhase::Retrying}},
        {TransferPhase::Retrying, {TransferPhase::ResumeCheck, TransferPhase::Streaming}},
    };

    if (target == TransferPhase::Failed) {
        return current != TransferPhase::Complete;
    }

    const auto it = transitions.find(current);
    if (it == transitions.end()) {
        return false;
    }
    return std::find(it->second.begin(), it->second.end(), target) != it->second.end();
}

} // namespace

const char* transfer_phase_name(TransferPhase phase) {
    switch (phase) {
        case TransferPhase::Start: return "start";
        case TransferPhase::ResumeCheck: return "resume-check";
        case TransferPhase::Streaming: return "streaming";
        case TransferPhase::Retrying: return "retrying";
        case TransferPhase::Complete: return "complete";
        case TransferPhase::Failed: return "failed";
    }
    return "unknown";
}

TransferSession::TransferSession(std::string remote_path, std::string local_path)
    : started_at_(std::chrono::steady_clock::now()) {
    state_.remote_path = std::move(remote_path);
    state_.local_path = std::move(local_path);
}

Result<void> TransferSession::transition_to(TransferPhase next) {
    if (state_.phase == next) {
        return Ok();
    }

    if (!can_transition(next)) {
        return Err<void>(std::string("Illegal transfer transition ") +
                         transfer_phase_name(state_.phase) + " -> " + transfer_phase_name(next));
    }

    state_.phase = next;
    return Ok();
}

Result<void> TransferSession::mark_failed(std::string error_message) {
    state_.last_error = std::move(error_message);
    return transition_to(TransferPhase::Failed);
}

void TransferSession::begin_stream(uint64_t resume_offset, uint64_t remaining_bytes, std::string etag) {
    state_.resumable_offset = resume_offset;
    state_.bytes_done = resume_offset;
    state_.total_bytes = resume_offset + remaining_bytes;
    state_.etag = std::move(etag);
}

void TransferSession::note_retry(std::string reason) {
    ++state_.retries_used;
    state_.last_error = std::move(reason);
}

bool TransferSession::can_transition(TransferPhase target) const noexcept {
    return is_allowed(state_.phase, target);
}

} // namespace lanshare::client
