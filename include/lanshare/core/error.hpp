#pragma once

/**
 * @file error.hpp
 * @brief Failure taxonomy shared by the server streamers and client engines
 *
 * Every public transfer operation returns Result<T, Error>. The code drives
 * recovery (retry, fallback, cleanup); the message is what the caller shows.
 */

#include "lanshare/core/result.hpp"

#include <string>

namespace lanshare {

enum class ErrorCode {
    Timeout,               // Peer did not answer within the operation deadline
    Unreachable,           // Refused, unreachable, name lookup failed, dropped mid-transfer, busy
    Forbidden,             // Path escapes the shared root
    NotFound,              // Requested file or root does not exist
    MalformedResponse,     // Peer answered with something we cannot interpret
    DecompressionFailure,  // Compressed body could not be decoded
    PartialWriteFailure,   // Local disk write failed
    RetriesExhausted,      // Retryable failure persisted past the retry budget
    Cancelled,             // Caller requested cooperative cancellation
    Unexpected             // Anything else
};

struct Error {
    ErrorCode code = ErrorCode::Unexpected;
    std::string message;

    Error() = default;
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}
};

template<typename T>
using Outcome = Result<T, Error>;

const char* error_code_name(ErrorCode code);

/**
 * @brief Connection-level failures that a retry may cure
 */
inline bool is_retryable(ErrorCode code) {
    return code == ErrorCode::Timeout || code == ErrorCode::Unreachable;
}

template<typename T>
Outcome<T> Fail(ErrorCode code, std::string message) {
    return Err<T>(Error(code, std::move(message)));
}

} // namespace lanshare
