#include "lanshare/core/error.hpp"

namespace lanshare {

const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::Timeout: return "Timeout";
        case ErrorCode::Unreachable: return "Unreachable";
        case ErrorCode::Forbidden: return "Forbidden";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::MalformedResponse: return "MalformedResponse";
        case ErrorCode::DecompressionFailure: return "DecompressionFailure";
        case ErrorCode::PartialWriteFailure: return "PartialWriteFailure";
        case ErrorCode::RetriesExhausted: return "RetriesExhausted";
        case ErrorCode::Cancelled: return "Cancelled";
        case ErrorCode::Unexpected: return "Unexpected";
    }
    return "Unexpected";
}

} // namespace lanshare
