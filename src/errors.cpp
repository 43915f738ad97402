#include "errors.hpp"

namespace asrstream {

std::string to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::NONE: return "none";
        case ErrorCode::TRUNCATED: return "truncated";
        case ErrorCode::UNSUPPORTED_VERSION: return "unsupported_version";
        case ErrorCode::MALFORMED_HEADER: return "malformed_header";
        case ErrorCode::DECOMPRESSION_FAILED: return "decompression_failed";
        case ErrorCode::MALFORMED_PAYLOAD: return "malformed_payload";
        case ErrorCode::INVALID_STATE: return "invalid_state";
        case ErrorCode::INVALID_CONFIG: return "invalid_config";
        case ErrorCode::TRANSPORT_CLOSED: return "transport_closed";
        case ErrorCode::CONNECT_FAILED: return "connect_failed";
        case ErrorCode::CONNECT_TIMEOUT: return "connect_timeout";
        case ErrorCode::ACK_TIMEOUT: return "ack_timeout";
        case ErrorCode::FINAL_TIMEOUT: return "final_timeout";
        case ErrorCode::CAPTURE_STARVATION: return "capture_starvation";
        case ErrorCode::SERVER_ERROR: return "server_error";
        case ErrorCode::CANCELLED: return "cancelled";
        case ErrorCode::INTERNAL_ERROR: return "internal_error";
        default: return "unknown";
    }
}

bool is_recoverable(ErrorCode code) {
    switch (code) {
        case ErrorCode::TRUNCATED:
        case ErrorCode::UNSUPPORTED_VERSION:
        case ErrorCode::MALFORMED_HEADER:
        case ErrorCode::DECOMPRESSION_FAILED:
        case ErrorCode::MALFORMED_PAYLOAD:
            return true;
        default:
            return false;
    }
}

} // namespace asrstream
