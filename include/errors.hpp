#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace asrstream {

enum class ErrorCode {
    NONE,
    // 单帧解码错误，可恢复
    TRUNCATED,
    UNSUPPORTED_VERSION,
    MALFORMED_HEADER,
    DECOMPRESSION_FAILED,
    MALFORMED_PAYLOAD,
    // 调用方错误
    INVALID_STATE,
    INVALID_CONFIG,
    // 会话终止错误
    TRANSPORT_CLOSED,
    CONNECT_FAILED,
    CONNECT_TIMEOUT,
    ACK_TIMEOUT,
    FINAL_TIMEOUT,
    CAPTURE_STARVATION,
    SERVER_ERROR,
    CANCELLED,
    INTERNAL_ERROR      // 本地未预期的异常
};

std::string to_string(ErrorCode code);

// 只影响单个入站帧的错误，会话可以继续
bool is_recoverable(ErrorCode code);

struct ProtocolError {
    ErrorCode code{ErrorCode::NONE};
    std::string reason;
};

// 携带错误码的异常，用于状态错误和传输层失败
class AsrError : public std::runtime_error {
public:
    AsrError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

template <typename T>
class Result {
public:
    Result(T value) : value_(std::move(value)) {}
    Result(ProtocolError error) : error_(std::move(error)) {}

    bool ok() const { return value_.has_value(); }
    explicit operator bool() const { return ok(); }

    const T& value() const { return *value_; }
    T& value() { return *value_; }
    const ProtocolError& error() const { return error_; }

private:
    std::optional<T> value_;
    ProtocolError error_;
};

} // namespace asrstream
