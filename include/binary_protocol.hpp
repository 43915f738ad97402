#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "errors.hpp"

namespace asrstream {

constexpr uint8_t PROTOCOL_VERSION = 0b0001;
constexpr uint8_t HEADER_WORDS = 1;          // 头部长度，单位4字节
constexpr size_t HEADER_SIZE = 4;

enum class MessageType : uint8_t {
    FULL_REQUEST = 0b0001,
    AUDIO_ONLY_REQUEST = 0b0010,
    FULL_RESPONSE = 0b1001,
    ERROR_RESPONSE = 0b1111
};

enum class Serialization : uint8_t {
    RAW = 0b0000,
    JSON = 0b0001
};

enum class Compression : uint8_t {
    NONE = 0b0000,
    GZIP = 0b0001
};

// message type specific flags
namespace flags {
constexpr uint8_t HAS_SEQUENCE = 0b0001;
constexpr uint8_t LAST_PACKAGE = 0b0010;
constexpr uint8_t HAS_EVENT = 0b0100;
constexpr uint8_t RESERVED = 0b1000;
} // namespace flags

struct Frame {
    uint8_t version{PROTOCOL_VERSION};
    MessageType message_type{MessageType::FULL_REQUEST};
    Serialization serialization{Serialization::JSON};
    Compression compression{Compression::GZIP};
    uint8_t flags{flags::HAS_SEQUENCE};
    int32_t sequence{0};          // flags & HAS_SEQUENCE 时有效
    int32_t event{0};             // flags & HAS_EVENT 时有效
    uint32_t error_code{0};       // 仅 ERROR_RESPONSE
    std::vector<uint8_t> payload;

    bool has_sequence() const { return (flags & flags::HAS_SEQUENCE) != 0; }
    bool is_last() const { return (flags & flags::LAST_PACKAGE) != 0; }
    bool has_event() const { return (flags & flags::HAS_EVENT) != 0; }

    bool operator==(const Frame& other) const;
    bool operator!=(const Frame& other) const { return !(*this == other); }
};

// 客户端请求帧，sequence 为负时带 LAST_PACKAGE 标志
Frame make_request_frame(MessageType type, int32_t sequence,
                         Serialization serialization, Compression compression,
                         std::vector<uint8_t> payload);

class FrameCodec {
public:
    static std::vector<uint8_t> encode(const Frame& frame);

    static Result<Frame> decode(const uint8_t* data, size_t size);
    static Result<Frame> decode(const std::vector<uint8_t>& data) {
        return decode(data.data(), data.size());
    }
};

// 辅助函数
std::string to_string(MessageType type);
std::string to_string(Serialization kind);
std::string to_string(Compression kind);

} // namespace asrstream
