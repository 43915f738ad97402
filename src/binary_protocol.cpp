#include "binary_protocol.hpp"

namespace asrstream {

namespace {

void put_u32(std::vector<uint8_t>& out, uint32_t value) {
    out.push_back(static_cast<uint8_t>(value >> 24));
    out.push_back(static_cast<uint8_t>((value >> 16) & 0xFF));
    out.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
    out.push_back(static_cast<uint8_t>(value & 0xFF));
}

uint32_t get_u32(const uint8_t* p) {
    return static_cast<uint32_t>(p[0]) << 24 |
           static_cast<uint32_t>(p[1]) << 16 |
           static_cast<uint32_t>(p[2]) << 8 |
           static_cast<uint32_t>(p[3]);
}

bool valid_message_type(uint8_t value) {
    switch (static_cast<MessageType>(value)) {
        case MessageType::FULL_REQUEST:
        case MessageType::AUDIO_ONLY_REQUEST:
        case MessageType::FULL_RESPONSE:
        case MessageType::ERROR_RESPONSE:
            return true;
    }
    return false;
}

bool valid_serialization(uint8_t value) {
    return value == static_cast<uint8_t>(Serialization::RAW) ||
           value == static_cast<uint8_t>(Serialization::JSON);
}

bool valid_compression(uint8_t value) {
    return value == static_cast<uint8_t>(Compression::NONE) ||
           value == static_cast<uint8_t>(Compression::GZIP);
}

ProtocolError truncated(const std::string& field, size_t need, size_t have) {
    return {ErrorCode::TRUNCATED,
            "truncated " + field + ": need " + std::to_string(need) +
                " bytes, have " + std::to_string(have)};
}

} // namespace

bool Frame::operator==(const Frame& other) const {
    return version == other.version &&
           message_type == other.message_type &&
           serialization == other.serialization &&
           compression == other.compression &&
           flags == other.flags &&
           (!has_sequence() || sequence == other.sequence) &&
           (!has_event() || event == other.event) &&
           (message_type != MessageType::ERROR_RESPONSE || error_code == other.error_code) &&
           payload == other.payload;
}

Frame make_request_frame(MessageType type, int32_t sequence,
                         Serialization serialization, Compression compression,
                         std::vector<uint8_t> payload) {
    Frame frame;
    frame.message_type = type;
    frame.serialization = serialization;
    frame.compression = compression;
    frame.flags = flags::HAS_SEQUENCE;
    if (sequence < 0) {
        frame.flags |= flags::LAST_PACKAGE;
    }
    frame.sequence = sequence;
    frame.payload = std::move(payload);
    return frame;
}

std::vector<uint8_t> FrameCodec::encode(const Frame& frame) {
    std::vector<uint8_t> result;
    result.reserve(HEADER_SIZE + 16 + frame.payload.size());

    result.push_back(static_cast<uint8_t>(frame.version << 4 | HEADER_WORDS));
    result.push_back(static_cast<uint8_t>(static_cast<uint8_t>(frame.message_type) << 4 |
                                          (frame.flags & 0x0F)));
    result.push_back(static_cast<uint8_t>(static_cast<uint8_t>(frame.serialization) << 4 |
                                          static_cast<uint8_t>(frame.compression)));
    result.push_back(0x00);

    if (frame.has_sequence()) {
        put_u32(result, static_cast<uint32_t>(frame.sequence));
    }
    if (frame.has_event()) {
        put_u32(result, static_cast<uint32_t>(frame.event));
    }
    if (frame.message_type == MessageType::ERROR_RESPONSE) {
        put_u32(result, frame.error_code);
    }
    put_u32(result, static_cast<uint32_t>(frame.payload.size()));
    // Copy payload
    result.insert(result.end(), frame.payload.begin(), frame.payload.end());

    return result;
}

Result<Frame> FrameCodec::decode(const uint8_t* data, size_t size) {
    if (size < HEADER_SIZE) {
        return truncated("header", HEADER_SIZE, size);
    }

    Frame frame;
    frame.version = data[0] >> 4;
    if (frame.version != PROTOCOL_VERSION) {
        return ProtocolError{ErrorCode::UNSUPPORTED_VERSION,
                             "unsupported protocol version " + std::to_string(frame.version)};
    }

    // 头部可能带扩展字，直接跳过
    size_t header_size = static_cast<size_t>(data[0] & 0x0F) * 4;
    if (header_size < HEADER_SIZE) {
        return ProtocolError{ErrorCode::MALFORMED_HEADER,
                             "header size " + std::to_string(header_size) + " below minimum"};
    }
    if (size < header_size) {
        return truncated("header extension", header_size, size);
    }

    uint8_t type = data[1] >> 4;
    uint8_t serialization = data[2] >> 4;
    uint8_t compression = data[2] & 0x0F;
    frame.flags = data[1] & 0x0F;

    if (!valid_message_type(type)) {
        return ProtocolError{ErrorCode::MALFORMED_HEADER,
                             "unknown message type " + std::to_string(type)};
    }
    if (!valid_serialization(serialization)) {
        return ProtocolError{ErrorCode::MALFORMED_HEADER,
                             "unknown serialization " + std::to_string(serialization)};
    }
    if (!valid_compression(compression)) {
        return ProtocolError{ErrorCode::MALFORMED_HEADER,
                             "unknown compression " + std::to_string(compression)};
    }
    if (frame.flags & flags::RESERVED) {
        return ProtocolError{ErrorCode::MALFORMED_HEADER, "reserved flag bit set"};
    }

    frame.message_type = static_cast<MessageType>(type);
    frame.serialization = static_cast<Serialization>(serialization);
    frame.compression = static_cast<Compression>(compression);

    size_t offset = header_size;
    auto read_word = [&](uint32_t& out) -> bool {
        if (size - offset < 4) {
            return false;
        }
        out = get_u32(data + offset);
        offset += 4;
        return true;
    };

    uint32_t word = 0;
    if (frame.has_sequence()) {
        if (!read_word(word)) {
            return truncated("sequence", offset + 4, size);
        }
        frame.sequence = static_cast<int32_t>(word);
    }
    if (frame.has_event()) {
        if (!read_word(word)) {
            return truncated("event", offset + 4, size);
        }
        frame.event = static_cast<int32_t>(word);
    }
    if (frame.message_type == MessageType::ERROR_RESPONSE) {
        if (!read_word(word)) {
            return truncated("error code", offset + 4, size);
        }
        frame.error_code = word;
    }

    uint32_t payload_size = 0;
    if (!read_word(payload_size)) {
        return truncated("payload size", offset + 4, size);
    }
    if (size - offset < payload_size) {
        return truncated("payload", offset + payload_size, size);
    }
    frame.payload.assign(data + offset, data + offset + payload_size);

    return frame;
}

std::string to_string(MessageType type) {
    switch (type) {
        case MessageType::FULL_REQUEST: return "full_request";
        case MessageType::AUDIO_ONLY_REQUEST: return "audio_only_request";
        case MessageType::FULL_RESPONSE: return "full_response";
        case MessageType::ERROR_RESPONSE: return "error_response";
        default: return "unknown";
    }
}

std::string to_string(Serialization kind) {
    switch (kind) {
        case Serialization::RAW: return "raw";
        case Serialization::JSON: return "json";
        default: return "unknown";
    }
}

std::string to_string(Compression kind) {
    switch (kind) {
        case Compression::NONE: return "none";
        case Compression::GZIP: return "gzip";
        default: return "unknown";
    }
}

} // namespace asrstream
