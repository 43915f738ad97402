#include "payload_transform.hpp"

#include <stdexcept>
#include <string>
#include <zlib.h>

namespace asrstream {
namespace payload {

namespace {

constexpr int GZIP_WINDOW_BITS = 15 + 16;   // 15位窗口 + gzip 头
constexpr size_t CHUNK_SIZE = 16 * 1024;

} // namespace

std::vector<uint8_t> serialize(const json& body, Serialization kind) {
    switch (kind) {
        case Serialization::JSON: {
            std::string text = body.dump();
            return std::vector<uint8_t>(text.begin(), text.end());
        }
        case Serialization::RAW: {
            if (!body.is_binary()) {
                throw std::invalid_argument("raw serialization requires a binary body");
            }
            const auto& bytes = body.get_binary();
            return std::vector<uint8_t>(bytes.begin(), bytes.end());
        }
    }
    throw std::invalid_argument("unknown serialization kind");
}

Result<json> deserialize(const std::vector<uint8_t>& bytes, Serialization kind) {
    if (kind == Serialization::RAW) {
        return json::binary(bytes);
    }

    // 不抛异常的解析，失败返回 discarded
    json body = json::parse(bytes.begin(), bytes.end(), nullptr, false);
    if (body.is_discarded()) {
        return ProtocolError{ErrorCode::MALFORMED_PAYLOAD,
                             "payload is not valid JSON (" + std::to_string(bytes.size()) + " bytes)"};
    }
    return body;
}

std::vector<uint8_t> compress(const std::vector<uint8_t>& bytes) {
    z_stream zs{};
    if (deflateInit2(&zs, Z_DEFAULT_COMPRESSION, Z_DEFLATED, GZIP_WINDOW_BITS, 8,
                     Z_DEFAULT_STRATEGY) != Z_OK) {
        throw std::runtime_error("Failed to initialize gzip compressor");
    }

    zs.next_in = const_cast<Bytef*>(bytes.data());
    zs.avail_in = static_cast<uInt>(bytes.size());

    std::vector<uint8_t> result;
    result.reserve(deflateBound(&zs, static_cast<uLong>(bytes.size())));

    uint8_t chunk[CHUNK_SIZE];
    int ret;
    do {
        zs.next_out = chunk;
        zs.avail_out = CHUNK_SIZE;
        ret = deflate(&zs, Z_FINISH);
        if (ret == Z_STREAM_ERROR) {
            deflateEnd(&zs);
            throw std::runtime_error("gzip compression failed");
        }
        result.insert(result.end(), chunk, chunk + (CHUNK_SIZE - zs.avail_out));
    } while (ret != Z_STREAM_END);

    deflateEnd(&zs);
    return result;
}

Result<std::vector<uint8_t>> decompress(const std::vector<uint8_t>& bytes) {
    z_stream zs{};
    if (inflateInit2(&zs, GZIP_WINDOW_BITS) != Z_OK) {
        return ProtocolError{ErrorCode::DECOMPRESSION_FAILED, "failed to initialize gzip decompressor"};
    }

    zs.next_in = const_cast<Bytef*>(bytes.data());
    zs.avail_in = static_cast<uInt>(bytes.size());

    std::vector<uint8_t> result;
    uint8_t chunk[CHUNK_SIZE];
    int ret;
    do {
        zs.next_out = chunk;
        zs.avail_out = CHUNK_SIZE;
        ret = inflate(&zs, Z_NO_FLUSH);
        if (ret == Z_NEED_DICT || ret == Z_DATA_ERROR || ret == Z_MEM_ERROR || ret == Z_STREAM_ERROR) {
            std::string reason = zs.msg ? zs.msg : "corrupt gzip stream";
            inflateEnd(&zs);
            return ProtocolError{ErrorCode::DECOMPRESSION_FAILED, reason};
        }
        size_t produced = CHUNK_SIZE - zs.avail_out;
        result.insert(result.end(), chunk, chunk + produced);
        // 输入耗尽但流未结束
        if (ret == Z_BUF_ERROR || (zs.avail_in == 0 && produced == 0 && ret != Z_STREAM_END)) {
            inflateEnd(&zs);
            return ProtocolError{ErrorCode::DECOMPRESSION_FAILED, "truncated gzip stream"};
        }
    } while (ret != Z_STREAM_END);

    inflateEnd(&zs);
    return result;
}

std::vector<uint8_t> encode(const json& body, Serialization serialization, Compression compression) {
    std::vector<uint8_t> bytes = serialize(body, serialization);
    if (compression == Compression::GZIP) {
        return compress(bytes);
    }
    return bytes;
}

Result<json> decode(const Frame& frame) {
    if (frame.payload.empty()) {
        return json::object();
    }

    if (frame.compression == Compression::GZIP) {
        auto plain = decompress(frame.payload);
        if (!plain) {
            return plain.error();
        }
        return deserialize(plain.value(), frame.serialization);
    }
    return deserialize(frame.payload, frame.serialization);
}

} // namespace payload
} // namespace asrstream
