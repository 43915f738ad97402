#pragma once

#include <cstdint>
#include <vector>
#include <nlohmann/json.hpp>

#include "binary_protocol.hpp"
#include "errors.hpp"

namespace asrstream {

using json = nlohmann::json;

namespace payload {

// JSON 直接序列化为 UTF-8；RAW 要求 body 是 json::binary
std::vector<uint8_t> serialize(const json& body, Serialization kind);

// RAW 返回 json::binary 包装的原始字节
Result<json> deserialize(const std::vector<uint8_t>& bytes, Serialization kind);

// gzip 格式（RFC 1952）
std::vector<uint8_t> compress(const std::vector<uint8_t>& bytes);
Result<std::vector<uint8_t>> decompress(const std::vector<uint8_t>& bytes);

// 出站: body -> 序列化 -> 压缩
std::vector<uint8_t> encode(const json& body, Serialization serialization, Compression compression);

// 入站: 按帧头声明解压并反序列化，空负载返回空对象
Result<json> decode(const Frame& frame);

} // namespace payload

} // namespace asrstream
