// GTest
#include <gtest/gtest.h>

// standard
#include <stdexcept>
#include <string>
#include <vector>

// local
#include "payload_transform.hpp"

using namespace asrstream;

TEST(PayloadTransformTest, GzipRoundTrip) {
    std::string text(4096, 'a');
    text += "tail";
    std::vector<uint8_t> plain(text.begin(), text.end());

    auto packed = payload::compress(plain);
    ASSERT_GE(packed.size(), 2u);
    EXPECT_EQ(packed[0], 0x1f);
    EXPECT_EQ(packed[1], 0x8b);
    EXPECT_LT(packed.size(), plain.size());

    auto unpacked = payload::decompress(packed);
    ASSERT_TRUE(unpacked.ok());
    EXPECT_EQ(unpacked.value(), plain);
}

TEST(PayloadTransformTest, GzipEmptyInput) {
    auto packed = payload::compress({});
    auto unpacked = payload::decompress(packed);
    ASSERT_TRUE(unpacked.ok());
    EXPECT_TRUE(unpacked.value().empty());
}

TEST(PayloadTransformTest, GarbageIsDecompressionFailure) {
    std::vector<uint8_t> garbage = {'n', 'o', 't', ' ', 'g', 'z', 'i', 'p'};
    auto result = payload::decompress(garbage);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().code, ErrorCode::DECOMPRESSION_FAILED);
}

TEST(PayloadTransformTest, TruncatedStreamIsDecompressionFailure) {
    std::string text = "{\"result\":{\"text\":\"hello world\"}}";
    auto packed = payload::compress(std::vector<uint8_t>(text.begin(), text.end()));
    packed.resize(packed.size() / 2);

    auto result = payload::decompress(packed);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().code, ErrorCode::DECOMPRESSION_FAILED);
}

TEST(PayloadTransformTest, JsonEncodeDecode) {
    json body = {{"user", {{"uid", "u1"}}}, {"audio", {{"rate", 16000}}}};

    Frame frame;
    frame.message_type = MessageType::FULL_RESPONSE;
    frame.serialization = Serialization::JSON;
    frame.compression = Compression::GZIP;
    frame.payload = payload::encode(body, Serialization::JSON, Compression::GZIP);

    auto decoded = payload::decode(frame);
    ASSERT_TRUE(decoded.ok());
    EXPECT_EQ(decoded.value(), body);
}

TEST(PayloadTransformTest, NoCompressionSkipsGunzip) {
    std::string text = "{\"a\":1}";

    Frame frame;
    frame.serialization = Serialization::JSON;
    frame.compression = Compression::NONE;
    frame.payload.assign(text.begin(), text.end());

    auto decoded = payload::decode(frame);
    ASSERT_TRUE(decoded.ok());
    EXPECT_EQ(decoded.value()["a"], 1);
}

TEST(PayloadTransformTest, InvalidJsonIsMalformedPayload) {
    std::string text = "{\"a\":";

    Frame frame;
    frame.serialization = Serialization::JSON;
    frame.compression = Compression::NONE;
    frame.payload.assign(text.begin(), text.end());

    auto decoded = payload::decode(frame);
    ASSERT_FALSE(decoded.ok());
    EXPECT_EQ(decoded.error().code, ErrorCode::MALFORMED_PAYLOAD);
}

TEST(PayloadTransformTest, EmptyPayloadIsEmptyObject) {
    Frame frame;
    frame.serialization = Serialization::JSON;
    frame.compression = Compression::GZIP;

    auto decoded = payload::decode(frame);
    ASSERT_TRUE(decoded.ok());
    EXPECT_TRUE(decoded.value().is_object());
    EXPECT_TRUE(decoded.value().empty());
}

TEST(PayloadTransformTest, RawBytesPassThrough) {
    std::vector<uint8_t> pcm = {0x01, 0x00, 0xFF, 0x7F};

    auto plain = payload::encode(json::binary(pcm), Serialization::RAW, Compression::NONE);
    EXPECT_EQ(plain, pcm);

    Frame frame;
    frame.serialization = Serialization::RAW;
    frame.compression = Compression::GZIP;
    frame.payload = payload::encode(json::binary(pcm), Serialization::RAW, Compression::GZIP);

    auto decoded = payload::decode(frame);
    ASSERT_TRUE(decoded.ok());
    ASSERT_TRUE(decoded.value().is_binary());
    EXPECT_EQ(std::vector<uint8_t>(decoded.value().get_binary().begin(), decoded.value().get_binary().end()), pcm);
}

TEST(PayloadTransformTest, RawRequiresBinaryBody) {
    EXPECT_THROW(payload::serialize(json{{"a", 1}}, Serialization::RAW), std::invalid_argument);
}
