#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "binary_protocol.hpp"
#include "errors.hpp"

namespace asrstream {

using json = nlohmann::json;

struct Utterance {
    std::string text;
    int64_t start_ms{0};
    int64_t end_ms{0};
    bool definite{false};
};

// 识别结果，创建后不再修改，后到的结果覆盖先前的
struct RecognitionResult {
    std::string text;
    bool is_final{false};
    std::optional<std::vector<Utterance>> utterances;
    int32_t sequence{0};
    int64_t audio_duration_ms{0};
};

enum class ResponseKind {
    ACCEPTANCE,
    TEMPORARY_RESULT,
    FINAL_RESULT,
    EMPTY,
    ERROR
};

std::string to_string(ResponseKind kind);

struct ClassifiedResponse {
    ResponseKind kind{ResponseKind::EMPTY};
    bool last_package{false};
    RecognitionResult result;
    uint32_t server_code{0};
    std::string server_message;
};

// 从 FullResponse 的 JSON 负载中提取结果
RecognitionResult parse_result(const json& body, const Frame& frame);

/**
 * 对已解码的入站帧分类
 *
 * awaiting_ack 为 true 时 FullResponse 视为服务端接受会话。
 * ErrorResponse 的负载按 UTF-8 文本读取；负载解析失败返回可恢复错误。
 */
Result<ClassifiedResponse> classify_response(const Frame& frame, bool awaiting_ack);

} // namespace asrstream
