#include "recognition_result.hpp"

#include <utility>

#include "payload_transform.hpp"

namespace asrstream {

namespace {

std::string string_field(const json& j, const char* key) {
    auto it = j.find(key);
    if (it != j.end() && it->is_string()) {
        return it->get<std::string>();
    }
    return "";
}

int64_t int_field(const json& j, const char* key) {
    auto it = j.find(key);
    if (it != j.end() && it->is_number()) {
        return it->get<int64_t>();
    }
    return 0;
}

bool bool_field(const json& j, const char* key) {
    auto it = j.find(key);
    return it != j.end() && it->is_boolean() && it->get<bool>();
}

} // namespace

std::string to_string(ResponseKind kind) {
    switch (kind) {
        case ResponseKind::ACCEPTANCE: return "acceptance";
        case ResponseKind::TEMPORARY_RESULT: return "temporary";
        case ResponseKind::FINAL_RESULT: return "final";
        case ResponseKind::EMPTY: return "empty";
        case ResponseKind::ERROR: return "error";
        default: return "unknown";
    }
}

RecognitionResult parse_result(const json& body, const Frame& frame) {
    RecognitionResult result;
    result.sequence = frame.sequence;
    result.is_final = frame.is_last();

    if (!body.is_object()) {
        return result;
    }

    auto audio_info = body.find("audio_info");
    if (audio_info != body.end() && audio_info->is_object()) {
        result.audio_duration_ms = int_field(*audio_info, "duration");
    }

    auto it = body.find("result");
    if (it == body.end()) {
        return result;
    }
    // result 可能直接是字符串
    if (it->is_string()) {
        result.text = it->get<std::string>();
        return result;
    }
    if (!it->is_object()) {
        return result;
    }

    result.text = string_field(*it, "text");

    auto utts = it->find("utterances");
    if (utts != it->end() && utts->is_array()) {
        std::vector<Utterance> utterances;
        std::string joined;
        for (const auto& item : *utts) {
            if (!item.is_object()) {
                continue;
            }
            Utterance utt;
            utt.text = string_field(item, "text");
            utt.start_ms = int_field(item, "start_time");
            utt.end_ms = int_field(item, "end_time");
            utt.definite = bool_field(item, "definite");
            joined += utt.text;
            if (utt.definite) {
                result.is_final = true;
            }
            utterances.push_back(std::move(utt));
        }
        if (!joined.empty()) {
            result.text = joined;
        }
        result.utterances = std::move(utterances);
    }

    return result;
}

Result<ClassifiedResponse> classify_response(const Frame& frame, bool awaiting_ack) {
    ClassifiedResponse response;
    response.last_package = frame.is_last();

    switch (frame.message_type) {
        case MessageType::ERROR_RESPONSE: {
            response.kind = ResponseKind::ERROR;
            response.server_code = frame.error_code;
            std::vector<uint8_t> text = frame.payload;
            if (frame.compression == Compression::GZIP && !text.empty()) {
                auto plain = payload::decompress(text);
                if (plain) {
                    text = std::move(plain.value());
                }
            }
            response.server_message.assign(text.begin(), text.end());
            return response;
        }
        case MessageType::FULL_RESPONSE: {
            auto body = payload::decode(frame);
            if (!body) {
                return body.error();
            }
            response.result = parse_result(body.value(), frame);
            if (awaiting_ack) {
                response.kind = ResponseKind::ACCEPTANCE;
            } else if (response.result.text.empty()) {
                response.kind = ResponseKind::EMPTY;
            } else {
                response.kind = response.result.is_final ? ResponseKind::FINAL_RESULT
                                                         : ResponseKind::TEMPORARY_RESULT;
            }
            return response;
        }
        default:
            return ProtocolError{ErrorCode::MALFORMED_HEADER,
                                 "unexpected inbound message type " + to_string(frame.message_type)};
    }
}

} // namespace asrstream
