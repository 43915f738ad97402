#include "session_config.hpp"

#include <fstream>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <spdlog/spdlog.h>

#include "errors.hpp"

namespace asrstream {

namespace {

template <typename T>
void read(const json& j, const char* key, T& out) {
    auto it = j.find(key);
    if (it != j.end() && !it->is_null()) {
        out = it->get<T>();
    }
}

void read_ms(const json& j, const char* key, std::chrono::milliseconds& out) {
    auto it = j.find(key);
    if (it != j.end() && !it->is_null()) {
        out = std::chrono::milliseconds(it->get<long long>());
    }
}

std::string generate_id() {
    return boost::uuids::to_string(boost::uuids::random_generator()());
}

} // namespace

void SessionConfig::validate() const {
    if (url.empty()) {
        throw AsrError(ErrorCode::INVALID_CONFIG, "url must not be empty");
    }
    if (sample_rate <= 0 || channels <= 0 || segment_duration_ms <= 0) {
        throw AsrError(ErrorCode::INVALID_CONFIG, "sample rate, channels and segment duration must be positive");
    }
    if (bits != 16) {
        throw AsrError(ErrorCode::INVALID_CONFIG, "only 16-bit PCM is supported, got " + std::to_string(bits));
    }
    if (static_cast<long long>(segment_duration_ms) * sample_rate % 1000 != 0) {
        throw AsrError(ErrorCode::INVALID_CONFIG,
                       "segment of " + std::to_string(segment_duration_ms) + "ms does not hold a whole number of samples");
    }
    if (queue_capacity == 0) {
        throw AsrError(ErrorCode::INVALID_CONFIG, "audio queue capacity must be positive");
    }
    if (max_push_timeouts <= 0) {
        throw AsrError(ErrorCode::INVALID_CONFIG, "max_push_timeouts must be positive");
    }
    if (connect_timeout.count() <= 0 || ack_timeout.count() <= 0 || final_timeout.count() <= 0) {
        throw AsrError(ErrorCode::INVALID_CONFIG, "timeouts must be positive");
    }
}

json SessionConfig::to_request_body() const {
    json request = {
        {"model_name", model_name},
        {"enable_itn", features.enable_itn},
        {"enable_punc", features.enable_punc},
        {"enable_ddc", features.enable_ddc},
        {"show_utterances", features.show_utterances},
        {"result_type", result_type}
    };
    if (end_window_size > 0) {
        request["end_window_size"] = end_window_size;
    }

    // 发送的是裸 PCM 样本，不是 wav 容器
    return {
        {"user", {{"uid", uid}}},
        {"audio", {
            {"format", "pcm"},
            {"codec", "raw"},
            {"rate", sample_rate},
            {"bits", bits},
            {"channel", channels}
        }},
        {"request", request}
    };
}

HeaderMap SessionConfig::handshake_headers() const {
    std::string req_id = request_id.empty() ? generate_id() : request_id;

    HeaderMap headers = extra_headers;
    headers["X-Api-App-Key"] = app_key;
    headers["X-Api-Access-Key"] = access_key;
    headers["X-Api-Resource-Id"] = resource_id;
    headers["X-Api-Request-Id"] = req_id;
    headers["X-Api-Connect-Id"] = connect_id.empty() ? req_id : connect_id;
    return headers;
}

SessionConfig SessionConfig::from_json(const json& j) {
    if (!j.is_object()) {
        throw AsrError(ErrorCode::INVALID_CONFIG, "config must be a JSON object");
    }

    SessionConfig config;
    try {
        read(j, "url", config.url);
        read(j, "app_key", config.app_key);
        read(j, "access_key", config.access_key);
        read(j, "resource_id", config.resource_id);
        read(j, "request_id", config.request_id);
        read(j, "connect_id", config.connect_id);
        read(j, "headers", config.extra_headers);
        read(j, "uid", config.uid);
        read(j, "model_name", config.model_name);
        read(j, "result_type", config.result_type);
        read(j, "end_window_size", config.end_window_size);
        read(j, "compress_audio", config.compress_audio);
        read(j, "log_level", config.log_level);

        if (j.contains("audio")) {
            const auto& audio = j.at("audio");
            read(audio, "rate", config.sample_rate);
            read(audio, "bits", config.bits);
            read(audio, "channel", config.channels);
            read(audio, "segment_ms", config.segment_duration_ms);
        }
        if (j.contains("features")) {
            const auto& features = j.at("features");
            read(features, "enable_itn", config.features.enable_itn);
            read(features, "enable_punc", config.features.enable_punc);
            read(features, "enable_ddc", config.features.enable_ddc);
            read(features, "show_utterances", config.features.show_utterances);
        }
        if (j.contains("timeouts_ms")) {
            const auto& timeouts = j.at("timeouts_ms");
            read_ms(timeouts, "connect", config.connect_timeout);
            read_ms(timeouts, "ack", config.ack_timeout);
            read_ms(timeouts, "final", config.final_timeout);
        }
        if (j.contains("capture")) {
            const auto& capture = j.at("capture");
            read(capture, "queue_capacity", config.queue_capacity);
            read_ms(capture, "push_timeout_ms", config.push_timeout);
            read(capture, "max_push_timeouts", config.max_push_timeouts);
            read_ms(capture, "starvation_timeout_ms", config.capture_starvation_timeout);
        }
    } catch (const json::exception& e) {
        throw AsrError(ErrorCode::INVALID_CONFIG, std::string("Invalid config value: ") + e.what());
    }

    return config;
}

SessionConfig load_config(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw AsrError(ErrorCode::INVALID_CONFIG, "Failed to open config file: " + path);
    }

    json j = json::parse(in, nullptr, false);
    if (j.is_discarded()) {
        throw AsrError(ErrorCode::INVALID_CONFIG, "Config file is not valid JSON: " + path);
    }

    auto config = SessionConfig::from_json(j);
    spdlog::debug("Loaded config from {}", path);
    return config;
}

} // namespace asrstream
