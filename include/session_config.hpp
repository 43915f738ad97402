#pragma once

#include <chrono>
#include <cstddef>
#include <map>
#include <string>
#include <nlohmann/json.hpp>

namespace asrstream {

using json = nlohmann::json;
using HeaderMap = std::map<std::string, std::string>;

struct FeatureFlags {
    bool enable_itn{true};        // 数字归一化
    bool enable_punc{true};       // 标点
    bool enable_ddc{true};        // 顺滑
    bool show_utterances{true};   // 分句信息
};

struct SessionConfig {
    // 连接
    std::string url{"wss://openspeech.bytedance.com/api/v3/sauc/bigmodel_async"};
    std::string app_key;
    std::string access_key;
    std::string resource_id{"volc.seedasr.sauc.duration"};
    std::string request_id;       // 为空时自动生成
    std::string connect_id;       // 为空时与 request_id 相同
    HeaderMap extra_headers;

    // 请求
    std::string uid{"asrstream"};
    std::string model_name{"bigmodel"};
    std::string result_type{"full"};
    int end_window_size{0};       // 服务端静音判停(ms)，0 表示使用服务端默认
    FeatureFlags features;

    // 音频格式
    int sample_rate{16000};
    int bits{16};
    int channels{1};
    int segment_duration_ms{200};
    bool compress_audio{true};

    // 超时
    std::chrono::milliseconds connect_timeout{10000};
    std::chrono::milliseconds ack_timeout{5000};
    std::chrono::milliseconds final_timeout{3000};

    // 采集队列
    size_t queue_capacity{50};
    std::chrono::milliseconds push_timeout{200};
    int max_push_timeouts{5};
    std::chrono::milliseconds capture_starvation_timeout{5000};

    std::string log_level{"info"};

    // 参数不合法时抛出 AsrError(INVALID_CONFIG)
    void validate() const;

    json to_request_body() const;
    HeaderMap handshake_headers() const;

    static SessionConfig from_json(const json& j);
};

SessionConfig load_config(const std::string& path);

} // namespace asrstream
