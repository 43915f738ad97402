#include "streaming_engine.hpp"
#include "websocket_transport.hpp"

#include <algorithm>
#include <atomic>
#include <csignal>
#include <fstream>
#include <iterator>
#include <thread>
#include <spdlog/spdlog.h>

namespace {

std::atomic<bool> stop_requested{false};

void signal_handler(int) {
    stop_requested = true;
}

std::vector<int16_t> read_pcm_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::runtime_error("Failed to open audio file: " + path);
    }
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

    // s16le
    std::vector<int16_t> samples;
    samples.reserve(bytes.size() / 2);
    for (size_t i = 0; i + 1 < bytes.size(); i += 2) {
        samples.push_back(static_cast<int16_t>(bytes[i] | bytes[i + 1] << 8));
    }
    return samples;
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 3) {
        spdlog::error("Usage: {} <config.json> <audio.pcm>", argv[0]);
        return 2;
    }

    try {
        // 设置信号处理
        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        auto config = asrstream::load_config(argv[1]);

        // 设置日志
        spdlog::set_level(spdlog::level::from_str(config.log_level));
        spdlog::info("Starting streaming recognition: {}", config.url);

        auto samples = read_pcm_file(argv[2]);
        spdlog::info("Loaded {} samples ({:.2f}s) from {}", samples.size(),
                     static_cast<double>(samples.size()) / config.sample_rate / config.channels, argv[2]);

        asrstream::StreamingEngine engine(config, std::make_unique<asrstream::WebSocketTransport>());
        engine.set_result_handler([](const asrstream::RecognitionResult& result) {
            spdlog::info("[{}] {}", result.is_final ? "final" : "partial", result.text);
        });
        engine.set_outcome_handler([](const asrstream::SessionOutcome& outcome) {
            if (outcome.success) {
                spdlog::info("Recognition finished: {}", outcome.final_text);
            } else {
                spdlog::error("Recognition failed: {} ({})", asrstream::to_string(outcome.reason), outcome.message);
            }
        });

        engine.start();
        auto ack_wait = config.connect_timeout + config.ack_timeout;
        if (engine.wait_for_state(asrstream::SessionState::STREAMING, ack_wait)) {
            // 按实时速度送入音频
            size_t chunk = static_cast<size_t>(config.segment_duration_ms) * config.sample_rate / 1000 * config.channels;
            auto interval = std::chrono::milliseconds(config.segment_duration_ms);
            for (size_t offset = 0; offset < samples.size() && !stop_requested; offset += chunk) {
                size_t count = std::min(chunk, samples.size() - offset);
                try {
                    engine.push_audio(samples.data() + offset, count);
                } catch (const asrstream::AsrError& e) {
                    spdlog::warn("Audio rejected: {}", e.what());
                    break;
                }
                std::this_thread::sleep_for(interval);
            }
            engine.stop();
        }

        auto outcome = engine.wait();
        return outcome.success ? 0 : 1;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
