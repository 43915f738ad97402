#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "audio_queue.hpp"
#include "audio_segmenter.hpp"
#include "binary_protocol.hpp"
#include "recognition_result.hpp"
#include "sequence_counter.hpp"
#include "session_config.hpp"
#include "session_state_machine.hpp"
#include "transport.hpp"

namespace asrstream {

// 每个会话只产生一次
struct SessionOutcome {
    bool success{false};
    ErrorCode reason{ErrorCode::NONE};
    std::string message;
    std::string final_text;         // 最近一次识别文本
    uint32_t server_code{0};        // 仅 SERVER_ERROR
    uint64_t frames_sent{0};
    uint64_t results_received{0};
    uint64_t malformed_frames{0};
};

/**
 * 单个流式识别会话
 *
 * 生产者线程独占写：建连、发送首包、切段发送音频、发送终止包。
 * 消费者线程独占读：解码、分类、转发识别结果，并负责确认超时。
 * 回调在这两个线程中调用，需在 start() 之前设置。
 */
class StreamingEngine {
public:
    using ResultHandler = std::function<void(const RecognitionResult&)>;
    using OutcomeHandler = std::function<void(const SessionOutcome&)>;
    using StateHandler = SessionStateMachine::TransitionHandler;

    StreamingEngine(SessionConfig config, std::unique_ptr<Transport> transport);
    ~StreamingEngine();

    StreamingEngine(const StreamingEngine&) = delete;
    StreamingEngine& operator=(const StreamingEngine&) = delete;

    void set_result_handler(ResultHandler handler) { result_handler_ = std::move(handler); }
    void set_outcome_handler(OutcomeHandler handler) { outcome_handler_ = std::move(handler); }
    void set_state_handler(StateHandler handler) { state_.set_transition_handler(std::move(handler)); }

    // 非阻塞，只能调用一次
    void start();

    // 采集侧调用。非 STREAMING 状态抛出 AsrError(INVALID_STATE)；
    // 队列满超时返回 false，连续超时过多时会话以 CAPTURE_STARVATION 失败
    bool push_audio(const int16_t* samples, size_t count);
    bool push_audio(const PcmBuffer& samples) { return push_audio(samples.data(), samples.size()); }

    // 输入结束，已入队的音频发送完后发送终止包。可重复调用
    void end_of_input();
    void stop() { end_of_input(); }

    // 立即关闭连接，丢弃未发送的音频
    void abort();

    // 等待两个线程结束并取得会话结果
    SessionOutcome wait();

    SessionState state() const { return state_.state(); }
    bool wait_for_state(SessionState target, std::chrono::milliseconds timeout) const {
        return state_.wait_for_state(target, timeout);
    }

private:
    void run_producer();
    void run_consumer();

    void open_session();
    void stream_audio();
    void send_segment(const AudioSegment& segment);
    void finalize();
    void send_frame(const Frame& frame);

    void handle_message(const std::vector<uint8_t>& data);
    void emit_result(const RecognitionResult& result);

    void complete();
    void fail(ErrorCode code, const std::string& reason);
    void close_transport();
    void emit_outcome(bool success, ErrorCode reason, const std::string& message);

private:
    SessionConfig config_;
    std::unique_ptr<Transport> transport_;
    SessionStateMachine state_;
    AudioQueue queue_;

    // 仅生产者线程访问
    AudioSegmenter segmenter_;
    SequenceCounter sequence_;

    std::thread producer_;
    std::thread consumer_;

    std::atomic<bool> started_{false};
    std::atomic<bool> input_ended_{false};
    std::atomic<bool> terminal_sent_{false};
    std::atomic<bool> terminal_written_{false};
    std::atomic<bool> final_ack_seen_{false};
    std::atomic<bool> outcome_emitted_{false};
    std::atomic<int> push_timeouts_{0};
    std::atomic<uint32_t> server_code_{0};

    std::atomic<uint64_t> frames_sent_{0};
    std::atomic<uint64_t> results_received_{0};
    std::atomic<uint64_t> malformed_frames_{0};

    std::mutex outcome_mutex_;
    std::condition_variable outcome_cv_;
    std::string last_text_;
    bool outcome_ready_{false};
    SessionOutcome outcome_;

    ResultHandler result_handler_;
    OutcomeHandler outcome_handler_;
};

} // namespace asrstream
