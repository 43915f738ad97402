#include "streaming_engine.hpp"

#include <optional>
#include <utility>
#include <stdexcept>
#include <spdlog/spdlog.h>

#include "payload_transform.hpp"

namespace asrstream {

namespace {

using Clock = std::chrono::steady_clock;

constexpr std::chrono::milliseconds POLL_INTERVAL{50};
constexpr std::chrono::milliseconds CAPTURE_POLL_INTERVAL{100};

SessionConfig validated(SessionConfig config) {
    config.validate();
    return config;
}

} // namespace

StreamingEngine::StreamingEngine(SessionConfig config, std::unique_ptr<Transport> transport)
    : config_(validated(std::move(config))),
      transport_(std::move(transport)),
      queue_(config_.queue_capacity),
      segmenter_(config_.sample_rate, config_.channels, config_.segment_duration_ms) {
    if (!transport_) {
        throw std::invalid_argument("StreamingEngine requires a transport");
    }
}

StreamingEngine::~StreamingEngine() {
    if (producer_.joinable() || consumer_.joinable()) {
        abort();
        wait();
    }
}

void StreamingEngine::start() {
    if (started_.exchange(true)) {
        throw AsrError(ErrorCode::INVALID_STATE, "Session already started");
    }
    state_.on_connect_requested();

    consumer_ = std::thread(&StreamingEngine::run_consumer, this);
    producer_ = std::thread(&StreamingEngine::run_producer, this);
}

bool StreamingEngine::push_audio(const int16_t* samples, size_t count) {
    state_.check_can_send_audio();

    if (queue_.push(PcmBuffer(samples, samples + count), config_.push_timeout)) {
        push_timeouts_ = 0;
        return true;
    }
    if (queue_.closed()) {
        return false;
    }

    int timeouts = ++push_timeouts_;
    spdlog::warn("Audio queue full, push timed out ({}/{})", timeouts, config_.max_push_timeouts);
    if (timeouts >= config_.max_push_timeouts) {
        fail(ErrorCode::CAPTURE_STARVATION,
             "audio queue stayed full for " + std::to_string(timeouts) + " consecutive pushes");
    }
    return false;
}

void StreamingEngine::end_of_input() {
    if (!input_ended_.exchange(true)) {
        spdlog::info("End of input requested");
    }
    queue_.close();
}

void StreamingEngine::abort() {
    fail(ErrorCode::CANCELLED, "session cancelled");
}

SessionOutcome StreamingEngine::wait() {
    if (!started_) {
        throw AsrError(ErrorCode::INVALID_STATE, "Session not started");
    }
    if (producer_.joinable()) {
        producer_.join();
    }
    if (consumer_.joinable()) {
        consumer_.join();
    }

    // fail() 可能在调用方线程上执行，工作线程退出时结果未必已写入
    std::unique_lock<std::mutex> lock(outcome_mutex_);
    outcome_cv_.wait(lock, [this] { return outcome_ready_; });
    return outcome_;
}

void StreamingEngine::run_producer() {
    try {
        open_session();

        // 由消费者负责确认超时
        while (state_.state() == SessionState::AWAITING_ACK) {
            state_.wait_for([](SessionState s) { return s != SessionState::AWAITING_ACK; }, POLL_INTERVAL);
        }
        if (state_.state() != SessionState::STREAMING) {
            return;
        }

        stream_audio();
    } catch (const AsrError& e) {
        fail(e.code(), e.what());
    } catch (const std::exception& e) {
        spdlog::error("Unexpected exception in producer thread: {}", e.what());
        fail(ErrorCode::INTERNAL_ERROR, e.what());
    }
}

void StreamingEngine::open_session() {
    transport_->connect(config_.url, config_.handshake_headers(), config_.connect_timeout);

    auto body = payload::encode(config_.to_request_body(), Serialization::JSON, Compression::GZIP);
    Frame frame = make_request_frame(MessageType::FULL_REQUEST, sequence_.next(),
                                     Serialization::JSON, Compression::GZIP, std::move(body));
    send_frame(frame);
    state_.on_request_sent();
}

void StreamingEngine::stream_audio() {
    spdlog::info("Streaming audio, {} samples per segment", segmenter_.segment_samples());

    auto last_audio = Clock::now();
    PcmBuffer buffer;
    while (state_.state() == SessionState::STREAMING) {
        PopStatus status = queue_.pop(buffer, CAPTURE_POLL_INTERVAL);
        if (status == PopStatus::ITEM) {
            last_audio = Clock::now();
            for (const auto& segment : segmenter_.push(buffer)) {
                send_segment(segment);
            }
            continue;
        }
        if (status == PopStatus::CLOSED) {
            break;
        }
        if (Clock::now() - last_audio >= config_.capture_starvation_timeout) {
            fail(ErrorCode::CAPTURE_STARVATION,
                 "no audio received for " + std::to_string(config_.capture_starvation_timeout.count()) + "ms");
            return;
        }
    }

    if (state_.state() == SessionState::STREAMING) {
        finalize();
    }
}

void StreamingEngine::send_segment(const AudioSegment& segment) {
    state_.check_can_send_audio();

    Compression compression = config_.compress_audio ? Compression::GZIP : Compression::NONE;
    auto body = payload::encode(json::binary(segment.to_bytes()), Serialization::RAW, compression);
    Frame frame = make_request_frame(MessageType::AUDIO_ONLY_REQUEST, sequence_.next(),
                                     Serialization::RAW, compression, std::move(body));
    send_frame(frame);
}

void StreamingEngine::finalize() {
    if (terminal_sent_.exchange(true)) {
        return;
    }

    // 未凑满的尾段随终止包发送
    AudioSegment tail = segmenter_.flush();
    std::vector<uint8_t> bytes = tail.to_bytes();
    Compression compression = config_.compress_audio && !bytes.empty() ? Compression::GZIP : Compression::NONE;
    auto body = payload::encode(json::binary(std::move(bytes)), Serialization::RAW, compression);
    Frame frame = make_request_frame(MessageType::AUDIO_ONLY_REQUEST, sequence_.finalize(),
                                     Serialization::RAW, compression, std::move(body));

    state_.on_end_of_input();
    try {
        send_frame(frame);
    } catch (const AsrError& e) {
        if (!final_ack_seen_) {
            throw;
        }
        spdlog::warn("Terminal frame not delivered, server already finished: {}", e.what());
    }
    terminal_written_ = true;
}

void StreamingEngine::send_frame(const Frame& frame) {
    transport_->send(FrameCodec::encode(frame));
    ++frames_sent_;
    spdlog::debug("Sent {} seq={} payload={} bytes", to_string(frame.message_type),
                  frame.sequence, frame.payload.size());
}

void StreamingEngine::run_consumer() {
    try {
        // 首包发出后才开始读
        while (!state_.wait_for([](SessionState s) {
                   return s != SessionState::IDLE && s != SessionState::CONNECTING;
               }, POLL_INTERVAL)) {
        }

        auto ack_deadline = Clock::now() + config_.ack_timeout;
        std::optional<Clock::time_point> final_deadline;
        std::vector<uint8_t> data;

        while (true) {
            SessionState s = state_.state();
            if (is_terminal(s)) {
                break;
            }

            auto now = Clock::now();
            if ((s == SessionState::FINALIZING || final_ack_seen_) && !final_deadline) {
                final_deadline = now + config_.final_timeout;
            }
            if (s == SessionState::FINALIZING && final_ack_seen_ && terminal_written_) {
                complete();
                break;
            }
            if (s == SessionState::AWAITING_ACK && now >= ack_deadline) {
                fail(ErrorCode::ACK_TIMEOUT,
                     "no acknowledgement within " + std::to_string(config_.ack_timeout.count()) + "ms");
                break;
            }
            if (final_deadline && now >= *final_deadline) {
                fail(ErrorCode::FINAL_TIMEOUT,
                     "no final acknowledgement within " + std::to_string(config_.final_timeout.count()) + "ms");
                break;
            }

            ReceiveStatus status = transport_->receive(data, POLL_INTERVAL);
            if (status == ReceiveStatus::TIMEOUT) {
                continue;
            }
            if (status == ReceiveStatus::CLOSED) {
                if (is_terminal(state_.state())) {
                    break;
                }
                if (final_ack_seen_) {
                    // 服务端发完最后一包后断开，等生产者收尾
                    std::this_thread::sleep_for(std::chrono::milliseconds(10));
                    continue;
                }
                fail(ErrorCode::TRANSPORT_CLOSED, "connection closed by peer");
                break;
            }

            handle_message(data);
        }
    } catch (const AsrError& e) {
        fail(e.code(), e.what());
    } catch (const std::exception& e) {
        spdlog::error("Unexpected exception in consumer thread: {}", e.what());
        fail(ErrorCode::INTERNAL_ERROR, e.what());
    }
}

void StreamingEngine::handle_message(const std::vector<uint8_t>& data) {
    auto decoded = FrameCodec::decode(data);
    if (!decoded) {
        ++malformed_frames_;
        spdlog::warn("Skipping malformed frame ({} bytes): {} - {}", data.size(),
                     to_string(decoded.error().code), decoded.error().reason);
        return;
    }

    const Frame& frame = decoded.value();
    spdlog::debug("Received {} seq={} flags={} payload={} bytes", to_string(frame.message_type),
                  frame.sequence, static_cast<int>(frame.flags), frame.payload.size());

    bool awaiting_ack = state_.state() == SessionState::AWAITING_ACK;
    auto classified = classify_response(frame, awaiting_ack);
    if (!classified) {
        ++malformed_frames_;
        spdlog::warn("Skipping undecodable response: {} - {}",
                     to_string(classified.error().code), classified.error().reason);
        return;
    }

    const ClassifiedResponse& response = classified.value();
    switch (response.kind) {
        case ResponseKind::ERROR:
            server_code_ = response.server_code;
            fail(ErrorCode::SERVER_ERROR,
                 "server error " + std::to_string(response.server_code) + ": " + response.server_message);
            return;
        case ResponseKind::ACCEPTANCE:
            state_.on_accepted();
            spdlog::info("Session accepted by server");
            if (!response.result.text.empty()) {
                emit_result(response.result);
            }
            break;
        case ResponseKind::TEMPORARY_RESULT:
        case ResponseKind::FINAL_RESULT:
            state_.check_can_receive_result();
            emit_result(response.result);
            break;
        case ResponseKind::EMPTY:
            break;
    }

    if (response.last_package && !final_ack_seen_.exchange(true)) {
        spdlog::info("Received last package");
        if (state_.state() == SessionState::STREAMING) {
            // 服务端主动结束，走正常收尾流程
            end_of_input();
        }
    }
}

void StreamingEngine::emit_result(const RecognitionResult& result) {
    ++results_received_;
    {
        std::lock_guard<std::mutex> lock(outcome_mutex_);
        last_text_ = result.text;
    }
    spdlog::debug("{} result: {}", result.is_final ? "Final" : "Temporary", result.text);

    if (result_handler_) {
        try {
            result_handler_(result);
        } catch (const std::exception& e) {
            spdlog::error("Result handler failed: {}", e.what());
        }
    }
}

void StreamingEngine::complete() {
    state_.on_final_ack();
    close_transport();
    queue_.cancel();
    spdlog::info("Session completed, {} frames sent, {} results", frames_sent_.load(), results_received_.load());
    emit_outcome(true, ErrorCode::NONE, "");
}

void StreamingEngine::fail(ErrorCode code, const std::string& reason) {
    if (!state_.on_error(code, reason)) {
        return;
    }
    queue_.cancel();
    close_transport();
    emit_outcome(false, code, reason);
}

void StreamingEngine::close_transport() {
    // 会话已进入终止状态，关闭失败只记录，结果照常发出
    try {
        transport_->close();
    } catch (const std::exception& e) {
        spdlog::warn("Error closing transport: {}", e.what());
    }
}

void StreamingEngine::emit_outcome(bool success, ErrorCode reason, const std::string& message) {
    if (outcome_emitted_.exchange(true)) {
        return;
    }

    SessionOutcome outcome;
    outcome.success = success;
    outcome.reason = reason;
    outcome.message = message;
    outcome.server_code = server_code_;
    outcome.frames_sent = frames_sent_;
    outcome.results_received = results_received_;
    outcome.malformed_frames = malformed_frames_;
    {
        std::lock_guard<std::mutex> lock(outcome_mutex_);
        outcome.final_text = last_text_;
        outcome_ = outcome;
        outcome_ready_ = true;
    }
    outcome_cv_.notify_all();

    if (outcome_handler_) {
        try {
            outcome_handler_(outcome);
        } catch (const std::exception& e) {
            spdlog::error("Outcome handler failed: {}", e.what());
        }
    }
}

} // namespace asrstream
