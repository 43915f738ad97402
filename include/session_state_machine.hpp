#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>

#include "errors.hpp"

namespace asrstream {

enum class SessionState {
    IDLE,
    CONNECTING,
    AWAITING_ACK,
    STREAMING,
    FINALIZING,
    CLOSED,
    ERRORED
};

std::string to_string(SessionState state);

inline bool is_terminal(SessionState state) {
    return state == SessionState::CLOSED || state == SessionState::ERRORED;
}

/**
 * 会话生命周期状态机
 *
 * IDLE -> CONNECTING -> AWAITING_ACK -> STREAMING -> FINALIZING -> CLOSED，
 * 任何非终止状态都可以进入 ERRORED。非法迁移抛出 AsrError(INVALID_STATE)。
 * 生产者和消费者线程都会驱动迁移，内部加锁。
 */
class SessionStateMachine {
public:
    using TransitionHandler = std::function<void(SessionState from, SessionState to)>;

    SessionStateMachine() = default;
    SessionStateMachine(const SessionStateMachine&) = delete;
    SessionStateMachine& operator=(const SessionStateMachine&) = delete;

    // 迁移回调在锁外调用
    void set_transition_handler(TransitionHandler handler);

    void on_connect_requested();   // IDLE -> CONNECTING
    void on_request_sent();        // CONNECTING -> AWAITING_ACK
    void on_accepted();            // AWAITING_ACK -> STREAMING
    void on_end_of_input();        // STREAMING -> FINALIZING
    void on_final_ack();           // FINALIZING -> CLOSED

    // 只校验当前状态，不迁移
    void check_can_send_audio() const;
    void check_can_receive_result() const;

    // 进入 ERRORED；已经是终止状态时返回 false
    bool on_error(ErrorCode code, const std::string& reason);

    SessionState state() const;
    ErrorCode error_code() const;
    std::string error_reason() const;

    // 等待直到 pred(state) 成立，超时返回 false
    bool wait_for(const std::function<bool(SessionState)>& pred, std::chrono::milliseconds timeout) const;
    bool wait_for_state(SessionState target, std::chrono::milliseconds timeout) const {
        return wait_for([target](SessionState s) { return s == target; }, timeout);
    }

private:
    void transition(SessionState expected, SessionState next, const char* event);
    void notify(SessionState from, SessionState to);

    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    SessionState state_{SessionState::IDLE};
    ErrorCode error_code_{ErrorCode::NONE};
    std::string error_reason_;
    TransitionHandler handler_;
};

} // namespace asrstream
