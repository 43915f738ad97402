#include "session_state_machine.hpp"

#include <utility>
#include <spdlog/spdlog.h>

namespace asrstream {

std::string to_string(SessionState state) {
    switch (state) {
        case SessionState::IDLE: return "idle";
        case SessionState::CONNECTING: return "connecting";
        case SessionState::AWAITING_ACK: return "awaiting_ack";
        case SessionState::STREAMING: return "streaming";
        case SessionState::FINALIZING: return "finalizing";
        case SessionState::CLOSED: return "closed";
        case SessionState::ERRORED: return "errored";
        default: return "unknown";
    }
}

void SessionStateMachine::set_transition_handler(TransitionHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    handler_ = std::move(handler);
}

void SessionStateMachine::on_connect_requested() {
    transition(SessionState::IDLE, SessionState::CONNECTING, "connect");
}

void SessionStateMachine::on_request_sent() {
    transition(SessionState::CONNECTING, SessionState::AWAITING_ACK, "request sent");
}

void SessionStateMachine::on_accepted() {
    transition(SessionState::AWAITING_ACK, SessionState::STREAMING, "accepted");
}

void SessionStateMachine::on_end_of_input() {
    transition(SessionState::STREAMING, SessionState::FINALIZING, "end of input");
}

void SessionStateMachine::on_final_ack() {
    transition(SessionState::FINALIZING, SessionState::CLOSED, "final ack");
}

void SessionStateMachine::check_can_send_audio() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != SessionState::STREAMING) {
        throw AsrError(ErrorCode::INVALID_STATE, "Cannot send audio in state " + to_string(state_));
    }
}

void SessionStateMachine::check_can_receive_result() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != SessionState::STREAMING && state_ != SessionState::FINALIZING) {
        throw AsrError(ErrorCode::INVALID_STATE, "Cannot accept results in state " + to_string(state_));
    }
}

bool SessionStateMachine::on_error(ErrorCode code, const std::string& reason) {
    SessionState from;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (is_terminal(state_)) {
            return false;
        }
        from = state_;
        state_ = SessionState::ERRORED;
        error_code_ = code;
        error_reason_ = reason;
    }
    cv_.notify_all();
    if (code == ErrorCode::CANCELLED) {
        spdlog::info("Session cancelled in state {}: {}", to_string(from), reason);
    } else {
        spdlog::error("Session errored in state {}: {} ({})", to_string(from), to_string(code), reason);
    }
    notify(from, SessionState::ERRORED);
    return true;
}

SessionState SessionStateMachine::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

ErrorCode SessionStateMachine::error_code() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return error_code_;
}

std::string SessionStateMachine::error_reason() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return error_reason_;
}

bool SessionStateMachine::wait_for(const std::function<bool(SessionState)>& pred,
                                   std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [&] { return pred(state_); });
}

void SessionStateMachine::transition(SessionState expected, SessionState next, const char* event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != expected) {
            throw AsrError(ErrorCode::INVALID_STATE,
                           std::string("Illegal event '") + event + "' in state " + to_string(state_));
        }
        state_ = next;
    }
    cv_.notify_all();
    spdlog::info("Session state: {} -> {}", to_string(expected), to_string(next));
    notify(expected, next);
}

void SessionStateMachine::notify(SessionState from, SessionState to) {
    TransitionHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        handler = handler_;
    }
    if (handler) {
        handler(from, to);
    }
}

} // namespace asrstream
