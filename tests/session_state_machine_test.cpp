// GTest
#include <gtest/gtest.h>

// spdlog
#include <spdlog/spdlog.h>
#include <spdlog/sinks/ostream_sink.h>

// standard
#include <chrono>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <utility>
#include <vector>

// local
#include "session_state_machine.hpp"

using namespace asrstream;
using namespace std::chrono;

namespace {

void expect_invalid_state(const std::function<void()>& action) {
    try {
        action();
        FAIL() << "expected INVALID_STATE";
    } catch (const AsrError& e) {
        EXPECT_EQ(e.code(), ErrorCode::INVALID_STATE);
    }
}

// 把默认 logger 临时换成写入字符串的 logger
class LogCapture {
public:
    LogCapture() : previous_(spdlog::default_logger()) {
        auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(stream_);
        auto logger = std::make_shared<spdlog::logger>("capture", sink);
        logger->set_pattern("%l|%v");
        logger->set_level(spdlog::level::trace);
        spdlog::set_default_logger(logger);
    }

    ~LogCapture() { spdlog::set_default_logger(previous_); }

    std::string text() const { return stream_.str(); }

private:
    std::shared_ptr<spdlog::logger> previous_;
    std::ostringstream stream_;
};

} // namespace

TEST(SessionStateMachineTest, HappyPath) {
    SessionStateMachine machine;
    std::vector<std::pair<SessionState, SessionState>> transitions;
    machine.set_transition_handler([&](SessionState from, SessionState to) {
        transitions.emplace_back(from, to);
    });

    EXPECT_EQ(machine.state(), SessionState::IDLE);
    machine.on_connect_requested();
    machine.on_request_sent();
    machine.on_accepted();
    machine.check_can_send_audio();
    machine.check_can_receive_result();
    machine.on_end_of_input();
    machine.check_can_receive_result();
    machine.on_final_ack();
    EXPECT_EQ(machine.state(), SessionState::CLOSED);

    std::vector<std::pair<SessionState, SessionState>> expected = {
        {SessionState::IDLE, SessionState::CONNECTING},
        {SessionState::CONNECTING, SessionState::AWAITING_ACK},
        {SessionState::AWAITING_ACK, SessionState::STREAMING},
        {SessionState::STREAMING, SessionState::FINALIZING},
        {SessionState::FINALIZING, SessionState::CLOSED},
    };
    EXPECT_EQ(transitions, expected);
}

TEST(SessionStateMachineTest, AudioOnlyWhileStreaming) {
    SessionStateMachine machine;
    expect_invalid_state([&] { machine.check_can_send_audio(); });

    machine.on_connect_requested();
    machine.on_request_sent();
    expect_invalid_state([&] { machine.check_can_send_audio(); });
    expect_invalid_state([&] { machine.check_can_receive_result(); });

    machine.on_accepted();
    machine.on_end_of_input();
    expect_invalid_state([&] { machine.check_can_send_audio(); });
}

TEST(SessionStateMachineTest, IllegalEventsThrow) {
    SessionStateMachine machine;
    expect_invalid_state([&] { machine.on_accepted(); });
    expect_invalid_state([&] { machine.on_end_of_input(); });
    expect_invalid_state([&] { machine.on_final_ack(); });

    machine.on_connect_requested();
    expect_invalid_state([&] { machine.on_connect_requested(); });

    // 非法事件不改变状态
    EXPECT_EQ(machine.state(), SessionState::CONNECTING);
}

TEST(SessionStateMachineTest, ErrorFromAnyLiveState) {
    SessionStateMachine idle;
    EXPECT_TRUE(idle.on_error(ErrorCode::CANCELLED, "cancelled"));
    EXPECT_EQ(idle.state(), SessionState::ERRORED);

    SessionStateMachine finalizing;
    finalizing.on_connect_requested();
    finalizing.on_request_sent();
    finalizing.on_accepted();
    finalizing.on_end_of_input();
    EXPECT_TRUE(finalizing.on_error(ErrorCode::FINAL_TIMEOUT, "no final ack"));
    EXPECT_EQ(finalizing.state(), SessionState::ERRORED);
    EXPECT_EQ(finalizing.error_code(), ErrorCode::FINAL_TIMEOUT);
    EXPECT_EQ(finalizing.error_reason(), "no final ack");
}

TEST(SessionStateMachineTest, TerminalStatesAbsorbErrors) {
    SessionStateMachine machine;
    machine.on_connect_requested();
    EXPECT_TRUE(machine.on_error(ErrorCode::CONNECT_FAILED, "refused"));
    EXPECT_FALSE(machine.on_error(ErrorCode::TRANSPORT_CLOSED, "closed"));

    // 第一个错误保留
    EXPECT_EQ(machine.error_code(), ErrorCode::CONNECT_FAILED);
    expect_invalid_state([&] { machine.on_request_sent(); });
    EXPECT_TRUE(is_terminal(machine.state()));
}

TEST(SessionStateMachineTest, WaitForState) {
    SessionStateMachine machine;
    machine.on_connect_requested();
    EXPECT_FALSE(machine.wait_for_state(SessionState::AWAITING_ACK, milliseconds(10)));

    std::thread driver([&] {
        std::this_thread::sleep_for(milliseconds(20));
        machine.on_request_sent();
    });
    EXPECT_TRUE(machine.wait_for_state(SessionState::AWAITING_ACK, seconds(5)));
    driver.join();
}

TEST(SessionStateMachineTest, CancellationIsNotLoggedAsError) {
    std::string cancelled_log;
    std::string failed_log;
    {
        LogCapture capture;
        SessionStateMachine machine;
        machine.on_connect_requested();
        machine.on_error(ErrorCode::CANCELLED, "session cancelled");
        cancelled_log = capture.text();
    }
    {
        LogCapture capture;
        SessionStateMachine machine;
        machine.on_connect_requested();
        machine.on_error(ErrorCode::CONNECT_FAILED, "refused");
        failed_log = capture.text();
    }

    EXPECT_NE(cancelled_log.find("info|Session cancelled"), std::string::npos);
    EXPECT_EQ(cancelled_log.find("error|"), std::string::npos);
    EXPECT_NE(failed_log.find("error|Session errored"), std::string::npos);
}
