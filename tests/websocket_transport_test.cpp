// GTest
#include <gtest/gtest.h>

// Boost
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

// standard
#include <chrono>
#include <future>
#include <map>
#include <memory>
#include <string>
#include <thread>
#include <vector>

// local
#include "errors.hpp"
#include "websocket_transport.hpp"

using namespace asrstream;
using namespace std::chrono;

namespace {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

// 内核完成 TCP 握手后不再应答，TLS 握手一直挂起
class SilentListener {
public:
    SilentListener() : acceptor_(io_, tcp::endpoint(asio::ip::address_v4::loopback(), 0)) {}

    unsigned short port() const { return acceptor_.local_endpoint().port(); }

    std::string url() const { return "wss://127.0.0.1:" + std::to_string(port()) + "/asr"; }

private:
    asio::io_context io_;
    tcp::acceptor acceptor_;
};

ErrorCode connect_code(WebSocketTransport& transport, const std::string& url, milliseconds timeout) {
    try {
        transport.connect(url, {}, timeout);
        return ErrorCode::NONE;
    } catch (const AsrError& e) {
        return e.code();
    }
}

} // namespace

TEST(WebSocketTransportTest, CloseDuringHandshakeReturnsPromptly) {
    SilentListener listener;
    auto transport = std::make_unique<WebSocketTransport>();

    auto connecting = std::async(std::launch::async, [&] {
        return connect_code(*transport, listener.url(), seconds(10));
    });
    std::this_thread::sleep_for(milliseconds(200));

    auto started = steady_clock::now();
    transport->close();
    EXPECT_LT(steady_clock::now() - started, seconds(3));

    ASSERT_EQ(connecting.wait_for(seconds(3)), std::future_status::ready);
    EXPECT_EQ(connecting.get(), ErrorCode::TRANSPORT_CLOSED);

    // 重复关闭与析构都不能阻塞
    transport->close();
    transport.reset();
}

TEST(WebSocketTransportTest, HandshakeTimeout) {
    SilentListener listener;
    WebSocketTransport transport;

    EXPECT_EQ(connect_code(transport, listener.url(), milliseconds(200)), ErrorCode::CONNECT_TIMEOUT);

    auto started = steady_clock::now();
    transport.close();
    EXPECT_LT(steady_clock::now() - started, seconds(3));
}

TEST(WebSocketTransportTest, RefusedConnectionFails) {
    std::string url;
    {
        SilentListener listener;
        url = listener.url();
    }
    WebSocketTransport transport;

    EXPECT_EQ(connect_code(transport, url, seconds(5)), ErrorCode::CONNECT_FAILED);
}

TEST(WebSocketTransportTest, ClosedTransportRejectsUse) {
    WebSocketTransport transport;
    transport.close();

    EXPECT_EQ(connect_code(transport, "wss://127.0.0.1:1/asr", seconds(1)), ErrorCode::TRANSPORT_CLOSED);

    std::vector<uint8_t> message;
    EXPECT_EQ(transport.receive(message, milliseconds(10)), ReceiveStatus::CLOSED);
    try {
        transport.send({0x11});
        FAIL() << "send on a closed transport must throw";
    } catch (const AsrError& e) {
        EXPECT_EQ(e.code(), ErrorCode::TRANSPORT_CLOSED);
    }
}
