#pragma once

#include <websocketpp/config/asio_client.hpp>
#include <websocketpp/client.hpp>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <thread>

#include "transport.hpp"

namespace asrstream {

using websocketpp::connection_hdl;

using Client = websocketpp::client<websocketpp::config::asio_tls_client>;
using SslContext = websocketpp::lib::shared_ptr<websocketpp::lib::asio::ssl::context>;

// 基于 websocketpp 的 wss 客户端，io 循环运行在独立线程
class WebSocketTransport : public Transport {
public:
    WebSocketTransport();
    ~WebSocketTransport() override;

    WebSocketTransport(const WebSocketTransport&) = delete;
    WebSocketTransport& operator=(const WebSocketTransport&) = delete;

    void connect(const std::string& url,
                 const std::map<std::string, std::string>& headers,
                 std::chrono::milliseconds timeout) override;
    void send(const std::vector<uint8_t>& message) override;
    ReceiveStatus receive(std::vector<uint8_t>& message, std::chrono::milliseconds timeout) override;
    void close() override;

private:
    enum class LinkState {
        IDLE,
        CONNECTING,
        OPEN,
        FAILED,
        CLOSED
    };

    // WebSocket callbacks
    void on_open(connection_hdl hdl);
    void on_fail(connection_hdl hdl);
    void on_close(connection_hdl hdl);
    void on_message(connection_hdl hdl, Client::message_ptr msg);
    SslContext on_tls_init(connection_hdl hdl);

    void stop_io(bool force);

private:
    Client client_;
    connection_hdl hdl_;
    std::thread io_thread_;

    std::mutex mutex_;
    std::condition_variable cv_;
    LinkState link_state_{LinkState::IDLE};
    std::string fail_reason_;
    std::deque<std::vector<uint8_t>> inbox_;
};

} // namespace asrstream
