#include "websocket_transport.hpp"

#include <utility>
#include <boost/asio/ip/tcp.hpp>
#include <spdlog/spdlog.h>

#include "errors.hpp"

namespace asrstream {

namespace {

constexpr std::chrono::milliseconds CLOSE_HANDSHAKE_TIMEOUT{1000};

} // namespace

WebSocketTransport::WebSocketTransport() {
    // 设置日志级别
    client_.clear_access_channels(websocketpp::log::alevel::all);
    client_.set_access_channels(websocketpp::log::alevel::connect | websocketpp::log::alevel::disconnect);
    client_.clear_error_channels(websocketpp::log::elevel::all);
    client_.set_error_channels(websocketpp::log::elevel::warn | websocketpp::log::elevel::rerror |
                               websocketpp::log::elevel::fatal);

    // 初始化ASIO
    client_.init_asio();
    client_.start_perpetual();

    // 设置回调
    client_.set_tls_init_handler([this](connection_hdl hdl) {
        return this->on_tls_init(hdl);
    });

    client_.set_open_handler([this](connection_hdl hdl) {
        this->on_open(hdl);
    });

    client_.set_fail_handler([this](connection_hdl hdl) {
        this->on_fail(hdl);
    });

    client_.set_close_handler([this](connection_hdl hdl) {
        this->on_close(hdl);
    });

    client_.set_message_handler([this](connection_hdl hdl, Client::message_ptr msg) {
        this->on_message(hdl, msg);
    });

    io_thread_ = std::thread([this] {
        try {
            client_.run();
        } catch (const std::exception& e) {
            spdlog::error("WebSocket io loop failed: {}", e.what());
            {
                std::lock_guard<std::mutex> lock(mutex_);
                link_state_ = LinkState::FAILED;
                fail_reason_ = e.what();
            }
            cv_.notify_all();
        }
    });
}

WebSocketTransport::~WebSocketTransport() {
    close();
}

void WebSocketTransport::connect(const std::string& url,
                                 const std::map<std::string, std::string>& headers,
                                 std::chrono::milliseconds timeout) {
    websocketpp::lib::error_code ec;
    Client::connection_ptr con = client_.get_connection(url, ec);
    if (ec) {
        throw AsrError(ErrorCode::CONNECT_FAILED, "Failed to create connection to " + url + ": " + ec.message());
    }

    // 握手头原样透传
    for (const auto& header : headers) {
        con->append_header(header.first, header.second);
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (link_state_ == LinkState::CLOSED) {
            throw AsrError(ErrorCode::TRANSPORT_CLOSED, "Transport closed before connect");
        }
        if (link_state_ != LinkState::IDLE) {
            throw AsrError(ErrorCode::INVALID_STATE, "Transport already used");
        }
        link_state_ = LinkState::CONNECTING;
        hdl_ = con->get_handle();
    }

    spdlog::info("Connecting to {}", url);
    client_.connect(con);

    std::unique_lock<std::mutex> lock(mutex_);
    bool done = cv_.wait_for(lock, timeout, [this] {
        return link_state_ != LinkState::CONNECTING;
    });
    if (!done) {
        link_state_ = LinkState::FAILED;
        fail_reason_ = "connect timeout";
        throw AsrError(ErrorCode::CONNECT_TIMEOUT,
                       "Connection to " + url + " not established within " +
                           std::to_string(timeout.count()) + "ms");
    }
    if (link_state_ == LinkState::CLOSED) {
        throw AsrError(ErrorCode::TRANSPORT_CLOSED, "Connection to " + url + " closed while connecting");
    }
    if (link_state_ != LinkState::OPEN) {
        throw AsrError(ErrorCode::CONNECT_FAILED, "Failed to connect to " + url + ": " + fail_reason_);
    }
}

void WebSocketTransport::send(const std::vector<uint8_t>& message) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (link_state_ != LinkState::OPEN) {
            throw AsrError(ErrorCode::TRANSPORT_CLOSED, "Cannot send on a connection that is not open");
        }
    }

    websocketpp::lib::error_code ec;
    client_.send(hdl_, message.data(), message.size(), websocketpp::frame::opcode::binary, ec);
    if (ec) {
        throw AsrError(ErrorCode::TRANSPORT_CLOSED, "Error sending binary message: " + ec.message());
    }
}

ReceiveStatus WebSocketTransport::receive(std::vector<uint8_t>& message, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [this] {
        return !inbox_.empty() || link_state_ == LinkState::CLOSED || link_state_ == LinkState::FAILED;
    });

    // 连接关闭前收到的消息仍然交付
    if (!inbox_.empty()) {
        message = std::move(inbox_.front());
        inbox_.pop_front();
        return ReceiveStatus::OK;
    }
    if (link_state_ == LinkState::CLOSED || link_state_ == LinkState::FAILED) {
        return ReceiveStatus::CLOSED;
    }
    return ReceiveStatus::TIMEOUT;
}

void WebSocketTransport::close() {
    LinkState previous;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        previous = link_state_;
    }

    // 未建连或已关闭时 io 循环没有未完成的连接
    bool clean = previous == LinkState::IDLE || previous == LinkState::CLOSED;
    if (previous == LinkState::OPEN) {
        websocketpp::lib::error_code ec;
        client_.close(hdl_, websocketpp::close::status::normal, "", ec);
        if (ec) {
            spdlog::warn("Error closing connection: {}", ec.message());
        }
        std::unique_lock<std::mutex> lock(mutex_);
        clean = cv_.wait_for(lock, CLOSE_HANDSHAKE_TIMEOUT, [this] {
            return link_state_ == LinkState::CLOSED;
        });
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (link_state_ != LinkState::FAILED) {
            link_state_ = LinkState::CLOSED;
        }
    }
    cv_.notify_all();

    stop_io(!clean);
}

void WebSocketTransport::stop_io(bool force) {
    client_.stop_perpetual();
    // 握手进行中或关闭握手超时，run() 不会自行返回
    if (force) {
        client_.stop();
    }
    if (io_thread_.joinable()) {
        io_thread_.join();
    }
}

SslContext WebSocketTransport::on_tls_init(connection_hdl) {
    namespace ssl = websocketpp::lib::asio::ssl;
    auto ctx = websocketpp::lib::make_shared<ssl::context>(ssl::context::sslv23_client);
    try {
        ctx->set_options(ssl::context::default_workarounds | ssl::context::no_sslv2 |
                         ssl::context::no_sslv3 | ssl::context::single_dh_use);
        ctx->set_default_verify_paths();
        ctx->set_verify_mode(ssl::verify_peer);
    } catch (const std::exception& e) {
        spdlog::error("Failed to initialize TLS context: {}", e.what());
    }
    return ctx;
}

void WebSocketTransport::on_open(connection_hdl hdl) {
    auto con = client_.get_con_from_hdl(hdl);

    // 获取底层 socket 并关闭 Nagle
    websocketpp::lib::asio::error_code ec;
    con->get_socket().lowest_layer().set_option(boost::asio::ip::tcp::no_delay(true), ec);
    if (ec) {
        spdlog::warn("Failed to set TCP_NODELAY: {}", ec.message());
    }

    bool wanted = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        wanted = link_state_ == LinkState::CONNECTING;
        if (wanted) {
            link_state_ = LinkState::OPEN;
        }
    }
    if (!wanted) {
        // 建连期间已被关闭或已超时
        spdlog::info("Dropping connection opened after close");
        websocketpp::lib::error_code close_ec;
        client_.close(hdl, websocketpp::close::status::going_away, "", close_ec);
        return;
    }
    cv_.notify_all();
    spdlog::info("Connected, response code {}", static_cast<int>(con->get_response_code()));
}

void WebSocketTransport::on_fail(connection_hdl hdl) {
    auto con = client_.get_con_from_hdl(hdl);
    std::string reason = con->get_ec().message();
    int status = static_cast<int>(con->get_response_code());
    if (status != 0) {
        reason += " (HTTP " + std::to_string(status) + ")";
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        link_state_ = LinkState::FAILED;
        fail_reason_ = reason;
    }
    cv_.notify_all();
    spdlog::error("Connection failed: {}", reason);
}

void WebSocketTransport::on_close(connection_hdl hdl) {
    auto con = client_.get_con_from_hdl(hdl);
    spdlog::info("Connection closed: code {} reason '{}'",
                 static_cast<int>(con->get_remote_close_code()), con->get_remote_close_reason());

    {
        std::lock_guard<std::mutex> lock(mutex_);
        link_state_ = LinkState::CLOSED;
    }
    cv_.notify_all();
}

void WebSocketTransport::on_message(connection_hdl, Client::message_ptr msg) {
    if (msg->get_opcode() != websocketpp::frame::opcode::binary) {
        spdlog::warn("Ignoring text message: {}", msg->get_payload());
        return;
    }

    const std::string& payload = msg->get_payload();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        inbox_.emplace_back(payload.begin(), payload.end());
    }
    cv_.notify_all();
}

} // namespace asrstream
