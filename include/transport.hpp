#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace asrstream {

enum class ReceiveStatus {
    OK,
    TIMEOUT,
    CLOSED
};

/**
 * 与识别服务之间的双向二进制消息通道
 *
 * 失败时抛出 AsrError：connect 可能是 CONNECT_FAILED 或 CONNECT_TIMEOUT，
 * send 为 TRANSPORT_CLOSED。send 只由一个线程调用，receive 只由另一个线程调用。
 */
class Transport {
public:
    virtual ~Transport() = default;

    virtual void connect(const std::string& url,
                         const std::map<std::string, std::string>& headers,
                         std::chrono::milliseconds timeout) = 0;
    virtual void send(const std::vector<uint8_t>& message) = 0;
    virtual ReceiveStatus receive(std::vector<uint8_t>& message, std::chrono::milliseconds timeout) = 0;
    // 可重复调用，并唤醒阻塞中的 receive
    virtual void close() = 0;
};

} // namespace asrstream
