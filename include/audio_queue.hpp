#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <utility>
#include <vector>

namespace asrstream {

using PcmBuffer = std::vector<int16_t>;

enum class PopStatus {
    ITEM,
    TIMEOUT,
    CLOSED      // 输入结束且队列已空，或已取消
};

// 采集线程 -> 生产者线程的有界队列
class AudioQueue {
public:
    explicit AudioQueue(size_t capacity) : capacity_(capacity) {}

    AudioQueue(const AudioQueue&) = delete;
    AudioQueue& operator=(const AudioQueue&) = delete;

    // 队列满时阻塞，超时或已关闭返回 false
    bool push(PcmBuffer buffer, std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        bool ready = not_full_.wait_for(lock, timeout, [this] {
            return closed_ || buffers_.size() < capacity_;
        });
        if (!ready || closed_) {
            return false;
        }
        buffers_.push_back(std::move(buffer));
        lock.unlock();
        not_empty_.notify_one();
        return true;
    }

    PopStatus pop(PcmBuffer& out, std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        bool ready = not_empty_.wait_for(lock, timeout, [this] {
            return closed_ || !buffers_.empty();
        });
        if (!ready) {
            return PopStatus::TIMEOUT;
        }
        // 关闭后仍然先排空已入队的数据
        if (buffers_.empty()) {
            return PopStatus::CLOSED;
        }
        out = std::move(buffers_.front());
        buffers_.pop_front();
        lock.unlock();
        not_full_.notify_one();
        return PopStatus::ITEM;
    }

    // 输入结束，不再接收新数据
    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        not_empty_.notify_all();
        not_full_.notify_all();
    }

    // 丢弃未发送的数据并唤醒所有等待者
    void cancel() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
            buffers_.clear();
        }
        not_empty_.notify_all();
        not_full_.notify_all();
    }

    bool closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return buffers_.size();
    }

    size_t capacity() const { return capacity_; }

private:
    const size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    std::deque<PcmBuffer> buffers_;
    bool closed_{false};
};

} // namespace asrstream
