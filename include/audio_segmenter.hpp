#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace asrstream {

struct AudioSegment {
    uint64_t index{0};                 // 从0开始的采集顺序
    std::vector<int16_t> samples;      // 16-bit PCM，多声道时交错排列

    std::vector<uint8_t> to_bytes() const;  // little-endian
};

// 将任意长度的采集缓冲切成固定时长的音频段
class AudioSegmenter {
public:
    AudioSegmenter(int sample_rate = 16000, int channels = 1, int segment_duration_ms = 200);

    // 返回本次凑满的段，余下样本留给下一段
    std::vector<AudioSegment> push(const int16_t* samples, size_t count);
    std::vector<AudioSegment> push(const std::vector<int16_t>& samples) {
        return push(samples.data(), samples.size());
    }
    // 原始 s16le 字节，奇数尾字节会保留到下次
    std::vector<AudioSegment> push_bytes(const uint8_t* data, size_t size);

    // 取出未凑满的尾段；没有剩余样本时返回空段
    AudioSegment flush();

    size_t segment_samples() const { return segment_samples_; }
    size_t pending_samples() const { return pending_.size(); }
    uint64_t segments_emitted() const { return next_index_; }

private:
    size_t segment_samples_;
    std::vector<int16_t> pending_;
    std::vector<uint8_t> odd_byte_;
    uint64_t next_index_{0};
};

} // namespace asrstream
