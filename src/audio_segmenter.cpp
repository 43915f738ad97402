#include "audio_segmenter.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

namespace asrstream {

std::vector<uint8_t> AudioSegment::to_bytes() const {
    std::vector<uint8_t> bytes;
    bytes.reserve(samples.size() * 2);
    for (int16_t sample : samples) {
        uint16_t value = static_cast<uint16_t>(sample);
        bytes.push_back(static_cast<uint8_t>(value & 0xFF));
        bytes.push_back(static_cast<uint8_t>(value >> 8));
    }
    return bytes;
}

AudioSegmenter::AudioSegmenter(int sample_rate, int channels, int segment_duration_ms) {
    if (sample_rate <= 0 || channels <= 0 || segment_duration_ms <= 0) {
        throw std::invalid_argument("Invalid segmenter parameters");
    }
    long long samples = static_cast<long long>(segment_duration_ms) * sample_rate / 1000 * channels;
    if (samples <= 0) {
        throw std::invalid_argument("Segment duration too short: " + std::to_string(segment_duration_ms) + "ms");
    }
    segment_samples_ = static_cast<size_t>(samples);
    pending_.reserve(segment_samples_);
}

std::vector<AudioSegment> AudioSegmenter::push(const int16_t* samples, size_t count) {
    std::vector<AudioSegment> segments;
    size_t offset = 0;
    while (offset < count) {
        size_t take = std::min(segment_samples_ - pending_.size(), count - offset);
        pending_.insert(pending_.end(), samples + offset, samples + offset + take);
        offset += take;

        if (pending_.size() == segment_samples_) {
            AudioSegment segment;
            segment.index = next_index_++;
            segment.samples.swap(pending_);
            pending_.reserve(segment_samples_);
            segments.push_back(std::move(segment));
        }
    }
    return segments;
}

std::vector<AudioSegment> AudioSegmenter::push_bytes(const uint8_t* data, size_t size) {
    std::vector<int16_t> samples;
    samples.reserve((size + odd_byte_.size()) / 2);

    size_t offset = 0;
    if (!odd_byte_.empty() && size > 0) {
        samples.push_back(static_cast<int16_t>(odd_byte_[0] | data[0] << 8));
        odd_byte_.clear();
        offset = 1;
    }
    for (; offset + 1 < size; offset += 2) {
        samples.push_back(static_cast<int16_t>(data[offset] | data[offset + 1] << 8));
    }
    if (offset < size) {
        odd_byte_.push_back(data[offset]);
    }
    return push(samples.data(), samples.size());
}

AudioSegment AudioSegmenter::flush() {
    AudioSegment segment;
    if (pending_.empty()) {
        return segment;
    }
    segment.index = next_index_++;
    segment.samples.swap(pending_);
    return segment;
}

} // namespace asrstream
