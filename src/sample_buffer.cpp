#include "sample_buffer.hpp"
#include <utility>

namespace sotto {

SampleBuffer::SampleBuffer(int sample_rate)
    : sample_rate_(sample_rate) {
}

SampleBuffer::SampleBuffer(std::vector<float> samples, int sample_rate)
    : samples_(std::move(samples))
    , sample_rate_(sample_rate) {
}

SampleBuffer::SampleBuffer(SampleBuffer&& other) noexcept
    : samples_(std::move(other.samples_))
    , sample_rate_(other.sample_rate_) {
    other.samples_.clear();
}

SampleBuffer& SampleBuffer::operator=(SampleBuffer&& other) noexcept {
    if (this != &other) {
        samples_ = std::move(other.samples_);
        sample_rate_ = other.sample_rate_;
        other.samples_.clear();
    }
    return *this;
}

void SampleBuffer::append(const float* samples, size_t count) {
    samples_.insert(samples_.end(), samples, samples + count);
}

void SampleBuffer::reserve_seconds(int seconds) {
    if (seconds <= 0 || sample_rate_ <= 0) return;
    samples_.reserve(static_cast<size_t>(sample_rate_) * static_cast<size_t>(seconds));
}

int64_t SampleBuffer::duration_ms() const {
    if (sample_rate_ <= 0) return 0;
    return static_cast<int64_t>(samples_.size()) * 1000 / sample_rate_;
}

} // namespace sotto
