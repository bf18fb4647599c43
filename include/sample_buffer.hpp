#pragma once

#include <vector>
#include <cstddef>
#include <cstdint>

namespace sotto {

// Captured mono audio tagged with its sample rate.
// Move-only: a recording has exactly one owner at a time.
class SampleBuffer {
public:
    explicit SampleBuffer(int sample_rate = 16000);
    SampleBuffer(std::vector<float> samples, int sample_rate);

    SampleBuffer(const SampleBuffer&) = delete;
    SampleBuffer& operator=(const SampleBuffer&) = delete;
    SampleBuffer(SampleBuffer&& other) noexcept;
    SampleBuffer& operator=(SampleBuffer&& other) noexcept;

    void append(const float* samples, size_t count);
    void reserve_seconds(int seconds);
    void clear() { samples_.clear(); }

    size_t size() const { return samples_.size(); }
    bool empty() const { return samples_.empty(); }
    int sample_rate() const { return sample_rate_; }
    int64_t duration_ms() const;

    const std::vector<float>& samples() const { return samples_; }

    // Appending into the storage directly (used by the resampler)
    std::vector<float>& storage() { return samples_; }

private:
    std::vector<float> samples_;
    int sample_rate_;
};

} // namespace sotto
