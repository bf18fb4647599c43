#include "audio_capture.hpp"
#include "resampler.hpp"
#include <iostream>
#include <utility>

namespace sotto {

const char* to_string(CaptureError error) {
    switch (error) {
        case CaptureError::None: return "none";
        case CaptureError::NoDevice: return "no input device";
        case CaptureError::OpenFailed: return "failed to open input stream";
        case CaptureError::StartFailed: return "failed to start input stream";
        case CaptureError::AlreadyRunning: return "capture already running";
    }
    return "unknown";
}

AudioCapture::AudioCapture(AudioDevice& device, int target_rate, int frame_ms, int reserve_seconds)
    : device_(device)
    , target_rate_(target_rate)
    , frame_ms_(frame_ms)
    , reserve_seconds_(reserve_seconds)
    , buffer_(target_rate) {
}

AudioCapture::~AudioCapture() {
    abort();
}

CaptureError AudioCapture::start() {
    if (recording_.load()) return CaptureError::AlreadyRunning;

    if (!device_.has_input()) {
        std::cerr << "No default input device" << std::endl;
        return CaptureError::NoDevice;
    }

    int rate = target_rate_;
    if (!device_.supports_rate(rate)) {
        rate = device_.native_rate();
        std::cout << target_rate_ << "Hz not supported, using device rate " << rate << "Hz" << std::endl;
        if (rate <= 0) return CaptureError::OpenFailed;
    }

    {
        std::lock_guard<std::mutex> lock(buffer_mutex_);
        buffer_ = SampleBuffer(target_rate_);
        buffer_.reserve_seconds(reserve_seconds_);
    }

    int frames_per_buffer = rate * frame_ms_ / 1000;
    bool opened = device_.open(
        rate, frames_per_buffer,
        [this](const float* frames, size_t count) { on_frames(frames, count); },
        [this](const std::string& reason) { on_lost(reason); });
    if (!opened) {
        std::cerr << "Failed to open input stream at " << rate << "Hz" << std::endl;
        return CaptureError::OpenFailed;
    }

    device_rate_.store(rate);
    recording_.store(true);

    if (!device_.start()) {
        recording_.store(false);
        device_rate_.store(0);
        device_.close();
        std::cerr << "Failed to start input stream" << std::endl;
        return CaptureError::StartFailed;
    }

    std::cout << "Audio capture started at " << rate << "Hz" << std::endl;
    return CaptureError::None;
}

SampleBuffer AudioCapture::stop() {
    recording_.store(false);
    device_.close();

    SampleBuffer recorded = take_buffer();
    std::cout << "Captured " << recorded.size() << " samples at " << target_rate_
              << "Hz (recorded at " << device_rate_.load() << "Hz)" << std::endl;
    device_rate_.store(0);
    return recorded;
}

void AudioCapture::abort() {
    recording_.store(false);
    device_.close();
    device_rate_.store(0);

    // Drop the partial recording
    SampleBuffer discarded = take_buffer();
    (void)discarded;
}

SampleBuffer AudioCapture::take_buffer() {
    std::lock_guard<std::mutex> lock(buffer_mutex_);
    SampleBuffer out = std::move(buffer_);
    buffer_ = SampleBuffer(target_rate_);
    return out;
}

void AudioCapture::on_frames(const float* frames, size_t count) {
    if (!recording_.load()) return;

    const int rate = device_rate_.load();

    std::lock_guard<std::mutex> lock(buffer_mutex_);
    if (rate == target_rate_) {
        buffer_.append(frames, count);
    } else {
        resampler::resample_into(frames, count, rate, target_rate_, buffer_.storage());
    }
}

void AudioCapture::on_lost(const std::string& reason) {
    if (!recording_.exchange(false)) return;

    std::cerr << "Audio input lost: " << reason << std::endl;
    if (lost_cb_) lost_cb_(reason);
}

} // namespace sotto
