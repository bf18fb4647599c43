#pragma once

#include "sample_buffer.hpp"

#include <atomic>
#include <functional>
#include <mutex>
#include <string>

namespace sotto {

enum class CaptureError {
    None,
    NoDevice,       // No default input device
    OpenFailed,     // Neither the target nor the native rate could be opened
    StartFailed,
    AlreadyRunning,
};

const char* to_string(CaptureError error);

// Input device seam. The production implementation is PortAudioDevice.
class AudioDevice {
public:
    // Called on the device's delivery thread with mono float frames
    using FrameCallback = std::function<void(const float* frames, size_t count)>;
    // Called once if the device goes away while the stream is running
    using LostCallback = std::function<void(const std::string& reason)>;

    virtual ~AudioDevice() = default;

    virtual bool initialize() = 0;
    virtual void shutdown() = 0;

    // False when there is no default input device
    virtual bool has_input() = 0;
    virtual bool supports_rate(int sample_rate) = 0;
    virtual int native_rate() = 0;

    virtual bool open(int sample_rate, int frames_per_buffer,
                      FrameCallback on_frames, LostCallback on_lost) = 0;
    virtual bool start() = 0;
    // Stops and closes the stream. Safe to call when nothing is open.
    virtual void close() = 0;
};

class AudioCapture {
public:
    using DeviceLostCallback = std::function<void(const std::string& reason)>;

    AudioCapture(AudioDevice& device, int target_rate = 16000,
                 int frame_ms = 10, int reserve_seconds = 30);
    ~AudioCapture();

    // Opens the default input at the target rate, falling back to the
    // device's native rate, and starts streaming into a fresh buffer.
    CaptureError start();

    // Stops the stream and hands over the recorded audio (at the target rate)
    SampleBuffer stop();

    // Stops the stream and drops whatever was recorded
    void abort();

    bool is_recording() const { return recording_.load(); }

    // Rate the device stream was opened at, 0 when idle
    int device_rate() const { return device_rate_.load(); }
    int target_rate() const { return target_rate_; }

    // Invoked from the device's thread when the input disappears mid-recording
    void set_device_lost_callback(DeviceLostCallback callback) { lost_cb_ = std::move(callback); }

private:
    void on_frames(const float* frames, size_t count);
    void on_lost(const std::string& reason);
    SampleBuffer take_buffer();

    AudioDevice& device_;
    int target_rate_;
    int frame_ms_;
    int reserve_seconds_;

    std::atomic<bool> recording_{false};
    std::atomic<int> device_rate_{0};

    SampleBuffer buffer_;
    std::mutex buffer_mutex_;

    DeviceLostCallback lost_cb_;
};

} // namespace sotto
