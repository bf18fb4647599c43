#pragma once

#include "audio_capture.hpp"

#include <atomic>
#include <portaudio.h>

namespace sotto {

// Default PortAudio input device, mono float32
class PortAudioDevice : public AudioDevice {
public:
    explicit PortAudioDevice(int channels = 1);
    ~PortAudioDevice() override;

    bool initialize() override;
    void shutdown() override;

    bool has_input() override;
    bool supports_rate(int sample_rate) override;
    int native_rate() override;

    bool open(int sample_rate, int frames_per_buffer,
              FrameCallback on_frames, LostCallback on_lost) override;
    bool start() override;
    void close() override;

private:
    static int pa_callback(const void* input, void* output,
                          unsigned long frame_count,
                          const PaStreamCallbackTimeInfo* time_info,
                          PaStreamCallbackFlags status_flags,
                          void* user_data);
    static void pa_finished(void* user_data);

    PaStreamParameters input_params() const;

    int channels_;
    PaStream* stream_ = nullptr;
    std::atomic<bool> initialized_{false};
    std::atomic<bool> running_{false};
    std::atomic<bool> closing_{false};

    FrameCallback frames_cb_;
    LostCallback lost_cb_;
};

} // namespace sotto
