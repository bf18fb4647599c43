#include "portaudio_device.hpp"
#include <iostream>
#include <utility>

namespace sotto {

PortAudioDevice::PortAudioDevice(int channels)
    : channels_(channels) {
}

PortAudioDevice::~PortAudioDevice() {
    shutdown();
}

bool PortAudioDevice::initialize() {
    if (initialized_.load()) return true;

    PaError err = Pa_Initialize();
    if (err != paNoError) {
        std::cerr << "PortAudio init failed: " << Pa_GetErrorText(err) << std::endl;
        return false;
    }

    initialized_.store(true);
    return true;
}

void PortAudioDevice::shutdown() {
    if (!initialized_.load()) return;

    close();
    Pa_Terminate();
    initialized_.store(false);
}

bool PortAudioDevice::has_input() {
    return initialized_.load() && Pa_GetDefaultInputDevice() != paNoDevice;
}

PaStreamParameters PortAudioDevice::input_params() const {
    PaStreamParameters params;
    params.device = Pa_GetDefaultInputDevice();
    params.channelCount = channels_;
    params.sampleFormat = paFloat32;
    params.suggestedLatency = 0;
    params.hostApiSpecificStreamInfo = nullptr;

    if (params.device != paNoDevice) {
        const PaDeviceInfo* info = Pa_GetDeviceInfo(params.device);
        if (info) params.suggestedLatency = info->defaultLowInputLatency;
    }
    return params;
}

bool PortAudioDevice::supports_rate(int sample_rate) {
    if (!has_input()) return false;

    PaStreamParameters params = input_params();
    return Pa_IsFormatSupported(&params, nullptr, sample_rate) == paFormatIsSupported;
}

int PortAudioDevice::native_rate() {
    if (!has_input()) return 0;

    const PaDeviceInfo* info = Pa_GetDeviceInfo(Pa_GetDefaultInputDevice());
    if (!info) return 0;
    return static_cast<int>(info->defaultSampleRate);
}

bool PortAudioDevice::open(int sample_rate, int frames_per_buffer,
                           FrameCallback on_frames, LostCallback on_lost) {
    if (!initialized_.load() || stream_) return false;

    PaStreamParameters params = input_params();
    if (params.device == paNoDevice) {
        std::cerr << "No default input device" << std::endl;
        return false;
    }

    frames_cb_ = std::move(on_frames);
    lost_cb_ = std::move(on_lost);

    PaError err = Pa_OpenStream(&stream_,
                                &params,
                                nullptr,  // No output
                                sample_rate,
                                frames_per_buffer,
                                paClipOff,
                                pa_callback,
                                this);
    if (err != paNoError) {
        std::cerr << "Failed to open stream: " << Pa_GetErrorText(err) << std::endl;
        stream_ = nullptr;
        return false;
    }

    // Fires when the stream stops on its own, e.g. the device was unplugged
    err = Pa_SetStreamFinishedCallback(stream_, pa_finished);
    if (err != paNoError) {
        std::cerr << "Failed to watch stream: " << Pa_GetErrorText(err) << std::endl;
    }

    return true;
}

bool PortAudioDevice::start() {
    if (!stream_) return false;

    closing_.store(false);
    PaError err = Pa_StartStream(stream_);
    if (err != paNoError) {
        std::cerr << "Failed to start stream: " << Pa_GetErrorText(err) << std::endl;
        return false;
    }

    running_.store(true);
    return true;
}

void PortAudioDevice::close() {
    if (!stream_) return;

    closing_.store(true);
    running_.store(false);

    if (Pa_IsStreamActive(stream_) == 1) {
        PaError err = Pa_StopStream(stream_);
        if (err != paNoError) {
            std::cerr << "Failed to stop stream: " << Pa_GetErrorText(err) << std::endl;
        }
    }

    PaError err = Pa_CloseStream(stream_);
    if (err != paNoError) {
        std::cerr << "Failed to close stream: " << Pa_GetErrorText(err) << std::endl;
    }
    stream_ = nullptr;
    std::cout << "Audio capture stopped - microphone released" << std::endl;
}

int PortAudioDevice::pa_callback(const void* input, void* output,
                                 unsigned long frame_count,
                                 const PaStreamCallbackTimeInfo* time_info,
                                 PaStreamCallbackFlags status_flags,
                                 void* user_data) {
    (void)output;
    (void)time_info;
    (void)status_flags;

    auto* device = static_cast<PortAudioDevice*>(user_data);
    if (!input || !device->running_.load()) return paContinue;

    const float* in = static_cast<const float*>(input);
    if (device->frames_cb_) {
        device->frames_cb_(in, frame_count);
    }

    return paContinue;
}

void PortAudioDevice::pa_finished(void* user_data) {
    auto* device = static_cast<PortAudioDevice*>(user_data);

    // A stop we asked for is not a device loss
    if (device->closing_.load()) return;

    device->running_.store(false);
    if (device->lost_cb_) {
        device->lost_cb_("input stream finished unexpectedly");
    }
}

} // namespace sotto
