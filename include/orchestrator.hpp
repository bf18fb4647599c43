#pragma once

#include "audio_capture.hpp"
#include "hotkey_state_machine.hpp"
#include "queue.hpp"
#include "status_channel.hpp"
#include "text_inserter.hpp"
#include "transcription_engine.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>

namespace sotto {

enum class SessionState {
    Idle,
    Recording,
    Stopping,
    Transcribing,
    Inserting,
    Error,
};

const char* to_string(SessionState state);

// Drives one dictation session at a time: hotkey events start and stop
// capture, the finished recording is transcribed and inserted on a worker
// thread, and status goes out on the StatusChannel.
class Orchestrator {
public:
    Orchestrator(AudioCapture& audio, TranscriptionEngine& engine,
                 TextInserter& inserter, StatusChannel& status,
                 bool auto_paste = true);
    ~Orchestrator();

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    // Hotkey thread
    void on_hotkey(HotkeyEvent event);

    // Any thread; the audio device reports loss from its own thread
    void on_device_lost(const std::string& reason);

    SessionState state() const;

    // Blocks until the session is back to Idle. False on timeout.
    bool wait_until_idle(std::chrono::milliseconds timeout);

    // Stops the worker after the current job
    void shutdown();

private:
    // Work handed to the worker thread. Move-only: it may own the recording.
    struct Job {
        enum class Type { Transcribe, DeviceLost };

        Type type = Type::Transcribe;
        SampleBuffer buffer;
        std::string reason;
        uint64_t session = 0;   // Recording the loss was reported for
    };

    void start_recording();
    void stop_recording();
    void abort_recording();

    void run_session(SampleBuffer buffer);
    void handle_device_lost(uint64_t session, const std::string& reason);

    void set_state(SessionState state);
    void finish(FailureKind failure, const std::string& detail);
    void emit(StatusEvent::Kind kind, FailureKind failure = FailureKind::None,
              const std::string& text = "");

    void worker_loop();

    AudioCapture& audio_;
    TranscriptionEngine& engine_;
    TextInserter& inserter_;
    StatusChannel& status_;
    bool auto_paste_;

    mutable std::mutex mutex_;
    std::condition_variable idle_cv_;
    SessionState state_ = SessionState::Idle;
    // Bumped on every start; guarded by mutex_
    uint64_t session_ = 0;

    Queue<Job> jobs_;
    std::thread worker_;
};

} // namespace sotto
