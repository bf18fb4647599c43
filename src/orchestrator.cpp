#include "orchestrator.hpp"
#include <iostream>
#include <utility>

namespace sotto {

const char* to_string(SessionState state) {
    switch (state) {
        case SessionState::Idle: return "idle";
        case SessionState::Recording: return "recording";
        case SessionState::Stopping: return "stopping";
        case SessionState::Transcribing: return "transcribing";
        case SessionState::Inserting: return "inserting";
        case SessionState::Error: return "error";
    }
    return "unknown";
}

const char* to_string(FailureKind kind) {
    switch (kind) {
        case FailureKind::None: return "none";
        case FailureKind::DeviceError: return "device-error";
        case FailureKind::TranscriptionError: return "transcription-error";
        case FailureKind::ClipboardError: return "clipboard-error";
        case FailureKind::PasteError: return "paste-error";
    }
    return "unknown";
}

const char* to_string(StatusEvent::Kind kind) {
    switch (kind) {
        case StatusEvent::Kind::RecordingStarted: return "recording-started";
        case StatusEvent::Kind::RecordingStopped: return "recording-stopped";
        case StatusEvent::Kind::TranscriptionFailed: return "transcription-failed";
        case StatusEvent::Kind::TextInserted: return "text-inserted";
        case StatusEvent::Kind::Idle: return "idle";
    }
    return "unknown";
}

Orchestrator::Orchestrator(AudioCapture& audio, TranscriptionEngine& engine,
                           TextInserter& inserter, StatusChannel& status,
                           bool auto_paste)
    : audio_(audio)
    , engine_(engine)
    , inserter_(inserter)
    , status_(status)
    , auto_paste_(auto_paste) {
    audio_.set_device_lost_callback([this](const std::string& reason) {
        on_device_lost(reason);
    });
    worker_ = std::thread([this]() { worker_loop(); });
}

Orchestrator::~Orchestrator() {
    shutdown();
}

void Orchestrator::shutdown() {
    abort_recording();

    jobs_.stop();
    if (worker_.joinable()) {
        worker_.join();
    }
    audio_.set_device_lost_callback(nullptr);
}

SessionState Orchestrator::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

bool Orchestrator::wait_until_idle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return idle_cv_.wait_for(lock, timeout, [this] { return state_ == SessionState::Idle; });
}

void Orchestrator::on_hotkey(HotkeyEvent event) {
    switch (event) {
        case HotkeyEvent::Started:
            start_recording();
            break;
        case HotkeyEvent::Stopped:
            stop_recording();
            break;
        case HotkeyEvent::Aborted:
            abort_recording();
            break;
    }
}

void Orchestrator::on_device_lost(const std::string& reason) {
    // Runs on the audio thread; the stream is torn down from the worker
    Job job;
    job.type = Job::Type::DeviceLost;
    job.reason = reason;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        job.session = session_;
    }
    if (!jobs_.push(std::move(job))) {
        std::cerr << "Dropping device loss notification after shutdown" << std::endl;
    }
}

// Device calls below run without mutex_ held. The transitional state
// (Recording while starting, Stopping while closing) keeps other callers out.

void Orchestrator::start_recording() {
    uint64_t session = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != SessionState::Idle) {
            std::cout << "Hotkey ignored while " << to_string(state_) << std::endl;
            return;
        }
        state_ = SessionState::Recording;
        session = ++session_;
    }

    CaptureError err = audio_.start();
    if (err != CaptureError::None) {
        std::cerr << "Failed to start audio capture: " << to_string(err) << std::endl;
        finish(FailureKind::DeviceError, to_string(err));
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    // The stream may already have been lost and torn down by the worker
    if (state_ != SessionState::Recording || session != session_) return;

    std::cout << "Recording..." << std::endl;
    emit(StatusEvent::Kind::RecordingStarted);
}

void Orchestrator::stop_recording() {
    bool device_lost = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != SessionState::Recording) return;
        state_ = SessionState::Stopping;
        device_lost = !audio_.is_recording();
    }

    if (device_lost) {
        // The device dropped out before the key came up; its job will find us idle
        audio_.abort();
        finish(FailureKind::DeviceError, "input device lost");
        return;
    }

    SampleBuffer buffer = audio_.stop();

    std::unique_lock<std::mutex> lock(mutex_);
    state_ = SessionState::Transcribing;
    emit(StatusEvent::Kind::RecordingStopped);

    std::cout << "Transcribing..." << std::endl;

    Job job;
    job.type = Job::Type::Transcribe;
    job.buffer = std::move(buffer);
    if (!jobs_.push(std::move(job))) {
        lock.unlock();
        finish(FailureKind::TranscriptionError, "worker stopped");
    }
}

void Orchestrator::abort_recording() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != SessionState::Recording) return;
        state_ = SessionState::Stopping;
    }

    audio_.abort();
    std::cout << "Recording discarded" << std::endl;

    std::lock_guard<std::mutex> lock(mutex_);
    emit(StatusEvent::Kind::RecordingStopped);
    emit(StatusEvent::Kind::Idle);
    state_ = SessionState::Idle;
    idle_cv_.notify_all();
}

void Orchestrator::handle_device_lost(uint64_t session, const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != SessionState::Recording) return;
        if (session != session_) {
            // Reported for a recording that has already ended
            std::cout << "Ignoring stale device loss: " << reason << std::endl;
            return;
        }
        state_ = SessionState::Stopping;
    }

    audio_.abort();
    finish(FailureKind::DeviceError, reason);
}

void Orchestrator::run_session(SampleBuffer buffer) {
    TranscriptionResult result = engine_.transcribe(std::move(buffer));

    if (result.status == TranscriptionStatus::TooShort) {
        // Silent skip
        finish(FailureKind::None, "");
        return;
    }

    if (result.status == TranscriptionStatus::Failed) {
        std::cerr << "Transcription failed: " << result.error << std::endl;
        finish(FailureKind::TranscriptionError, result.error);
        return;
    }

    set_state(SessionState::Inserting);

    InsertResult inserted = auto_paste_ ? inserter_.insert(result.text)
                                        : inserter_.copy_only(result.text);
    switch (inserted) {
        case InsertResult::Ok:
            emit(StatusEvent::Kind::TextInserted, FailureKind::None, result.text);
            finish(FailureKind::None, "");
            break;
        case InsertResult::ClipboardError:
            finish(FailureKind::ClipboardError, to_string(inserted));
            break;
        case InsertResult::PasteError:
            finish(FailureKind::PasteError, to_string(inserted));
            break;
    }
}

void Orchestrator::set_state(SessionState state) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = state;
}

void Orchestrator::finish(FailureKind failure, const std::string& detail) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (failure != FailureKind::None) {
        state_ = SessionState::Error;
        std::cerr << "Session failed (" << to_string(failure) << "): " << detail << std::endl;
        emit(StatusEvent::Kind::TranscriptionFailed, failure, detail);
    }

    emit(StatusEvent::Kind::Idle);
    state_ = SessionState::Idle;
    idle_cv_.notify_all();
}

void Orchestrator::emit(StatusEvent::Kind kind, FailureKind failure, const std::string& text) {
    StatusEvent event;
    event.kind = kind;
    event.failure = failure;
    event.text = text;
    if (!status_.push(std::move(event))) {
        std::cerr << "Status channel closed, dropping " << to_string(kind) << std::endl;
    }
}

void Orchestrator::worker_loop() {
    Job job;
    while (jobs_.pop(job)) {
        switch (job.type) {
            case Job::Type::Transcribe:
                run_session(std::move(job.buffer));
                break;
            case Job::Type::DeviceLost:
                handle_device_lost(job.session, job.reason);
                break;
        }
    }
}

} // namespace sotto
