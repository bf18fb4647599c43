#pragma once

#include "queue.hpp"

#include <string>

namespace sotto {

enum class FailureKind {
    None,
    DeviceError,
    TranscriptionError,
    ClipboardError,
    PasteError,
};

const char* to_string(FailureKind kind);

// Outward notifications for the tray indicator / UI
struct StatusEvent {
    enum class Kind {
        RecordingStarted,
        RecordingStopped,
        TranscriptionFailed,
        TextInserted,
        Idle,               // Back to the default indicator
    };

    Kind kind = Kind::Idle;
    FailureKind failure = FailureKind::None;
    std::string text;       // Inserted text, or the failure detail
};

const char* to_string(StatusEvent::Kind kind);

// One-way channel from the Orchestrator to whoever draws the indicator.
// The sender never waits for the receiver.
using StatusChannel = Queue<StatusEvent>;

} // namespace sotto
