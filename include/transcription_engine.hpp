#pragma once

#include "model_coordinator.hpp"
#include "sample_buffer.hpp"
#include "text_processor.hpp"

#include <cstdint>
#include <string>

namespace sotto {

enum class TranscriptionStatus {
    Ok,         // text is non-empty
    TooShort,   // Below the minimum duration; the model was not run
    Failed,     // Model error, no model, or nothing usable came back
};

const char* to_string(TranscriptionStatus status);

struct TranscriptionResult {
    TranscriptionStatus status = TranscriptionStatus::Failed;
    std::string text;
    std::string raw_text;  // Model output before cleaning
    int64_t duration_ms = 0;
    std::string error;

    bool success() const { return status == TranscriptionStatus::Ok; }
};

// Runs the active model on a finished recording. Blocking; call it off the
// hotkey thread.
class TranscriptionEngine {
public:
    TranscriptionEngine(ModelCoordinator& models, int min_duration_ms = 300);

    // Takes ownership of the buffer; it is released when the call returns
    TranscriptionResult transcribe(SampleBuffer buffer);

    // True when the buffer is shorter than the minimum duration
    bool is_too_short(const SampleBuffer& buffer) const;

    int min_duration_ms() const { return min_duration_ms_; }

private:
    ModelCoordinator& models_;
    int min_duration_ms_;
    TextProcessor text_processor_;
};

} // namespace sotto
