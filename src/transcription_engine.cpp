#include "transcription_engine.hpp"
#include <chrono>
#include <iostream>

namespace sotto {

const char* to_string(TranscriptionStatus status) {
    switch (status) {
        case TranscriptionStatus::Ok: return "ok";
        case TranscriptionStatus::TooShort: return "too short";
        case TranscriptionStatus::Failed: return "failed";
    }
    return "unknown";
}

TranscriptionEngine::TranscriptionEngine(ModelCoordinator& models, int min_duration_ms)
    : models_(models)
    , min_duration_ms_(min_duration_ms) {
}

bool TranscriptionEngine::is_too_short(const SampleBuffer& buffer) const {
    if (buffer.sample_rate() <= 0) return true;

    // size / rate < min_ms / 1000, without rounding
    const int64_t lhs = static_cast<int64_t>(buffer.size()) * 1000;
    const int64_t rhs = static_cast<int64_t>(min_duration_ms_) * buffer.sample_rate();
    return lhs < rhs;
}

TranscriptionResult TranscriptionEngine::transcribe(SampleBuffer buffer) {
    TranscriptionResult result;

    if (is_too_short(buffer)) {
        std::cout << "Audio too short (" << buffer.size() << " samples, "
                  << buffer.duration_ms() << "ms), skipping transcription" << std::endl;
        result.status = TranscriptionStatus::TooShort;
        return result;
    }

    std::cout << "Starting transcription of " << buffer.size() << " samples..." << std::endl;
    auto start_time = std::chrono::steady_clock::now();

    InferenceOutput output;
    ModelError err = models_.transcribe(buffer.samples(), output);

    auto end_time = std::chrono::steady_clock::now();
    result.duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time).count();

    if (err != ModelError::None) {
        result.status = TranscriptionStatus::Failed;
        result.error = to_string(err);
        return result;
    }

    if (!output.success) {
        result.status = TranscriptionStatus::Failed;
        result.error = output.error.empty() ? "inference failed" : output.error;
        return result;
    }

    result.raw_text = output.text;
    std::string text = text_processor_.process(output.text);

    if (text.empty() || TextProcessor::is_noise(text)) {
        result.status = TranscriptionStatus::Failed;
        result.error = "no speech recognized";
        std::cerr << "Transcription produced no usable text (raw: \"" << result.raw_text << "\")" << std::endl;
        return result;
    }

    result.text = text;
    result.status = TranscriptionStatus::Ok;

    std::cout << "Transcription took " << result.duration_ms << "ms: \"" << result.text << "\"" << std::endl;
    if (result.raw_text != result.text) {
        std::cout << "  (raw: \"" << result.raw_text << "\")" << std::endl;
    }

    return result;
}

} // namespace sotto
