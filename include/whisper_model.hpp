#pragma once

#include "speech_model.hpp"

// Forward declare whisper types
struct whisper_context;

namespace sotto {

class WhisperModel : public SpeechModel {
public:
    WhisperModel(whisper_context* ctx, const ModelOptions& options);
    ~WhisperModel() override;

    WhisperModel(const WhisperModel&) = delete;
    WhisperModel& operator=(const WhisperModel&) = delete;

    InferenceOutput run(const std::vector<float>& audio) override;

private:
    whisper_context* ctx_ = nullptr;
    ModelOptions options_;
};

class WhisperModelLoader : public ModelLoader {
public:
    std::unique_ptr<SpeechModel> load(const std::string& path,
                                      const ModelOptions& options) override;
};

} // namespace sotto
