#pragma once

#include <memory>
#include <string>
#include <vector>

namespace sotto {

struct ModelOptions {
    bool translate = false;         // Translate to English instead of transcribing
    std::string language = "en";
    int n_threads = 4;
};

// Raw output of one inference call
struct InferenceOutput {
    bool success = false;
    std::string text;               // Segments concatenated, uncleaned
    std::string error;
};

// A loaded, ready-to-run speech recognition context
class SpeechModel {
public:
    virtual ~SpeechModel() = default;

    // Blocking. Audio is 16kHz mono float.
    virtual InferenceOutput run(const std::vector<float>& audio) = 0;
};

// Creates model contexts from files on disk. Returns nullptr on failure.
class ModelLoader {
public:
    virtual ~ModelLoader() = default;

    virtual std::unique_ptr<SpeechModel> load(const std::string& path,
                                              const ModelOptions& options) = 0;
};

} // namespace sotto
