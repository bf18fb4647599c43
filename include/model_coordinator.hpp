#pragma once

#include "config.hpp"
#include "speech_model.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace sotto {

enum class ModelError {
    None,
    ModelNotAvailable,  // Not in the catalog or not downloaded
    Busy,               // A transcription, switch or removal is in progress
    ModelLoadError,     // File present but the context failed to load
    ActiveModelError,   // Refusing to remove the loaded model
    IoError,            // Filesystem failure while removing
    NotLoaded,          // No model to run
};

const char* to_string(ModelError error);

// Loaded context plus what it was loaded as
struct ModelHandle {
    std::unique_ptr<SpeechModel> model;
    std::string id;
    bool translate = false;
};

// Owns the single active model. transcribe(), switch_model() and unload()
// are serialized behind one mutex. switch_model() never waits: it returns
// Busy while a transcription, another switch or a removal is in progress.
class ModelCoordinator {
public:
    ModelCoordinator(ModelLoader& loader, std::string model_dir, ModelOptions options);

    ModelCoordinator(const ModelCoordinator&) = delete;
    ModelCoordinator& operator=(const ModelCoordinator&) = delete;

    ModelError switch_model(const std::string& id);
    ModelError remove_model(const std::string& id);
    void unload();

    bool is_model_downloaded(const std::string& id) const;
    std::optional<std::string> get_active_model_id() const;
    std::vector<ModelInfo> list_models() const;

    // Language mode used by the next load
    void set_translate(bool translate);

    // Runs the active model. Blocks while a switch is loading.
    ModelError transcribe(const std::vector<float>& audio, InferenceOutput& output);

    bool is_transcribing() const { return transcribing_.load(); }

    std::string model_path(const std::string& id) const;
    const std::string& model_dir() const { return model_dir_; }

private:
    ModelLoader& loader_;
    std::string model_dir_;

    // Held by switch_model() and remove_model(). switch_model() only try-locks it.
    std::mutex lifecycle_mutex_;

    // Guards handle_ and options_
    mutable std::mutex mutex_;
    ModelHandle handle_;
    ModelOptions options_;

    // Readable without the lock for status queries
    mutable std::mutex id_mutex_;
    std::string active_id_;

    std::atomic<bool> transcribing_{false};
};

} // namespace sotto
