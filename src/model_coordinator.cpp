#include "model_coordinator.hpp"
#include <atomic>
#include <filesystem>
#include <iostream>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace sotto {

namespace {
// Set for the lifetime of one run(), cleared even if it throws
class TranscribingFlag {
public:
    explicit TranscribingFlag(std::atomic<bool>& flag) : flag_(flag) { flag_.store(true); }
    ~TranscribingFlag() { flag_.store(false); }

    TranscribingFlag(const TranscribingFlag&) = delete;
    TranscribingFlag& operator=(const TranscribingFlag&) = delete;

private:
    std::atomic<bool>& flag_;
};
} // namespace

const char* to_string(ModelError error) {
    switch (error) {
        case ModelError::None: return "ok";
        case ModelError::ModelNotAvailable: return "model not available";
        case ModelError::Busy: return "busy";
        case ModelError::ModelLoadError: return "model load error";
        case ModelError::ActiveModelError: return "model is active";
        case ModelError::IoError: return "i/o error";
        case ModelError::NotLoaded: return "no model loaded";
    }
    return "unknown";
}

ModelCoordinator::ModelCoordinator(ModelLoader& loader, std::string model_dir, ModelOptions options)
    : loader_(loader)
    , model_dir_(std::move(model_dir))
    , options_(std::move(options)) {
}

std::string ModelCoordinator::model_path(const std::string& id) const {
    const ModelInfo* info = find_model(id);
    if (!info) return "";
    return (fs::path(model_dir_) / info->filename).string();
}

bool ModelCoordinator::is_model_downloaded(const std::string& id) const {
    std::string path = model_path(id);
    if (path.empty()) return false;

    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

std::optional<std::string> ModelCoordinator::get_active_model_id() const {
    std::lock_guard<std::mutex> lock(id_mutex_);
    if (active_id_.empty()) return std::nullopt;
    return active_id_;
}

std::vector<ModelInfo> ModelCoordinator::list_models() const {
    const auto active = get_active_model_id();

    std::vector<ModelInfo> models = model_catalog();
    for (auto& info : models) {
        info.is_downloaded = is_model_downloaded(info.id);
        info.is_active = active && *active == info.id;
    }
    return models;
}

void ModelCoordinator::set_translate(bool translate) {
    std::lock_guard<std::mutex> lock(mutex_);
    options_.translate = translate;
}

ModelError ModelCoordinator::switch_model(const std::string& id) {
    // A second switch is refused, not queued
    std::unique_lock<std::mutex> lifecycle(lifecycle_mutex_, std::try_to_lock);
    if (!lifecycle.owns_lock()) {
        std::cerr << "Cannot switch to " << id << " while another model operation is running" << std::endl;
        return ModelError::Busy;
    }

    if (!is_model_downloaded(id)) {
        std::cerr << "Model not available: " << id << std::endl;
        return ModelError::ModelNotAvailable;
    }

    // No queuing behind a running transcription
    std::unique_lock<std::mutex> lock(mutex_, std::try_to_lock);
    if (!lock.owns_lock()) {
        std::cerr << "Cannot switch to " << id << " while transcribing" << std::endl;
        return ModelError::Busy;
    }

    if (handle_.model && handle_.id == id && handle_.translate == options_.translate) {
        return ModelError::None;
    }

    std::cout << "Loading model " << id << "..." << std::endl;
    std::unique_ptr<SpeechModel> model = loader_.load(model_path(id), options_);
    if (!model) {
        std::cerr << "Failed to load model " << id << ", keeping "
                  << (handle_.id.empty() ? std::string("none") : handle_.id) << std::endl;
        return ModelError::ModelLoadError;
    }

    // The previous context is released only now that the new one is up
    ModelHandle previous = std::move(handle_);
    handle_.model = std::move(model);
    handle_.id = id;
    handle_.translate = options_.translate;
    {
        std::lock_guard<std::mutex> id_lock(id_mutex_);
        active_id_ = id;
    }
    previous.model.reset();

    std::cout << "Active model: " << id << std::endl;
    return ModelError::None;
}

ModelError ModelCoordinator::remove_model(const std::string& id) {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);

    const auto active = get_active_model_id();
    if (active && *active == id) {
        std::cerr << "Refusing to remove active model " << id << std::endl;
        return ModelError::ActiveModelError;
    }

    std::string path = model_path(id);
    if (path.empty()) return ModelError::ModelNotAvailable;

    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return ModelError::None;
    }

    fs::remove(path, ec);
    if (ec) {
        std::cerr << "Failed to remove " << path << ": " << ec.message() << std::endl;
        return ModelError::IoError;
    }

    std::cout << "Removed model " << id << std::endl;
    return ModelError::None;
}

void ModelCoordinator::unload() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!handle_.model) return;

    handle_.model.reset();
    handle_.id.clear();
    {
        std::lock_guard<std::mutex> id_lock(id_mutex_);
        active_id_.clear();
    }
    std::cout << "Model unloaded" << std::endl;
}

ModelError ModelCoordinator::transcribe(const std::vector<float>& audio, InferenceOutput& output) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!handle_.model) {
        output.success = false;
        output.error = "No model loaded";
        return ModelError::NotLoaded;
    }

    TranscribingFlag flag(transcribing_);
    output = handle_.model->run(audio);
    return ModelError::None;
}

} // namespace sotto
