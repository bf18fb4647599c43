#include "app.hpp"
#include <iostream>
#include <chrono>

namespace sotto {

App::App() = default;

App::~App() {
    shutdown();
}

std::string App::select_model_id() const {
    if (!config_.model_id.empty()) return config_.model_id;

    // Written by the settings UI; we only read it
    std::string persisted = read_persisted_model_id(default_active_model_path());
    if (!persisted.empty()) return persisted;

    return config_.default_model_id;
}

bool App::initialize(const Config& config) {
    config_ = config;

    // Initialize audio capture
    device_ = std::make_unique<PortAudioDevice>(config_.channels);
    if (!device_->initialize()) {
        std::cerr << "Failed to initialize audio capture" << std::endl;
        return false;
    }
    audio_ = std::make_unique<AudioCapture>(
        *device_,
        config_.sample_rate,
        config_.frame_ms,
        config_.max_reserve_seconds
    );
    std::cout << "Audio capture initialized" << std::endl;

    // Load the model
    ModelOptions options;
    options.translate = config_.translate;
    options.language = config_.language;
    options.n_threads = config_.resolved_threads();

    loader_ = std::make_unique<WhisperModelLoader>();
    models_ = std::make_unique<ModelCoordinator>(*loader_, config_.resolved_model_dir(), options);

    const std::string model_id = select_model_id();
    ModelError err = models_->switch_model(model_id);
    if (err != ModelError::None) {
        std::cerr << "Failed to load model '" << model_id << "': " << to_string(err) << std::endl;
        if (err == ModelError::ModelNotAvailable && find_model(model_id)) {
            std::cerr << "Expected it at " << models_->model_path(model_id) << "\n"
                      << "Download with: curl -L -o " << models_->model_path(model_id) << " \\\n"
                      << "    https://huggingface.co/ggerganov/whisper.cpp/resolve/main/"
                      << find_model(model_id)->filename << std::endl;
        }
        return false;
    }

    engine_ = std::make_unique<TranscriptionEngine>(*models_, config_.min_duration_ms);
    std::cout << "Transcriber initialized (model: " << model_id
              << ", threads: " << options.n_threads << ")" << std::endl;

    // Clipboard + paste
    clipboard_ = std::make_unique<X11Clipboard>();
    keys_ = std::make_unique<X11PasteSender>();
    inserter_ = std::make_unique<TextInserter>(
        *clipboard_, *keys_,
        std::chrono::milliseconds(config_.paste_delay_ms),
        std::chrono::milliseconds(config_.restore_delay_ms)
    );

    orchestrator_ = std::make_unique<Orchestrator>(*audio_, *engine_, *inserter_, status_, config_.auto_paste);

    // Initialize hotkey manager
    hotkey_ = std::make_unique<HotkeyManager>(
        config_.primary_chord,
        config_.secondary_chord,
        std::chrono::milliseconds(config_.debounce_ms)
    );
    if (!hotkey_->initialize()) {
        std::cerr << "Failed to initialize hotkey manager" << std::endl;
        return false;
    }
    hotkey_->set_callback([this](HotkeyEvent event) { orchestrator_->on_hotkey(event); });
    std::cout << "Hotkey manager initialized" << std::endl;

    // Create tray icon
    if (!create_tray_icon(this)) {
        std::cerr << "Failed to create tray icon" << std::endl;
        // Continue anyway - not critical
    }

    return true;
}

void App::shutdown() {
    should_quit_.store(true);

    if (hotkey_) {
        hotkey_->shutdown();
        hotkey_.reset();
    }

    if (orchestrator_) {
        orchestrator_->shutdown();
        orchestrator_.reset();
    }

    status_.stop();

    inserter_.reset();
    keys_.reset();
    clipboard_.reset();
    engine_.reset();

    if (models_) {
        models_->unload();
        models_.reset();
    }
    loader_.reset();

    audio_.reset();
    if (device_) {
        device_->shutdown();
        device_.reset();
    }

    destroy_tray_icon();
}

SessionState App::state() const {
    return orchestrator_ ? orchestrator_->state() : SessionState::Idle;
}

void App::drain_status() {
    StatusEvent event;
    while (status_.pop_for(event, std::chrono::milliseconds(100))) {
        update_tray_state(event);
        if (should_quit_.load()) break;
    }
}

int App::run() {
    if (!hotkey_->start()) {
        std::cerr << "Failed to start hotkey listener" << std::endl;
        return 1;
    }

    std::cout << "\n=== Sotto Ready ===" << std::endl;
    std::cout << "Hold Alt+Space (or Ctrl+Shift+Space) to record, release to transcribe and paste.\n" << std::endl;

    // Status events drive the indicator from this thread
    while (!should_quit_.load()) {
        drain_status();
    }

    return 0;
}

} // namespace sotto
