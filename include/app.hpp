#pragma once

#include "config.hpp"
#include "audio_capture.hpp"
#include "portaudio_device.hpp"
#include "whisper_model.hpp"
#include "model_coordinator.hpp"
#include "transcription_engine.hpp"
#include "clipboard.hpp"
#include "text_inserter.hpp"
#include "status_channel.hpp"
#include "orchestrator.hpp"
#include "hotkey_manager.hpp"

#include <memory>
#include <atomic>
#include <string>

namespace sotto {

// Builds the Linux implementations of every seam and runs the event loop
class App {
public:
    App();
    ~App();

    // Initialize all components
    bool initialize(const Config& config);
    void shutdown();

    // Run the application (blocking)
    int run();

    // Stop the application
    void quit() { should_quit_.store(true); }

    SessionState state() const;

    // Model lifecycle surface for the settings UI
    ModelCoordinator* models() { return models_.get(); }

private:
    std::string select_model_id() const;
    void drain_status();

    Config config_;

    std::unique_ptr<PortAudioDevice> device_;
    std::unique_ptr<AudioCapture> audio_;
    std::unique_ptr<WhisperModelLoader> loader_;
    std::unique_ptr<ModelCoordinator> models_;
    std::unique_ptr<TranscriptionEngine> engine_;
    std::unique_ptr<X11Clipboard> clipboard_;
    std::unique_ptr<X11PasteSender> keys_;
    std::unique_ptr<TextInserter> inserter_;
    StatusChannel status_;
    std::unique_ptr<Orchestrator> orchestrator_;
    std::unique_ptr<HotkeyManager> hotkey_;

    std::atomic<bool> should_quit_{false};
};

// Platform-specific tray icon
bool create_tray_icon(App* app);
void destroy_tray_icon();
void update_tray_state(const StatusEvent& event);

} // namespace sotto
