#include "app.hpp"
#include <iostream>
#include <string>

// Linux tray implementation - basic version without GUI dependencies
// For a full implementation, would use libappindicator or Qt

namespace sotto {

bool create_tray_icon(App* app) {
    // Linux tray icon would require GTK or Qt
    // For now, just print status to console
    std::cout << "Tray icon not implemented on Linux - use console output" << std::endl;
    if (app && app->models()) {
        auto active = app->models()->get_active_model_id();
        std::cout << "[Sotto] Model: " << (active ? *active : std::string("none")) << std::endl;
    }
    return true;
}

void destroy_tray_icon() {
}

void update_tray_state(const StatusEvent& event) {
    switch (event.kind) {
        case StatusEvent::Kind::RecordingStarted:
            std::cout << "[Sotto] Recording..." << std::endl;
            break;
        case StatusEvent::Kind::RecordingStopped:
            std::cout << "[Sotto] Transcribing..." << std::endl;
            break;
        case StatusEvent::Kind::TranscriptionFailed:
            std::cout << "[Sotto] Error (" << to_string(event.failure) << ")";
            if (!event.text.empty()) std::cout << ": " << event.text;
            std::cout << std::endl;
            break;
        case StatusEvent::Kind::TextInserted:
            std::cout << "[Sotto] Inserted: " << event.text << std::endl;
            break;
        case StatusEvent::Kind::Idle:
            std::cout << "[Sotto] Ready" << std::endl;
            break;
    }
}

} // namespace sotto
