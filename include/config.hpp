#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>

namespace sotto {

// Whisper models the app knows how to find on disk
struct ModelInfo {
    std::string id;
    std::string filename;
    int size_mb = 0;

    // Filled in by ModelCoordinator::list_models()
    bool is_downloaded = false;
    bool is_active = false;
};

inline const std::vector<ModelInfo>& model_catalog() {
    static const std::vector<ModelInfo> catalog = {
        {"tiny", "ggml-tiny.bin", 75},
        {"base", "ggml-base.bin", 142},
        {"small", "ggml-small.bin", 466},
        {"medium", "ggml-medium.bin", 1500},
        {"large-v3-turbo", "ggml-large-v3-turbo.bin", 1620},
    };
    return catalog;
}

// Returns nullptr for ids not in the catalog
inline const ModelInfo* find_model(const std::string& id) {
    for (const auto& info : model_catalog()) {
        if (info.id == id) return &info;
    }
    return nullptr;
}

// Hotkey modifier bits. Left and right variants fold into the same bit.
enum ModifierMask : uint32_t {
    MOD_NONE  = 0,
    MOD_CTRL  = 1u << 0,
    MOD_SHIFT = 1u << 1,
    MOD_ALT   = 1u << 2,
    MOD_SUPER = 1u << 3,
};

// A modifier set plus one base key (Linux input key code)
struct HotkeyChord {
    uint32_t modifiers = MOD_NONE;
    uint32_t keycode = 0;

    bool operator==(const HotkeyChord& other) const {
        return modifiers == other.modifiers && keycode == other.keycode;
    }
};

// Linux input key codes (linux/input-event-codes.h) used for the defaults
constexpr uint32_t KEYCODE_SPACE = 57;

struct Config {
    // Audio settings
    int sample_rate = 16000;        // Whisper expects 16kHz
    int channels = 1;               // Mono
    int frame_ms = 10;              // Frame length delivered by the device
    int max_reserve_seconds = 30;   // Buffer capacity reserved per recording

    // Whisper model
    std::string model_dir;          // Empty: ~/.local/share/sotto/models
    std::string model_id;           // Empty: persisted choice, then default_model_id
    std::string default_model_id = "base";
    int n_threads = 0;              // 0: half the hardware threads
    bool translate = false;         // Translate to English instead of transcribing
    std::string language = "en";

    // Hotkeys: Alt+Space, or Ctrl+Shift+Space
    HotkeyChord primary_chord{MOD_ALT, KEYCODE_SPACE};
    HotkeyChord secondary_chord{MOD_CTRL | MOD_SHIFT, KEYCODE_SPACE};
    int debounce_ms = 100;          // Ignore a press this soon after a release

    // Recordings shorter than this are skipped without running the model
    int min_duration_ms = 300;

    // Behavior
    bool auto_paste = true;
    int paste_delay_ms = 100;       // Let the clipboard settle before Ctrl+V
    int restore_delay_ms = 50;      // Let the target read the clipboard before restoring

    std::string resolved_model_dir() const;
    int resolved_threads() const;
};

// Directory holding $XDG_CONFIG_HOME/sotto (or ~/.config/sotto)
std::string default_config_dir();

// Directory holding the downloaded ggml models
std::string default_model_dir();

// Reads the active model id written by the settings UI. Empty if none.
std::string read_persisted_model_id(const std::string& path);

// Default location of the persisted active model id
std::string default_active_model_path();

} // namespace sotto
