#include "hotkey_manager.hpp"
#include <iostream>

namespace sotto {

// Linux input key codes for modifiers (linux/input-event-codes.h)
namespace {
constexpr uint32_t KEY_LEFTCTRL_CODE = 29;
constexpr uint32_t KEY_RIGHTCTRL_CODE = 97;
constexpr uint32_t KEY_LEFTSHIFT_CODE = 42;
constexpr uint32_t KEY_RIGHTSHIFT_CODE = 54;
constexpr uint32_t KEY_LEFTALT_CODE = 56;
constexpr uint32_t KEY_RIGHTALT_CODE = 100;
constexpr uint32_t KEY_LEFTMETA_CODE = 125;
constexpr uint32_t KEY_RIGHTMETA_CODE = 126;

// Index into left_right_held_, or -1 for non-modifiers
int modifier_index(uint32_t keycode) {
    switch (keycode) {
        case KEY_LEFTCTRL_CODE: case KEY_RIGHTCTRL_CODE: return 0;
        case KEY_LEFTSHIFT_CODE: case KEY_RIGHTSHIFT_CODE: return 1;
        case KEY_LEFTALT_CODE: case KEY_RIGHTALT_CODE: return 2;
        case KEY_LEFTMETA_CODE: case KEY_RIGHTMETA_CODE: return 3;
        default: return -1;
    }
}

constexpr uint32_t kModifierBits[4] = {MOD_CTRL, MOD_SHIFT, MOD_ALT, MOD_SUPER};
} // namespace

HotkeyManager::HotkeyManager(const HotkeyChord& primary, const HotkeyChord& secondary,
                             std::chrono::milliseconds debounce)
    : machine_(primary, secondary, debounce) {
    machine_.set_callback([this](HotkeyEvent event) {
        if (callback_) callback_(event);
    });
}

HotkeyManager::~HotkeyManager() {
    shutdown();
}

void HotkeyManager::update_modifiers(uint32_t keycode, bool down) {
    int idx = modifier_index(keycode);
    if (idx < 0) return;

    // Count left and right separately so releasing one side keeps the bit
    if (down) {
        if (left_right_held_[idx] < 2) ++left_right_held_[idx];
    } else if (left_right_held_[idx] > 0) {
        --left_right_held_[idx];
    }

    if (left_right_held_[idx] > 0) {
        held_modifiers_ |= kModifierBits[idx];
    } else {
        held_modifiers_ &= ~kModifierBits[idx];
    }
}

void HotkeyManager::handle_key(uint32_t keycode, int value) {
    // evdev: 0 = release, 1 = press, 2 = autorepeat
    const bool pressed = value != 0;

    if (modifier_index(keycode) >= 0) {
        if (value != 2) update_modifiers(keycode, pressed);
        return;
    }

    KeyEvent event;
    event.keycode = keycode;
    event.pressed = pressed;
    event.modifiers = held_modifiers_;
    event.time = KeyEvent::Clock::now();
    machine_.process(event);
}

void HotkeyManager::handle_device_lost() {
    held_modifiers_ = MOD_NONE;
    for (auto& count : left_right_held_) count = 0;
    machine_.device_lost();
}

void HotkeyManager::handle_focus_lost() {
    held_modifiers_ = MOD_NONE;
    for (auto& count : left_right_held_) count = 0;
    machine_.focus_lost();
}

// Platform-specific implementations in platform/*/hotkey_*.cpp

} // namespace sotto
