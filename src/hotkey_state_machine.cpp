#include "hotkey_state_machine.hpp"
#include <iostream>

namespace sotto {

const char* to_string(HotkeyEvent event) {
    switch (event) {
        case HotkeyEvent::Started: return "started";
        case HotkeyEvent::Stopped: return "stopped";
        case HotkeyEvent::Aborted: return "aborted";
    }
    return "unknown";
}

HotkeyStateMachine::HotkeyStateMachine(HotkeyChord primary, HotkeyChord secondary,
                                       std::chrono::milliseconds debounce)
    : primary_(primary)
    , secondary_(secondary)
    , debounce_(debounce) {
}

const HotkeyChord* HotkeyStateMachine::match(const KeyEvent& event) const {
    if (event.keycode == primary_.keycode && event.modifiers == primary_.modifiers) {
        return &primary_;
    }
    if (event.keycode == secondary_.keycode && event.modifiers == secondary_.modifiers) {
        return &secondary_;
    }
    return nullptr;
}

void HotkeyStateMachine::process(const KeyEvent& event) {
    if (event.pressed) {
        // OS key repeat while held
        if (armed_) return;

        const HotkeyChord* chord = match(event);
        if (!chord) return;

        if (released_once_ && event.time - last_release_ < debounce_) {
            return;
        }

        armed_ = chord;
        emit(HotkeyEvent::Started);
        return;
    }

    // Key-up: only the armed chord's base key ends the gesture
    if (!armed_ || event.keycode != armed_->keycode) return;

    armed_ = nullptr;
    released_once_ = true;
    last_release_ = event.time;
    emit(HotkeyEvent::Stopped);
}

void HotkeyStateMachine::focus_lost() {
    abort_armed("input focus lost");
}

void HotkeyStateMachine::device_lost() {
    abort_armed("keyboard disconnected");
}

void HotkeyStateMachine::abort_armed(const char* reason) {
    if (!armed_) return;

    std::cerr << "Hotkey aborted: " << reason << std::endl;
    armed_ = nullptr;
    emit(HotkeyEvent::Aborted);
}

void HotkeyStateMachine::emit(HotkeyEvent event) {
    if (callback_) callback_(event);
}

} // namespace sotto
