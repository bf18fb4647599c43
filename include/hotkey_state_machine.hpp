#pragma once

#include "config.hpp"

#include <chrono>
#include <cstdint>
#include <functional>

namespace sotto {

enum class HotkeyEvent {
    Started,    // A chord went down
    Stopped,    // The armed chord's key came up
    Aborted,    // Focus or keyboard lost while armed; recording must be discarded
};

const char* to_string(HotkeyEvent event);

struct KeyEvent {
    using Clock = std::chrono::steady_clock;

    uint32_t keycode = 0;
    bool pressed = false;       // true for key-down and auto-repeat
    uint32_t modifiers = MOD_NONE;  // Modifiers held at the time, excluding keycode itself
    Clock::time_point time{};
};

// Press/release edge detection for two interchangeable chords.
// Not thread-safe: feed it from a single event thread.
class HotkeyStateMachine {
public:
    using Callback = std::function<void(HotkeyEvent)>;

    HotkeyStateMachine(HotkeyChord primary, HotkeyChord secondary,
                       std::chrono::milliseconds debounce = std::chrono::milliseconds(100));

    HotkeyStateMachine(const HotkeyStateMachine&) = delete;
    HotkeyStateMachine& operator=(const HotkeyStateMachine&) = delete;

    void set_callback(Callback callback) { callback_ = std::move(callback); }

    void process(const KeyEvent& event);

    // Both force Idle and emit Aborted if a chord is armed
    void focus_lost();
    void device_lost();

    bool is_armed() const { return armed_ != nullptr; }
    const HotkeyChord* armed_chord() const { return armed_; }

private:
    const HotkeyChord* match(const KeyEvent& event) const;
    void abort_armed(const char* reason);
    void emit(HotkeyEvent event);

    HotkeyChord primary_;
    HotkeyChord secondary_;
    std::chrono::milliseconds debounce_;

    const HotkeyChord* armed_ = nullptr;
    bool released_once_ = false;
    KeyEvent::Clock::time_point last_release_{};

    Callback callback_;
};

} // namespace sotto
