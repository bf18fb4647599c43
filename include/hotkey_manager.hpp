#pragma once

#include "hotkey_state_machine.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <thread>

namespace sotto {

// Global keyboard listener. Reads raw key events on its own thread and
// drives a HotkeyStateMachine, so callbacks run on the listener thread.
class HotkeyManager {
public:
    using HotkeyCallback = std::function<void(HotkeyEvent)>;

    HotkeyManager(const HotkeyChord& primary, const HotkeyChord& secondary,
                  std::chrono::milliseconds debounce);
    ~HotkeyManager();

    // Initialize the hotkey system
    bool initialize();
    void shutdown();

    void set_callback(HotkeyCallback callback) { callback_ = std::move(callback); }

    // Start/stop listening
    bool start();
    void stop();
    bool is_running() const { return running_.load(); }

    // Feed one raw key transition (keycode is a Linux input key code)
    void handle_key(uint32_t keycode, int value);

    // Called by the listener when the keyboard device goes away
    void handle_device_lost();

    // Key state can no longer be trusted (events dropped by the kernel)
    void handle_focus_lost();

private:
    void run_loop();
    void update_modifiers(uint32_t keycode, bool down);

    HotkeyStateMachine machine_;
    HotkeyCallback callback_;
    uint32_t held_modifiers_ = MOD_NONE;
    uint32_t left_right_held_[4] = {0, 0, 0, 0};

    std::atomic<bool> running_{false};
    std::thread listener_thread_;

    // Platform-specific handle
    void* platform_handle_ = nullptr;
};

} // namespace sotto
