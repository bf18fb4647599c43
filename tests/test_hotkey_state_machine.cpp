// Automated tests for hotkey edge detection

#include "hotkey_state_machine.hpp"
#include <iostream>
#include <cassert>
#include <vector>

using namespace sotto;
using namespace std::chrono_literals;

static const HotkeyChord kAltSpace{MOD_ALT, KEYCODE_SPACE};
static const HotkeyChord kCtrlShiftSpace{MOD_CTRL | MOD_SHIFT, KEYCODE_SPACE};
static const uint32_t KEYCODE_A = 30;

struct Recorder {
    std::vector<HotkeyEvent> events;

    void attach(HotkeyStateMachine& machine) {
        machine.set_callback([this](HotkeyEvent e) { events.push_back(e); });
    }
};

KeyEvent key(uint32_t keycode, bool pressed, uint32_t modifiers, KeyEvent::Clock::time_point t) {
    KeyEvent e;
    e.keycode = keycode;
    e.pressed = pressed;
    e.modifiers = modifiers;
    e.time = t;
    return e;
}

void test_press_and_release() {
    std::cout << "Testing press then release emits Started, Stopped..." << std::endl;

    HotkeyStateMachine machine(kAltSpace, kCtrlShiftSpace);
    Recorder rec;
    rec.attach(machine);
    auto t0 = KeyEvent::Clock::now();

    machine.process(key(KEYCODE_SPACE, true, MOD_ALT, t0));
    assert(machine.is_armed());
    assert(machine.armed_chord() && *machine.armed_chord() == kAltSpace);

    // Alt already released; the base key still ends the gesture
    machine.process(key(KEYCODE_SPACE, false, MOD_NONE, t0 + 500ms));
    assert(!machine.is_armed());

    assert(rec.events.size() == 2);
    assert(rec.events[0] == HotkeyEvent::Started);
    assert(rec.events[1] == HotkeyEvent::Stopped);

    std::cout << "  PASS" << std::endl;
}

void test_release_without_press_is_ignored() {
    std::cout << "Testing key-up with no prior key-down..." << std::endl;

    HotkeyStateMachine machine(kAltSpace, kCtrlShiftSpace);
    Recorder rec;
    rec.attach(machine);

    machine.process(key(KEYCODE_SPACE, false, MOD_ALT, KeyEvent::Clock::now()));
    assert(!machine.is_armed());
    assert(rec.events.empty() && "Stray key-up must not emit");

    std::cout << "  PASS" << std::endl;
}

void test_auto_repeat_ignored() {
    std::cout << "Testing auto-repeat while held..." << std::endl;

    HotkeyStateMachine machine(kAltSpace, kCtrlShiftSpace);
    Recorder rec;
    rec.attach(machine);
    auto t0 = KeyEvent::Clock::now();

    machine.process(key(KEYCODE_SPACE, true, MOD_ALT, t0));
    for (int i = 1; i <= 20; ++i) {
        machine.process(key(KEYCODE_SPACE, true, MOD_ALT, t0 + i * 30ms));
    }
    assert(rec.events.size() == 1 && "Repeats must not re-emit Started");

    std::cout << "  PASS" << std::endl;
}

void test_secondary_chord() {
    std::cout << "Testing secondary chord..." << std::endl;

    HotkeyStateMachine machine(kAltSpace, kCtrlShiftSpace);
    Recorder rec;
    rec.attach(machine);
    auto t0 = KeyEvent::Clock::now();

    machine.process(key(KEYCODE_SPACE, true, MOD_CTRL | MOD_SHIFT, t0));
    assert(machine.is_armed());
    assert(*machine.armed_chord() == kCtrlShiftSpace);

    machine.process(key(KEYCODE_SPACE, false, MOD_CTRL | MOD_SHIFT, t0 + 400ms));
    assert(rec.events.size() == 2 && rec.events[1] == HotkeyEvent::Stopped);

    std::cout << "  PASS" << std::endl;
}

void test_modifiers_must_match_exactly() {
    std::cout << "Testing modifier matching is exact..." << std::endl;

    HotkeyStateMachine machine(kAltSpace, kCtrlShiftSpace);
    Recorder rec;
    rec.attach(machine);
    auto t0 = KeyEvent::Clock::now();

    machine.process(key(KEYCODE_SPACE, true, MOD_NONE, t0));
    machine.process(key(KEYCODE_SPACE, true, MOD_ALT | MOD_SHIFT, t0));
    machine.process(key(KEYCODE_SPACE, true, MOD_CTRL, t0));
    machine.process(key(KEYCODE_A, true, MOD_ALT, t0));
    assert(!machine.is_armed());
    assert(rec.events.empty());

    std::cout << "  PASS" << std::endl;
}

void test_unrelated_release_while_armed() {
    std::cout << "Testing unrelated key-up while armed..." << std::endl;

    HotkeyStateMachine machine(kAltSpace, kCtrlShiftSpace);
    Recorder rec;
    rec.attach(machine);
    auto t0 = KeyEvent::Clock::now();

    machine.process(key(KEYCODE_SPACE, true, MOD_ALT, t0));
    machine.process(key(KEYCODE_A, false, MOD_ALT, t0 + 50ms));
    assert(machine.is_armed() && "Only the chord's key ends the gesture");
    assert(rec.events.size() == 1);

    std::cout << "  PASS" << std::endl;
}

void test_debounce() {
    std::cout << "Testing 100ms debounce after release..." << std::endl;

    HotkeyStateMachine machine(kAltSpace, kCtrlShiftSpace, 100ms);
    Recorder rec;
    rec.attach(machine);
    auto t0 = KeyEvent::Clock::now();

    machine.process(key(KEYCODE_SPACE, true, MOD_ALT, t0));
    machine.process(key(KEYCODE_SPACE, false, MOD_ALT, t0 + 500ms));
    assert(rec.events.size() == 2);

    // 99ms after release: rejected
    machine.process(key(KEYCODE_SPACE, true, MOD_ALT, t0 + 599ms));
    assert(!machine.is_armed());
    assert(rec.events.size() == 2);

    // Exactly 100ms: accepted
    machine.process(key(KEYCODE_SPACE, true, MOD_ALT, t0 + 600ms));
    assert(machine.is_armed());
    assert(rec.events.size() == 3 && rec.events[2] == HotkeyEvent::Started);

    std::cout << "  PASS" << std::endl;
}

void test_first_press_not_debounced() {
    std::cout << "Testing first press is never debounced..." << std::endl;

    HotkeyStateMachine machine(kAltSpace, kCtrlShiftSpace, 100ms);
    Recorder rec;
    rec.attach(machine);

    machine.process(key(KEYCODE_SPACE, true, MOD_ALT, KeyEvent::Clock::time_point{}));
    assert(machine.is_armed());

    std::cout << "  PASS" << std::endl;
}

void test_focus_lost_aborts() {
    std::cout << "Testing focus loss while armed..." << std::endl;

    HotkeyStateMachine machine(kAltSpace, kCtrlShiftSpace);
    Recorder rec;
    rec.attach(machine);
    auto t0 = KeyEvent::Clock::now();

    machine.process(key(KEYCODE_SPACE, true, MOD_ALT, t0));
    machine.focus_lost();
    assert(!machine.is_armed());
    assert(rec.events.size() == 2 && rec.events[1] == HotkeyEvent::Aborted);

    // The later key-up belongs to nothing
    machine.process(key(KEYCODE_SPACE, false, MOD_ALT, t0 + 300ms));
    assert(rec.events.size() == 2);

    std::cout << "  PASS" << std::endl;
}

void test_device_lost() {
    std::cout << "Testing keyboard loss..." << std::endl;

    HotkeyStateMachine machine(kAltSpace, kCtrlShiftSpace);
    Recorder rec;
    rec.attach(machine);

    // Idle: nothing to abort
    machine.device_lost();
    machine.focus_lost();
    assert(rec.events.empty());

    machine.process(key(KEYCODE_SPACE, true, MOD_CTRL | MOD_SHIFT, KeyEvent::Clock::now()));
    machine.device_lost();
    assert(!machine.is_armed());
    assert(rec.events.size() == 2 && rec.events[1] == HotkeyEvent::Aborted);

    std::cout << "  PASS" << std::endl;
}

int main() {
    std::cout << "\n=== Hotkey State Machine Test Suite ===" << std::endl << std::endl;

    test_press_and_release();
    test_release_without_press_is_ignored();
    test_auto_repeat_ignored();
    test_secondary_chord();
    test_modifiers_must_match_exactly();
    test_unrelated_release_while_armed();
    test_debounce();
    test_first_press_not_debounced();
    test_focus_lost_aborts();
    test_device_lost();

    std::cout << "\n=== All Tests Passed! ===" << std::endl << std::endl;
    return 0;
}
