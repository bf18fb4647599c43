#include "hotkey_manager.hpp"
#include <iostream>
#include <string>
#include <cerrno>
#include <fcntl.h>
#include <unistd.h>
#include <linux/input.h>
#include <sys/ioctl.h>
#include <sys/select.h>

#ifdef HAS_LIBEVDEV
#include <libevdev/libevdev.h>
#endif

namespace sotto {

struct LinuxHotkeyState {
    int keyboard_fd = -1;
#ifdef HAS_LIBEVDEV
    struct libevdev* dev = nullptr;
#endif
    std::string device_path;
};

static LinuxHotkeyState* state_of(void* handle) {
    return static_cast<LinuxHotkeyState*>(handle);
}

static void close_keyboard(LinuxHotkeyState* state) {
#ifdef HAS_LIBEVDEV
    if (state->dev) {
        libevdev_free(state->dev);
        state->dev = nullptr;
    }
#endif
    if (state->keyboard_fd >= 0) {
        close(state->keyboard_fd);
        state->keyboard_fd = -1;
    }
}

// Finds the first /dev/input/event* node that looks like a keyboard
static bool open_keyboard(LinuxHotkeyState* state) {
    for (int i = 0; i < 32; ++i) {
        std::string path = "/dev/input/event" + std::to_string(i);
        int fd = open(path.c_str(), O_RDONLY | O_NONBLOCK);
        if (fd < 0) continue;

#ifdef HAS_LIBEVDEV
        struct libevdev* dev = nullptr;
        int rc = libevdev_new_from_fd(fd, &dev);
        if (rc >= 0) {
            // Must have a space bar and letters to count as a keyboard
            if (libevdev_has_event_type(dev, EV_KEY) &&
                libevdev_has_event_code(dev, EV_KEY, KEY_A) &&
                libevdev_has_event_code(dev, EV_KEY, KEY_SPACE)) {
                state->dev = dev;
                state->keyboard_fd = fd;
                state->device_path = path;
                std::cout << "Using keyboard: " << path << " (" << libevdev_get_name(dev) << ")" << std::endl;
                return true;
            }
            libevdev_free(dev);
        }
#else
        unsigned long key_bits[KEY_MAX / (8 * sizeof(unsigned long)) + 1] = {0};
        if (ioctl(fd, EVIOCGBIT(EV_KEY, sizeof(key_bits)), key_bits) >= 0) {
            const size_t bits = 8 * sizeof(unsigned long);
            bool has_a = key_bits[KEY_A / bits] & (1UL << (KEY_A % bits));
            bool has_space = key_bits[KEY_SPACE / bits] & (1UL << (KEY_SPACE % bits));
            if (has_a && has_space) {
                state->keyboard_fd = fd;
                state->device_path = path;
                std::cout << "Using keyboard: " << path << std::endl;
                return true;
            }
        }
#endif
        close(fd);
    }
    return false;
}

bool HotkeyManager::initialize() {
    if (platform_handle_) return true;

    platform_handle_ = new LinuxHotkeyState();
    return true;
}

void HotkeyManager::shutdown() {
    stop();

    if (platform_handle_) {
        auto* state = state_of(platform_handle_);
        close_keyboard(state);
        delete state;
    }
    platform_handle_ = nullptr;
}

bool HotkeyManager::start() {
    if (running_.load()) return true;
    if (!platform_handle_) return false;

    auto* state = state_of(platform_handle_);
    if (!open_keyboard(state)) {
        std::cerr << "Failed to open keyboard device. Try running with sudo or add user to input group." << std::endl;
        return false;
    }

    running_.store(true);

    // Start listener thread
    listener_thread_ = std::thread([this]() {
        run_loop();
    });

    return true;
}

void HotkeyManager::stop() {
    if (!running_.load()) return;

    running_.store(false);

    if (listener_thread_.joinable()) {
        listener_thread_.join();
    }
}

void HotkeyManager::run_loop() {
    auto* state = state_of(platform_handle_);
    struct input_event ev;

    while (running_.load()) {
        if (state->keyboard_fd < 0) {
            // Keyboard went away; poll for it to come back
            usleep(500000);
            if (open_keyboard(state)) {
                std::cout << "Keyboard reconnected" << std::endl;
            }
            continue;
        }

        fd_set fds;
        FD_ZERO(&fds);
        FD_SET(state->keyboard_fd, &fds);

        struct timeval tv;
        tv.tv_sec = 0;
        tv.tv_usec = 100000; // 100ms timeout

        int ret = select(state->keyboard_fd + 1, &fds, nullptr, nullptr, &tv);
        if (ret <= 0) continue;

        bool lost = false;
#ifdef HAS_LIBEVDEV
        int rc;
        do {
            rc = libevdev_next_event(state->dev, LIBEVDEV_READ_FLAG_NORMAL, &ev);
            if (rc == LIBEVDEV_READ_STATUS_SYNC) {
                // SYN_DROPPED: drain the resync and start over from a clean state
                handle_focus_lost();
                while (rc == LIBEVDEV_READ_STATUS_SYNC) {
                    rc = libevdev_next_event(state->dev, LIBEVDEV_READ_FLAG_SYNC, &ev);
                }
                continue;
            }
            if (rc == LIBEVDEV_READ_STATUS_SUCCESS && ev.type == EV_KEY) {
                handle_key(ev.code, ev.value);
            }
        } while (rc == LIBEVDEV_READ_STATUS_SUCCESS);
        lost = (rc == -ENODEV);
#else
        ssize_t n;
        while ((n = read(state->keyboard_fd, &ev, sizeof(ev))) == sizeof(ev)) {
            if (ev.type == EV_KEY) {
                handle_key(ev.code, ev.value);
            } else if (ev.type == EV_SYN && ev.code == SYN_DROPPED) {
                handle_focus_lost();
            }
        }
        lost = (n < 0 && errno == ENODEV);
#endif

        if (lost) {
            std::cerr << "Keyboard disconnected: " << state->device_path << std::endl;
            close_keyboard(state);
            handle_device_lost();
        }
    }
}

} // namespace sotto
