#include "clipboard.hpp"
#include <iostream>
#include <cstdio>
#include <cstdlib>
#include <array>
#include <sstream>
#include <vector>
#include <sys/wait.h>

#include <X11/Xlib.h>
#include <X11/Xatom.h>
#include <X11/keysym.h>
#include <X11/extensions/XTest.h>

namespace sotto {

namespace {

// Runs a command and collects its stdout as bytes. False if it could not run
// or exited non-zero.
bool exec_read(const std::string& cmd, std::string& out) {
    out.clear();
    FILE* pipe = popen(cmd.c_str(), "r");
    if (!pipe) return false;

    std::array<char, 4096> buffer;
    size_t n;
    while ((n = fread(buffer.data(), 1, buffer.size(), pipe)) > 0) {
        out.append(buffer.data(), n);
    }

    int status = pclose(pipe);
    return status != -1 && WIFEXITED(status) && WEXITSTATUS(status) == 0;
}

bool exec_write(const std::string& cmd, const std::string& data) {
    FILE* pipe = popen(cmd.c_str(), "w");
    if (!pipe) return false;

    size_t written = data.empty() ? 0 : fwrite(data.data(), 1, data.size(), pipe);
    int status = pclose(pipe);
    return written == data.size() && status != -1 && WIFEXITED(status) && WEXITSTATUS(status) == 0;
}

bool have_tool(const char* name) {
    std::string cmd = std::string("command -v ") + name + " >/dev/null 2>&1";
    return std::system(cmd.c_str()) == 0;
}

std::string shell_quote(const std::string& s) {
    std::string quoted = "'";
    for (char c : s) {
        if (c == '\'') quoted += "'\\''";
        else quoted += c;
    }
    quoted += "'";
    return quoted;
}

// Preferred restore formats, richest first
const char* const kPreferredTargets[] = {
    "image/png",
    "text/html",
    "text/uri-list",
    "UTF8_STRING",
    "text/plain;charset=utf-8",
    "text/plain",
    "STRING",
};

std::string pick_target(const std::string& targets) {
    std::vector<std::string> offered;
    std::istringstream lines(targets);
    std::string line;
    while (std::getline(lines, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (!line.empty()) offered.push_back(line);
    }

    for (const char* preferred : kPreferredTargets) {
        for (const auto& t : offered) {
            if (t == preferred) return t;
        }
    }
    return "";
}

} // namespace

bool X11Clipboard::read(ClipboardContent& content) {
    content = ClipboardContent{};

    if (have_tool("xclip")) {
        std::string targets;
        if (!exec_read("xclip -selection clipboard -t TARGETS -o 2>/dev/null", targets)) {
            // No owner: nothing to save
            content.empty = true;
            return true;
        }

        std::string target = pick_target(targets);
        if (target.empty()) {
            content.empty = true;
            return true;
        }

        std::string data;
        if (!exec_read("xclip -selection clipboard -t " + shell_quote(target) + " -o 2>/dev/null", data)) {
            std::cerr << "Failed to read clipboard as " << target << std::endl;
            return false;
        }
        content.data = data;
        content.format = target;
        return true;
    }

    if (have_tool("xsel")) {
        // xsel only speaks text
        std::string data;
        if (!exec_read("xsel --clipboard --output 2>/dev/null", data)) {
            content.empty = true;
            return true;
        }
        content.data = data;
        content.format = "UTF8_STRING";
        content.empty = data.empty();
        return true;
    }

    std::cerr << "Failed to read clipboard. Install xclip or xsel." << std::endl;
    return false;
}

bool X11Clipboard::write(const ClipboardContent& content) {
    if (have_tool("xclip")) {
        if (content.empty) {
            // Hand ownership back with nothing in it
            return exec_write("xclip -selection clipboard -i /dev/null 2>/dev/null", "");
        }
        std::string cmd = "xclip -selection clipboard -t " + shell_quote(content.format) + " -i 2>/dev/null";
        return exec_write(cmd, content.data);
    }

    if (have_tool("xsel")) {
        if (content.empty) {
            return exec_write("xsel --clipboard --clear 2>/dev/null", "");
        }
        return exec_write("xsel --clipboard --input 2>/dev/null", content.data);
    }

    std::cerr << "Failed to set clipboard. Install xclip or xsel." << std::endl;
    return false;
}

bool X11PasteSender::send_paste() {
    Display* display = XOpenDisplay(nullptr);
    if (!display) {
        std::cerr << "Failed to open X display" << std::endl;
        return false;
    }

    int event_base, error_base, major, minor;
    if (!XTestQueryExtension(display, &event_base, &error_base, &major, &minor)) {
        std::cerr << "XTest extension not available" << std::endl;
        XCloseDisplay(display);
        return false;
    }

    Window focused = None;
    int revert_to = 0;
    XGetInputFocus(display, &focused, &revert_to);
    if (focused == None || focused == PointerRoot) {
        std::cerr << "No focused window to paste into" << std::endl;
        XCloseDisplay(display);
        return false;
    }

    KeyCode ctrl_keycode = XKeysymToKeycode(display, XK_Control_L);
    KeyCode v_keycode = XKeysymToKeycode(display, XK_v);

    if (ctrl_keycode == 0 || v_keycode == 0) {
        std::cerr << "Failed to get keycodes" << std::endl;
        XCloseDisplay(display);
        return false;
    }

    // The hotkey's modifiers may still be down; Alt+Ctrl+V would not paste
    const KeySym held[] = {XK_Alt_L, XK_Alt_R, XK_Shift_L, XK_Shift_R, XK_Super_L, XK_Super_R};
    for (KeySym sym : held) {
        KeyCode code = XKeysymToKeycode(display, sym);
        if (code != 0) XTestFakeKeyEvent(display, code, False, 0);
    }
    XFlush(display);

    // Press Ctrl
    XTestFakeKeyEvent(display, ctrl_keycode, True, 0);
    XFlush(display);

    // Press V
    XTestFakeKeyEvent(display, v_keycode, True, 0);
    XFlush(display);

    // Release V
    XTestFakeKeyEvent(display, v_keycode, False, 0);
    XFlush(display);

    // Release Ctrl
    XTestFakeKeyEvent(display, ctrl_keycode, False, 0);
    XFlush(display);

    XSync(display, False);
    XCloseDisplay(display);
    return true;
}

} // namespace sotto
