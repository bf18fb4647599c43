#pragma once

#include <string>

namespace sotto {

struct ClipboardContent {
    std::string data;
    std::string format = "UTF8_STRING";  // MIME type / X11 target
    bool empty = false;                  // Clipboard had no owner or data
};

// System clipboard seam
class ClipboardBackend {
public:
    virtual ~ClipboardBackend() = default;

    // False only when the clipboard could not be queried at all.
    // An empty clipboard is a successful read with content.empty = true.
    virtual bool read(ClipboardContent& content) = 0;

    virtual bool write(const ClipboardContent& content) = 0;
};

// Keystroke injection seam
class KeystrokeSender {
public:
    virtual ~KeystrokeSender() = default;

    // Releases held modifiers and sends the paste shortcut to the focused
    // window. False if there is no focused target or injection failed.
    virtual bool send_paste() = 0;
};

// xclip / xsel backed clipboard
class X11Clipboard : public ClipboardBackend {
public:
    bool read(ClipboardContent& content) override;
    bool write(const ClipboardContent& content) override;
};

// Ctrl+V through the XTest extension
class X11PasteSender : public KeystrokeSender {
public:
    bool send_paste() override;
};

} // namespace sotto
