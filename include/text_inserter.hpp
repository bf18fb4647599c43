#pragma once

#include "clipboard.hpp"

#include <chrono>
#include <string>

namespace sotto {

enum class InsertResult {
    Ok,
    ClipboardError,     // Snapshot or write failed
    PasteError,         // No focused target or keystroke injection failed
};

const char* to_string(InsertResult result);

struct ClipboardSnapshot {
    ClipboardContent content;
    std::chrono::system_clock::time_point captured_at;
};

// Takes a clipboard snapshot on construction and writes it back exactly once:
// on restore() or, failing that, on destruction.
class ScopedClipboardRestore {
public:
    ScopedClipboardRestore(ClipboardBackend& clipboard, ClipboardSnapshot snapshot);
    ~ScopedClipboardRestore();

    ScopedClipboardRestore(const ScopedClipboardRestore&) = delete;
    ScopedClipboardRestore& operator=(const ScopedClipboardRestore&) = delete;

    // Returns false if writing the snapshot back failed. Later calls are no-ops.
    bool restore();

    bool restored() const { return restored_; }
    const ClipboardSnapshot& snapshot() const { return snapshot_; }

private:
    ClipboardBackend& clipboard_;
    ClipboardSnapshot snapshot_;
    bool restored_ = false;
};

class TextInserter {
public:
    TextInserter(ClipboardBackend& clipboard, KeystrokeSender& keys,
                 std::chrono::milliseconds paste_delay = std::chrono::milliseconds(100),
                 std::chrono::milliseconds restore_delay = std::chrono::milliseconds(50));

    // Pastes `text` at the cursor through the clipboard. The previous
    // clipboard content is put back on every path.
    InsertResult insert(const std::string& text);

    // Only sets the clipboard, no paste and no restore
    InsertResult copy_only(const std::string& text);

private:
    ClipboardBackend& clipboard_;
    KeystrokeSender& keys_;
    std::chrono::milliseconds paste_delay_;
    std::chrono::milliseconds restore_delay_;
};

} // namespace sotto
