#include "text_inserter.hpp"
#include <iostream>
#include <thread>
#include <utility>

namespace sotto {

const char* to_string(InsertResult result) {
    switch (result) {
        case InsertResult::Ok: return "ok";
        case InsertResult::ClipboardError: return "clipboard error";
        case InsertResult::PasteError: return "paste error";
    }
    return "unknown";
}

ScopedClipboardRestore::ScopedClipboardRestore(ClipboardBackend& clipboard, ClipboardSnapshot snapshot)
    : clipboard_(clipboard)
    , snapshot_(std::move(snapshot)) {
}

ScopedClipboardRestore::~ScopedClipboardRestore() {
    if (!restored_) {
        restore();
    }
}

bool ScopedClipboardRestore::restore() {
    if (restored_) return true;
    restored_ = true;

    if (!clipboard_.write(snapshot_.content)) {
        std::cerr << "Failed to restore clipboard" << std::endl;
        return false;
    }
    return true;
}

TextInserter::TextInserter(ClipboardBackend& clipboard, KeystrokeSender& keys,
                           std::chrono::milliseconds paste_delay,
                           std::chrono::milliseconds restore_delay)
    : clipboard_(clipboard)
    , keys_(keys)
    , paste_delay_(paste_delay)
    , restore_delay_(restore_delay) {
}

InsertResult TextInserter::insert(const std::string& text) {
    ClipboardSnapshot snapshot;
    if (!clipboard_.read(snapshot.content)) {
        // Without a snapshot we would lose the user's clipboard; touch nothing
        std::cerr << "Failed to snapshot clipboard, not inserting" << std::endl;
        return InsertResult::ClipboardError;
    }
    snapshot.captured_at = std::chrono::system_clock::now();

    ScopedClipboardRestore guard(clipboard_, std::move(snapshot));

    ClipboardContent content;
    content.data = text;
    if (!clipboard_.write(content)) {
        std::cerr << "Failed to set clipboard" << std::endl;
        return InsertResult::ClipboardError;
    }

    // Delay to ensure clipboard is fully set before pasting
    if (paste_delay_.count() > 0) std::this_thread::sleep_for(paste_delay_);

    if (!keys_.send_paste()) {
        std::cerr << "Failed to paste into focused window" << std::endl;
        return InsertResult::PasteError;
    }

    // Give the target a moment to read the clipboard before it changes back
    if (restore_delay_.count() > 0) std::this_thread::sleep_for(restore_delay_);

    if (!guard.restore()) {
        // Text was pasted; the restore failure is already logged
        return InsertResult::Ok;
    }

    std::cout << "Inserted text via clipboard (restored original)" << std::endl;
    return InsertResult::Ok;
}

InsertResult TextInserter::copy_only(const std::string& text) {
    ClipboardContent content;
    content.data = text;
    if (!clipboard_.write(content)) {
        std::cerr << "Failed to set clipboard" << std::endl;
        return InsertResult::ClipboardError;
    }
    return InsertResult::Ok;
}

} // namespace sotto
