// Automated tests for clipboard-based text insertion

#include "text_inserter.hpp"
#include "fakes.hpp"
#include <iostream>
#include <cassert>

using namespace sotto;
using namespace std::chrono_literals;
using test_utils::FakeClipboard;
using test_utils::FakeKeystrokeSender;

void test_insert_restores_clipboard() {
    std::cout << "Testing insert pastes and restores the clipboard..." << std::endl;

    FakeClipboard clipboard("abc");
    FakeKeystrokeSender keys(clipboard);
    TextInserter inserter(clipboard, keys, 0ms, 0ms);

    assert(inserter.insert("hello world") == InsertResult::Ok);

    assert(keys.pastes == 1);
    assert(keys.pasted.size() == 1 && keys.pasted[0] == "hello world");
    assert(clipboard.content.data == "abc" && "Original clipboard restored");
    assert(clipboard.history.size() == 2);
    assert(clipboard.history[0] == "hello world");
    assert(clipboard.history[1] == "abc");

    std::cout << "  PASS" << std::endl;
}

void test_empty_clipboard_restored_empty() {
    std::cout << "Testing an empty clipboard comes back empty..." << std::endl;

    FakeClipboard clipboard;
    FakeKeystrokeSender keys(clipboard);
    TextInserter inserter(clipboard, keys, 0ms, 0ms);

    assert(inserter.insert("note") == InsertResult::Ok);
    assert(clipboard.content.empty);
    assert(clipboard.content.data.empty());

    std::cout << "  PASS" << std::endl;
}

void test_non_text_format_preserved() {
    std::cout << "Testing a non-text clipboard keeps its format..." << std::endl;

    FakeClipboard clipboard;
    clipboard.content.data = std::string("\x89PNG\r\n", 6);
    clipboard.content.format = "image/png";
    clipboard.content.empty = false;
    FakeKeystrokeSender keys(clipboard);
    TextInserter inserter(clipboard, keys, 0ms, 0ms);

    assert(inserter.insert("caption") == InsertResult::Ok);
    assert(clipboard.content.format == "image/png");
    assert(clipboard.content.data == std::string("\x89PNG\r\n", 6));

    std::cout << "  PASS" << std::endl;
}

void test_snapshot_failure_touches_nothing() {
    std::cout << "Testing snapshot failure leaves the clipboard alone..." << std::endl;

    FakeClipboard clipboard("abc");
    clipboard.fail_read = true;
    FakeKeystrokeSender keys(clipboard);
    TextInserter inserter(clipboard, keys, 0ms, 0ms);

    assert(inserter.insert("hello") == InsertResult::ClipboardError);
    assert(clipboard.writes == 0);
    assert(keys.pastes == 0);
    assert(clipboard.content.data == "abc");

    std::cout << "  PASS" << std::endl;
}

void test_write_failure_restores() {
    std::cout << "Testing write failure still restores..." << std::endl;

    FakeClipboard clipboard("abc");
    clipboard.fail_write_on = 1;
    FakeKeystrokeSender keys(clipboard);
    TextInserter inserter(clipboard, keys, 0ms, 0ms);

    assert(inserter.insert("hello") == InsertResult::ClipboardError);
    assert(keys.pastes == 0);
    assert(clipboard.writes == 2 && "One failed write, one restore");
    assert(clipboard.content.data == "abc");

    std::cout << "  PASS" << std::endl;
}

void test_paste_failure_restores() {
    std::cout << "Testing paste failure restores the clipboard..." << std::endl;

    FakeClipboard clipboard("abc");
    FakeKeystrokeSender keys(clipboard);
    keys.succeed = false;
    TextInserter inserter(clipboard, keys, 0ms, 0ms);

    assert(inserter.insert("hello") == InsertResult::PasteError);
    assert(keys.pastes == 1);
    assert(clipboard.content.data == "abc");
    assert(clipboard.history.size() == 2);

    std::cout << "  PASS" << std::endl;
}

void test_restore_runs_once() {
    std::cout << "Testing restore happens exactly once..." << std::endl;

    FakeClipboard clipboard("abc");
    {
        ClipboardSnapshot snapshot;
        assert(clipboard.read(snapshot.content));
        ScopedClipboardRestore guard(clipboard, snapshot);
        ClipboardContent text;
        text.data = "temp";
        assert(clipboard.write(text));

        assert(guard.restore());
        assert(guard.restored());
        assert(guard.restore());
    }
    assert(clipboard.writes == 2 && "Destructor must not restore again");
    assert(clipboard.content.data == "abc");

    // Destructor alone restores
    {
        ClipboardSnapshot snapshot;
        assert(clipboard.read(snapshot.content));
        ScopedClipboardRestore guard(clipboard, snapshot);
        ClipboardContent text;
        text.data = "temp";
        assert(clipboard.write(text));
    }
    assert(clipboard.writes == 4);
    assert(clipboard.content.data == "abc");

    std::cout << "  PASS" << std::endl;
}

void test_copy_only() {
    std::cout << "Testing copy-only mode..." << std::endl;

    FakeClipboard clipboard("abc");
    FakeKeystrokeSender keys(clipboard);
    TextInserter inserter(clipboard, keys, 0ms, 0ms);

    assert(inserter.copy_only("hello") == InsertResult::Ok);
    assert(keys.pastes == 0);
    assert(clipboard.content.data == "hello");

    clipboard.fail_write = true;
    assert(inserter.copy_only("again") == InsertResult::ClipboardError);

    std::cout << "  PASS" << std::endl;
}

int main() {
    std::cout << "\n=== Text Inserter Test Suite ===" << std::endl << std::endl;

    test_insert_restores_clipboard();
    test_empty_clipboard_restored_empty();
    test_non_text_format_preserved();
    test_snapshot_failure_touches_nothing();
    test_write_failure_restores();
    test_paste_failure_restores();
    test_restore_runs_once();
    test_copy_only();

    std::cout << "\n=== All Tests Passed! ===" << std::endl << std::endl;
    return 0;
}
