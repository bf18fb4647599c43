// Automated tests for TextProcessor

#include "text_processor.hpp"
#include <iostream>
#include <cassert>

using namespace sotto;

void test_words_untouched() {
    std::cout << "Testing spoken words pass through unchanged..." << std::endl;

    TextProcessor proc;

    assert(proc.process("hello world") == "hello world");
    assert(proc.process("Um, I I like pizza") == "Um, I I like pizza");
    assert(proc.process("no period at the end") == "no period at the end");

    std::cout << "  PASS" << std::endl;
}

void test_bracket_markers() {
    std::cout << "Testing bracket marker removal..." << std::endl;

    TextProcessor proc;

    assert(proc.process("[BLANK_AUDIO]") == "");
    assert(proc.process(" [BLANK_AUDIO] hello") == "hello");
    assert(proc.process("hello [ Silence ] world") == "hello world");
    assert(proc.process("[_BEG_] testing [_TT_150]") == "testing");

    std::cout << "  PASS" << std::endl;
}

void test_paren_markers() {
    std::cout << "Testing non-speech descriptions..." << std::endl;

    TextProcessor proc;

    assert(proc.process("(music)") == "");
    assert(proc.process("hello (inaudible) there") == "hello there");
    assert(proc.process("( Upbeat music ) okay") == "okay");

    // Ordinary parentheses stay
    assert(proc.process("call me (maybe)") == "call me (maybe)");

    std::cout << "  PASS" << std::endl;
}

void test_special_tokens() {
    std::cout << "Testing leaked special tokens..." << std::endl;

    TextProcessor proc;

    assert(proc.process("hello<|endoftext|>") == "hello");
    assert(proc.process("<|en|> <|transcribe|> good morning") == "good morning");

    std::cout << "  PASS" << std::endl;
}

void test_music_notes() {
    std::cout << "Testing music note removal..." << std::endl;

    TextProcessor proc;

    assert(proc.process("\xE2\x99\xAA\xE2\x99\xAA la la \xE2\x99\xAB") == "la la");

    std::cout << "  PASS" << std::endl;
}

void test_spacing_and_trim() {
    std::cout << "Testing spacing and trimming..." << std::endl;

    TextProcessor proc;

    assert(proc.fix_spacing("a  b\t\tc\n d") == "a b c d");
    assert(proc.trim("   padded  ") == "padded");
    assert(proc.trim(" \t\n") == "");
    assert(proc.process("  leading and trailing  ") == "leading and trailing");

    std::cout << "  PASS" << std::endl;
}

void test_config_disables_steps() {
    std::cout << "Testing config toggles..." << std::endl;

    TextProcessorConfig config;
    config.strip_markers = false;
    TextProcessor proc(config);

    assert(proc.process("[BLANK_AUDIO]") == "[BLANK_AUDIO]");

    config.strip_markers = true;
    config.trim_whitespace = false;
    proc.set_config(config);
    assert(proc.process(" hi ") == " hi ");
    assert(!proc.get_config().trim_whitespace);

    std::cout << "  PASS" << std::endl;
}

void test_noise_detection() {
    std::cout << "Testing noise detection..." << std::endl;

    assert(TextProcessor::is_noise(""));
    assert(TextProcessor::is_noise("..."));
    assert(TextProcessor::is_noise(" - ! "));
    assert(!TextProcessor::is_noise("ok"));
    assert(!TextProcessor::is_noise("42"));
    // Non-Latin text is content
    assert(!TextProcessor::is_noise("\xE3\x81\x93\xE3\x82\x93\xE3\x81\xAB\xE3\x81\xA1\xE3\x81\xAF"));

    std::cout << "  PASS" << std::endl;
}

int main() {
    std::cout << "\n=== TextProcessor Test Suite ===" << std::endl << std::endl;

    test_words_untouched();
    test_bracket_markers();
    test_paren_markers();
    test_special_tokens();
    test_music_notes();
    test_spacing_and_trim();
    test_config_disables_steps();
    test_noise_detection();

    std::cout << "\n=== All Tests Passed! ===" << std::endl << std::endl;
    return 0;
}
