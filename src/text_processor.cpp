#include "text_processor.hpp"
#include <cctype>
#include <regex>

namespace sotto {

TextProcessor::TextProcessor(const TextProcessorConfig& config)
    : config_(config) {}

std::string TextProcessor::process(const std::string& text) const {
    if (text.empty()) return text;

    std::string result = text;

    // Markers first so the gaps they leave get collapsed
    if (config_.strip_markers) {
        result = strip_markers(result);
    }

    if (config_.fix_spacing) {
        result = fix_spacing(result);
    }

    if (config_.trim_whitespace) {
        result = trim(result);
    }

    return result;
}

std::string TextProcessor::strip_markers(const std::string& text) const {
    // Whisper annotations: [BLANK_AUDIO], [ Silence ], [_BEG_], [_TT_123]
    static const std::regex bracket_marker(
        R"(\[[^\]\n]{0,40}\])",
        std::regex::ECMAScript
    );
    // Non-speech descriptions: (music), (inaudible), (upbeat music)
    static const std::regex paren_marker(
        R"(\(\s*(?:[Mm]usic|[Ii]naudible|[Ss]ilence|[Nn]oise|[Ll]aughs?|[Ll]aughter|[Aa]pplause|[Cc]oughs?|[Ss]ighs?|[Bb]eep|[Uu]pbeat music|[Ss]oft music|[Bb]lank_audio)\s*\))",
        std::regex::ECMAScript
    );
    // Special tokens leaking through: <|endoftext|>, <|en|>, <|nospeech|>
    static const std::regex special_token(
        R"(<\|[^|>]{0,32}\|>)",
        std::regex::ECMAScript
    );
    // Music note runs
    static const std::regex music_notes(
        "(\xE2\x99\xAA|\xE2\x99\xAB)+",
        std::regex::ECMAScript
    );

    std::string result = std::regex_replace(text, bracket_marker, " ");
    result = std::regex_replace(result, paren_marker, " ");
    result = std::regex_replace(result, special_token, " ");
    result = std::regex_replace(result, music_notes, " ");
    return result;
}

std::string TextProcessor::fix_spacing(const std::string& text) const {
    if (text.empty()) return text;

    std::string result;
    result.reserve(text.size());

    bool last_was_space = false;
    for (char c : text) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            // Collapse runs into a single space
            if (!last_was_space) {
                result += ' ';
                last_was_space = true;
            }
        } else {
            result += c;
            last_was_space = false;
        }
    }

    return result;
}

std::string TextProcessor::trim(const std::string& text) const {
    if (text.empty()) return text;

    size_t start = 0;
    size_t end = text.size();

    // Find first non-whitespace
    while (start < end && std::isspace(static_cast<unsigned char>(text[start]))) {
        ++start;
    }

    // Find last non-whitespace
    while (end > start && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
        --end;
    }

    if (start >= end) return "";

    return text.substr(start, end - start);
}

bool TextProcessor::is_noise(const std::string& text) {
    for (char c : text) {
        if (std::isalnum(static_cast<unsigned char>(c))) return false;
        // Any non-ASCII byte is treated as content (accented or non-Latin text)
        if (static_cast<unsigned char>(c) >= 0x80) return false;
    }
    return true;
}

} // namespace sotto
