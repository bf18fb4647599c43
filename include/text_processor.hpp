#pragma once

#include <string>

namespace sotto {

struct TextProcessorConfig {
    bool strip_markers = true;      // [BLANK_AUDIO], (music), <|endoftext|>, ...
    bool fix_spacing = true;
    bool trim_whitespace = true;
};

// Cleans raw model output before it is inserted. Never rewrites words.
class TextProcessor {
public:
    TextProcessor() = default;
    explicit TextProcessor(const TextProcessorConfig& config);

    // Main processing function - applies all enabled transformations
    std::string process(const std::string& text) const;

    // Individual operations (public for testing)
    std::string strip_markers(const std::string& text) const;
    std::string fix_spacing(const std::string& text) const;
    std::string trim(const std::string& text) const;

    // True if nothing but markers, whitespace and punctuation is left
    static bool is_noise(const std::string& text);

    void set_config(const TextProcessorConfig& config) { config_ = config; }
    const TextProcessorConfig& get_config() const { return config_; }

private:
    TextProcessorConfig config_;
};

} // namespace sotto
