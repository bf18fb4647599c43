#include "whisper_model.hpp"
#include "whisper.h"
#include <iostream>
#include <chrono>
#include <memory>

namespace sotto {

WhisperModel::WhisperModel(whisper_context* ctx, const ModelOptions& options)
    : ctx_(ctx)
    , options_(options) {
}

WhisperModel::~WhisperModel() {
    if (ctx_) {
        whisper_free(ctx_);
        ctx_ = nullptr;
    }
}

InferenceOutput WhisperModel::run(const std::vector<float>& audio) {
    InferenceOutput output;

    if (!ctx_) {
        output.error = "Model not loaded";
        return output;
    }

    if (audio.empty()) {
        output.error = "No audio data";
        return output;
    }

    auto start_time = std::chrono::steady_clock::now();

    // Greedy decoding, tuned for short dictation clips
    whisper_full_params wparams = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);

    wparams.print_progress   = false;
    wparams.print_special    = false;
    wparams.print_realtime   = false;
    wparams.print_timestamps = false;
    wparams.translate        = options_.translate;
    wparams.single_segment   = true;   // Faster for short audio
    wparams.no_context       = true;
    wparams.language         = options_.language.c_str();
    wparams.n_threads        = options_.n_threads;
    wparams.greedy.best_of   = 1;

    int ret = whisper_full(ctx_, wparams, audio.data(), static_cast<int>(audio.size()));
    if (ret != 0) {
        output.error = "Whisper inference failed (code " + std::to_string(ret) + ")";
        return output;
    }

    const int n_segments = whisper_full_n_segments(ctx_);
    for (int i = 0; i < n_segments; ++i) {
        const char* segment_text = whisper_full_get_segment_text(ctx_, i);
        if (segment_text) {
            output.text += segment_text;
        }
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);
    std::cout << "Inference on " << audio.size() << " samples took " << elapsed.count() << "ms" << std::endl;

    output.success = true;
    return output;
}

std::unique_ptr<SpeechModel> WhisperModelLoader::load(const std::string& path,
                                                      const ModelOptions& options) {
    struct whisper_context_params cparams = whisper_context_default_params();
    cparams.use_gpu = false;   // CPU build

    whisper_context* ctx = whisper_init_from_file_with_params(path.c_str(), cparams);
    if (!ctx) {
        std::cerr << "Failed to load whisper model: " << path << std::endl;
        return nullptr;
    }

    std::cout << "Loaded whisper model: " << path
              << (options.translate ? " (translate to English)" : "") << std::endl;
    return std::make_unique<WhisperModel>(ctx, options);
}

} // namespace sotto
