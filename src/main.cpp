#include "app.hpp"
#include "config.hpp"
#include "model_coordinator.hpp"
#include "whisper_model.hpp"
#include <iostream>
#include <csignal>
#include <cstring>
#include <cstdlib>

static sotto::App* g_app = nullptr;

void signal_handler(int signum) {
    (void)signum;
    if (g_app) {
        g_app->quit();
    }
}

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "\nOptions:\n"
              << "  -m, --model ID      Model to load: tiny, base, small, medium, large-v3-turbo\n"
              << "                      (default: saved choice, else base)\n"
              << "  -d, --model-dir DIR Directory containing ggml models\n"
              << "                      (default: ~/.local/share/sotto/models)\n"
              << "  -t, --threads N     Number of CPU threads (default: half the cores)\n"
              << "  -l, --language LANG Language code (default: en)\n"
              << "  --translate         Translate speech to English\n"
              << "  --no-paste          Don't auto-paste, just copy to clipboard\n"
              << "  --list-models       Show known models and whether they are downloaded\n"
              << "  -h, --help          Show this help\n"
              << "\nHotkey:\n"
              << "  Hold Alt+Space or Ctrl+Shift+Space to record, release to transcribe and paste.\n"
              << "  Recordings shorter than 300ms are ignored.\n"
              << std::endl;
}

static int list_models(const sotto::Config& config) {
    sotto::WhisperModelLoader loader;
    sotto::ModelCoordinator models(loader, config.resolved_model_dir(), sotto::ModelOptions{});

    std::cout << "Models in " << models.model_dir() << ":\n";
    for (const auto& info : models.list_models()) {
        std::cout << "  " << info.id << " (" << info.size_mb << " MB) "
                  << (info.is_downloaded ? "downloaded" : "not downloaded") << "\n";
    }
    std::cout << std::flush;
    return 0;
}

int main(int argc, char* argv[]) {
    sotto::Config config;
    bool show_models = false;

    // Parse arguments
    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        }
        else if ((strcmp(argv[i], "-m") == 0 || strcmp(argv[i], "--model") == 0) && i + 1 < argc) {
            config.model_id = argv[++i];
            if (!sotto::find_model(config.model_id)) {
                std::cerr << "Unknown model: " << config.model_id << std::endl;
                print_usage(argv[0]);
                return 1;
            }
        }
        else if ((strcmp(argv[i], "-d") == 0 || strcmp(argv[i], "--model-dir") == 0) && i + 1 < argc) {
            config.model_dir = argv[++i];
        }
        else if ((strcmp(argv[i], "-t") == 0 || strcmp(argv[i], "--threads") == 0) && i + 1 < argc) {
            config.n_threads = std::atoi(argv[++i]);
        }
        else if ((strcmp(argv[i], "-l") == 0 || strcmp(argv[i], "--language") == 0) && i + 1 < argc) {
            config.language = argv[++i];
        }
        else if (strcmp(argv[i], "--translate") == 0) {
            config.translate = true;
        }
        else if (strcmp(argv[i], "--no-paste") == 0) {
            config.auto_paste = false;
        }
        else if (strcmp(argv[i], "--list-models") == 0) {
            show_models = true;
        }
        else {
            std::cerr << "Unknown option: " << argv[i] << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }

    if (show_models) {
        return list_models(config);
    }

    // Setup signal handlers
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    // Create and initialize app
    sotto::App app;
    g_app = &app;

    std::cout << "Sotto - Voice to Text\n" << std::endl;
    std::cout << "Model dir: " << config.resolved_model_dir() << std::endl;
    std::cout << "Threads: " << config.resolved_threads() << std::endl;
    std::cout << "Language: " << config.language << (config.translate ? " (translate)" : "") << std::endl;
    std::cout << "Auto-paste: " << (config.auto_paste ? "yes" : "no") << std::endl;
    std::cout << std::endl;

    if (!app.initialize(config)) {
        std::cerr << "Failed to initialize application" << std::endl;
        g_app = nullptr;
        return 1;
    }

    int result = app.run();

    g_app = nullptr;
    return result;
}
