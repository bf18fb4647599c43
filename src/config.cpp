#include "config.hpp"
#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <thread>

namespace sotto {

static std::string home_dir() {
    const char* home = std::getenv("HOME");
    if (!home) return "";
    return home;
}

std::string default_config_dir() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && *xdg) return std::string(xdg) + "/sotto";

    std::string home = home_dir();
    if (home.empty()) return "";
    return home + "/.config/sotto";
}

std::string default_model_dir() {
    const char* xdg = std::getenv("XDG_DATA_HOME");
    if (xdg && *xdg) return std::string(xdg) + "/sotto/models";

    std::string home = home_dir();
    if (home.empty()) return "models";
    return home + "/.local/share/sotto/models";
}

std::string default_active_model_path() {
    std::string dir = default_config_dir();
    if (dir.empty()) return "";
    return dir + "/active_model";
}

std::string read_persisted_model_id(const std::string& path) {
    if (path.empty()) return "";

    std::ifstream file(path);
    if (!file.is_open()) {
        // Nothing saved yet
        return "";
    }

    std::string line;
    std::getline(file, line);

    size_t start = line.find_first_not_of(" \t");
    if (start == std::string::npos) return "";
    size_t end = line.find_last_not_of(" \t\r\n");
    return line.substr(start, end - start + 1);
}

std::string Config::resolved_model_dir() const {
    return model_dir.empty() ? default_model_dir() : model_dir;
}

int Config::resolved_threads() const {
    if (n_threads > 0) return n_threads;
    int hw = static_cast<int>(std::thread::hardware_concurrency());
    if (hw <= 0) hw = 4;
    return std::max(1, hw / 2);
}

} // namespace sotto
