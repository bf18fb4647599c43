#pragma once

// Test doubles for the device, model, clipboard and keystroke seams

#include "audio_capture.hpp"
#include "clipboard.hpp"
#include "speech_model.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>
#include <unistd.h>

namespace test_utils {

// One-shot latch
class Gate {
public:
    void open() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            open_ = true;
        }
        cv_.notify_all();
    }

    bool wait_for(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [this] { return open_; });
    }

    void wait() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return open_; });
    }

    bool is_open() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return open_;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool open_ = false;
};

class FakeAudioDevice : public sotto::AudioDevice {
public:
    bool input_present = true;
    std::set<int> supported_rates{16000};
    int native = 16000;
    bool fail_open = false;
    bool fail_start = false;

    int opened_rate = 0;
    int opened_frames_per_buffer = 0;
    int open_calls = 0;
    int close_calls = 0;

    bool initialize() override { return true; }
    void shutdown() override { close(); }

    bool has_input() override { return input_present; }
    bool supports_rate(int sample_rate) override { return supported_rates.count(sample_rate) > 0; }
    int native_rate() override { return native; }

    bool open(int sample_rate, int frames_per_buffer,
              FrameCallback on_frames, LostCallback on_lost) override {
        ++open_calls;
        if (fail_open) return false;
        opened_rate = sample_rate;
        opened_frames_per_buffer = frames_per_buffer;
        frames_cb_ = std::move(on_frames);
        lost_cb_ = std::move(on_lost);
        return true;
    }

    // While set, start() signals `start_entered` and blocks until `start_release` opens
    std::shared_ptr<Gate> start_entered;
    std::shared_ptr<Gate> start_release;

    bool start() override {
        if (start_entered) start_entered->open();
        if (start_release) start_release->wait();
        if (fail_start) return false;
        running_ = true;
        return true;
    }

    void close() override {
        if (running_ || frames_cb_) ++close_calls;
        running_ = false;
        frames_cb_ = nullptr;
        lost_cb_ = nullptr;
    }

    bool running() const { return running_; }

    // Delivers `total` samples in frames of `frame` samples, value = index
    void feed(size_t total, size_t frame) {
        std::vector<float> chunk;
        size_t offset = 0;
        while (offset < total && running_) {
            size_t n = std::min(frame, total - offset);
            chunk.resize(n);
            for (size_t i = 0; i < n; ++i) chunk[i] = static_cast<float>(offset + i);
            if (frames_cb_) frames_cb_(chunk.data(), n);
            offset += n;
        }
    }

    void lose(const std::string& reason = "unplugged") {
        running_ = false;
        // The receiver may close() us from another thread once notified
        LostCallback cb = lost_cb_;
        if (cb) cb(reason);
    }

private:
    bool running_ = false;
    FrameCallback frames_cb_;
    LostCallback lost_cb_;
};

struct ModelStats {
    std::atomic<int> runs{0};
    std::atomic<int> destroyed{0};
    std::atomic<size_t> last_samples{0};
};

class FakeSpeechModel : public sotto::SpeechModel {
public:
    FakeSpeechModel(std::string text, std::shared_ptr<ModelStats> stats)
        : text_(std::move(text)), stats_(std::move(stats)) {}

    ~FakeSpeechModel() override { ++stats_->destroyed; }

    // While set, run() signals `entered` and blocks until `release` opens
    std::shared_ptr<Gate> entered;
    std::shared_ptr<Gate> release;
    bool fail = false;
    bool throws = false;

    sotto::InferenceOutput run(const std::vector<float>& audio) override {
        ++stats_->runs;
        stats_->last_samples = audio.size();
        if (entered) entered->open();
        if (release) release->wait();
        if (throws) throw std::runtime_error("fake inference crash");

        sotto::InferenceOutput out;
        if (fail) {
            out.error = "fake inference failure";
            return out;
        }
        out.success = true;
        out.text = text_;
        return out;
    }

private:
    std::string text_;
    std::shared_ptr<ModelStats> stats_;
};

// Loads FakeSpeechModels. Output text and failures are keyed by file name.
class FakeModelLoader : public sotto::ModelLoader {
public:
    std::map<std::string, std::string> texts;   // filename -> model output
    std::set<std::string> failing;              // filenames that fail to load
    std::shared_ptr<ModelStats> stats = std::make_shared<ModelStats>();
    std::shared_ptr<Gate> entered;
    std::shared_ptr<Gate> release;
    bool inference_fails = false;
    bool inference_throws = false;
    std::vector<std::string> loaded_paths;

    // While set, load() signals `load_entered` and blocks until `load_release` opens
    std::shared_ptr<Gate> load_entered;
    std::shared_ptr<Gate> load_release;

    std::unique_ptr<sotto::SpeechModel> load(const std::string& path,
                                             const sotto::ModelOptions& options) override {
        (void)options;
        loaded_paths.push_back(path);
        if (load_entered) load_entered->open();
        if (load_release) load_release->wait();
        std::string name = std::filesystem::path(path).filename().string();
        if (failing.count(name)) return nullptr;

        auto it = texts.find(name);
        auto model = std::make_unique<FakeSpeechModel>(it == texts.end() ? "" : it->second, stats);
        model->entered = entered;
        model->release = release;
        model->fail = inference_fails;
        model->throws = inference_throws;
        return model;
    }
};

class FakeClipboard : public sotto::ClipboardBackend {
public:
    sotto::ClipboardContent content;
    bool fail_read = false;
    bool fail_write = false;            // Every write fails
    int fail_write_on = -1;             // Only the Nth write (1-based) fails
    int reads = 0;
    int writes = 0;
    std::vector<std::string> history;   // Data of each successful write

    explicit FakeClipboard(const std::string& initial = "") {
        content.data = initial;
        content.empty = initial.empty();
    }

    bool read(sotto::ClipboardContent& out) override {
        ++reads;
        if (fail_read) return false;
        out = content;
        return true;
    }

    bool write(const sotto::ClipboardContent& in) override {
        ++writes;
        if (fail_write || writes == fail_write_on) return false;
        content = in;
        history.push_back(in.data);
        return true;
    }
};

class FakeKeystrokeSender : public sotto::KeystrokeSender {
public:
    explicit FakeKeystrokeSender(FakeClipboard& clipboard) : clipboard_(clipboard) {}

    bool succeed = true;
    int pastes = 0;
    std::vector<std::string> pasted;    // Clipboard text seen at each paste

    bool send_paste() override {
        ++pastes;
        if (!succeed) return false;
        pasted.push_back(clipboard_.content.data);
        return true;
    }

private:
    FakeClipboard& clipboard_;
};

// Temporary models directory, removed on destruction
class TempModelDir {
public:
    TempModelDir() {
        char tmpl[] = "/tmp/sotto-models-XXXXXX";
        char* dir = mkdtemp(tmpl);
        if (dir) path_ = dir;
    }

    ~TempModelDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempModelDir(const TempModelDir&) = delete;
    TempModelDir& operator=(const TempModelDir&) = delete;

    // Creates a placeholder file for the model
    void add(const std::string& filename) {
        std::ofstream out(path_ + "/" + filename, std::ios::binary);
        out << "ggml";
    }

    bool has(const std::string& filename) const {
        return std::filesystem::exists(path_ + "/" + filename);
    }

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

} // namespace test_utils
