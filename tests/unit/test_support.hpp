#ifndef _TEST_SUPPORT_HPP_
#define _TEST_SUPPORT_HPP_

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "engine.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;

// Scratch directory removed at scope exit.
struct TempDir {
    fs::path path;
    TempDir() : path(fs::temp_directory_path() / ("voxpipe_test_" + new_uuid_string())) {
        fs::create_directories(path);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }
    fs::path operator/(const std::string &name) const { return path / name; }
};

// ggml-<id>.bin of the given size, plus the openvino encoder when accel is set.
inline fs::path make_model(const fs::path &dir, const std::string &id, size_t bytes, bool accel) {
    auto path = dir / ("ggml-" + id + ".bin");
    std::ofstream(path, std::ios::binary) << std::string(bytes, 'm');
    if (accel) {
        std::ofstream(dir / ("ggml-" + id + "-encoder-openvino.xml")) << "<xml/>";
    }
    return path;
}

inline size_t count_files(const fs::path &dir, const std::string &prefix) {
    size_t n = 0;
    for (const auto &entry : fs::directory_iterator(dir)) {
        if (entry.path().filename().string().rfind(prefix, 0) == 0) ++n;
    }
    return n;
}

// Answers "<prefix><first sample>" so tests can tell which engine and which
// audio produced a piece of text.
class FakeEngine : public Engine {
public:
    explicit FakeEngine(std::string id, std::string prefix = "")
        : id_(std::move(id)), prefix_(prefix.empty() ? id_ + ":" : prefix) {}

    bool transcribe(const float *samples, size_t count, std::string &text) override {
        calls++;
        if (delay.count() > 0) std::this_thread::sleep_for(delay);
        if (fail) return false;
        int tag = count > 0 ? static_cast<int>(samples[0]) : -1;
        text = " " + prefix_ + std::to_string(tag) + " ";
        std::lock_guard<std::mutex> lock(mutex_);
        sizes_.push_back(count);
        return true;
    }

    bool init_acceleration(std::string &reason) override {
        accel_calls++;
        if (!accel_ok) {
            reason = "no openvino device";
            return false;
        }
        return true;
    }

    const std::string &get_model_id() const override { return id_; }

    std::vector<size_t> get_sizes() {
        std::lock_guard<std::mutex> lock(mutex_);
        return sizes_;
    }

    std::atomic<int> calls{0};
    std::atomic<int> accel_calls{0};
    std::atomic<bool> fail{false};
    std::atomic<bool> accel_ok{true};
    std::chrono::milliseconds delay{0};

private:
    std::string id_;
    std::string prefix_;
    std::mutex mutex_;
    std::vector<size_t> sizes_;
};

// Factory counting loads; fail_first makes the first load return nullptr.
struct FakeFactory {
    std::atomic<int> loads{0};
    std::atomic<bool> fail_first{false};
    std::atomic<bool> accel_ok{true};
    std::chrono::milliseconds load_delay{0};

    EngineFactory make() {
        return [this](const ModelDescriptor &model) -> std::shared_ptr<Engine> {
            int n = ++loads;
            if (load_delay.count() > 0) std::this_thread::sleep_for(load_delay);
            if (fail_first && n == 1) return nullptr;
            auto engine = std::make_shared<FakeEngine>(model.id);
            engine->accel_ok = accel_ok.load();
            return engine;
        };
    }
};

// count samples whose value is the window index, so texts show the order
inline std::vector<float> tagged_samples(size_t count, float tag) {
    return std::vector<float>(count, tag);
}

#endif
