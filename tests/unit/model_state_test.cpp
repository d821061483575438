#include <cassert>
#include <fstream>
#include <future>
#include <vector>

#include "error.hpp"
#include "model_state.hpp"
#include "test_support.hpp"

static void test_transitions() {
    assert(transition_allowed(ModelStatus::not_downloaded, ModelStatus::downloaded));
    assert(transition_allowed(ModelStatus::downloaded, ModelStatus::warming));
    assert(transition_allowed(ModelStatus::warming, ModelStatus::ready));
    assert(transition_allowed(ModelStatus::warming, ModelStatus::failed));
    assert(transition_allowed(ModelStatus::failed, ModelStatus::warming));
    assert(!transition_allowed(ModelStatus::ready, ModelStatus::warming));
    assert(!transition_allowed(ModelStatus::not_downloaded, ModelStatus::ready));
    assert(!transition_allowed(ModelStatus::ready, ModelStatus::downloaded));

    TempDir dir;
    ModelStateStore store(dir.path, dir.path);
    assert(store.get_state("tiny") == ModelStatus::not_downloaded);
    assert(store.set_state("tiny", {ModelStatus::ready, {}, {}}) == PipelineErrc::invalid_transition);
    assert(!store.set_state("tiny", {ModelStatus::downloaded, {}, {}}));
    assert(!store.set_state("tiny", {ModelStatus::warming, {}, {}}));
    assert(store.is_any_warming());
    assert(store.warming_models() == std::vector<std::string>{"tiny"});
    assert(!store.set_state("tiny", {ModelStatus::ready, {}, {}}));
    assert(store.is_ready("tiny"));
    assert(!store.get_state("tiny").last_warmed.empty());
    assert(!store.is_any_warming());
}

static void test_persistence() {
    TempDir dir;
    {
        ModelStateStore store(dir.path, dir.path);
        assert(!store.set_state("base.en", {ModelStatus::downloaded, {}, {}}));
        assert(!store.set_state("base.en", {ModelStatus::warming, {}, {}}));
        assert(!store.set_state("base.en", {ModelStatus::ready, {}, {}}));
        assert(!store.set_state("small", {ModelStatus::downloaded, {}, {}}));
        assert(!store.set_state("small", ModelState::failed("compile error")));
        assert(!store.set_state("tiny", {ModelStatus::downloaded, {}, {}}));
        assert(!store.set_state("tiny", {ModelStatus::warming, {}, {}}));
        assert(fs::exists(store.get_state_file()));
    }
    // a fresh store sees what the previous one committed
    ModelStateStore reloaded(dir.path, dir.path);
    assert(reloaded.is_ready("base.en"));
    assert(reloaded.get_state("small") == ModelStatus::failed);
    assert(reloaded.get_state("small").reason == "compile error");
    // a warm-up that never finished comes back as failed
    assert(reloaded.get_state("tiny") == ModelStatus::failed);
    assert(reloaded.get_state("tiny").reason == "interrupted");
}

static void test_unreadable_state_file() {
    TempDir dir;
    std::ofstream(dir / "model_states.json") << "{ not json";
    ModelStateStore store(dir.path, dir.path);
    assert(store.list().empty());
    assert(!store.set_state("tiny", {ModelStatus::downloaded, {}, {}}));
}

static void test_warm_models() {
    TempDir models;
    TempDir state;
    make_model(models.path, "tiny.en", 100, true);
    make_model(models.path, "base", 200, true);
    make_model(models.path, "small", 300, false);

    ModelStateStore store(state.path, models.path);
    std::atomic<int> warmed{0};
    store.set_warmer([&](const ModelDescriptor &model, std::string &reason) {
        warmed++;
        if (model.id == "base") {
            reason = "device lost";
            return false;
        }
        return true;
    });

    assert(store.warm_models() == 1);
    assert(warmed == 2);
    assert(store.is_ready("tiny.en"));
    assert(store.get_state("base") == ModelStatus::failed);
    assert(store.get_state("base").reason == "device lost");
    // no accelerated variant, nothing to warm
    assert(store.get_state("small") == ModelStatus::not_downloaded);

    // ready models are skipped, failed ones wait for an explicit retry
    assert(store.warm_models() == 0);
    assert(warmed == 2);

    store.set_warmer([&](const ModelDescriptor &, std::string &) {
        warmed++;
        return true;
    });
    assert(!store.retry("base"));
    assert(store.is_ready("base"));
    assert(warmed == 3);
    assert(store.retry("base") == PipelineErrc::invalid_transition);
}

static void test_warm_models_concurrent() {
    TempDir models;
    TempDir state;
    make_model(models.path, "tiny", 100, true);
    make_model(models.path, "medium", 400, true);

    ModelStateStore store(state.path, models.path);
    std::mutex mutex;
    std::map<std::string, int> runs;
    store.set_warmer([&](const ModelDescriptor &model, std::string &) {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        std::lock_guard<std::mutex> lock(mutex);
        runs[model.id]++;
        return true;
    });

    std::vector<std::future<size_t>> calls;
    for (int i = 0; i < 4; ++i) calls.push_back(store.warm_models_async());
    size_t total = 0;
    for (auto &f : calls) total += f.get();

    assert(total == 2);
    assert(runs["tiny"] == 1);
    assert(runs["medium"] == 1);
    assert(store.is_ready("tiny") && store.is_ready("medium"));
}

static void test_warmer_throws() {
    TempDir models;
    TempDir state;
    make_model(models.path, "tiny", 100, true);
    ModelStateStore store(state.path, models.path);
    store.set_warmer([](const ModelDescriptor &, std::string &) -> bool {
        throw std::runtime_error("boom");
    });
    assert(store.warm_models() == 0);
    assert(store.get_state("tiny") == ModelStatus::failed);
    assert(store.get_state("tiny").reason == "boom");
}

int main() {
    test_transitions();
    test_persistence();
    test_unreadable_state_file();
    test_warm_models();
    test_warm_models_concurrent();
    test_warmer_throws();
    return 0;
}
