#include <cassert>
#include <thread>
#include <vector>

#include "error.hpp"
#include "transcriber_cache.hpp"
#include "test_support.hpp"

static void test_single_flight() {
    TempDir models;
    auto path = make_model(models.path, "base.en", 100, false);
    FakeFactory factory;
    factory.load_delay = std::chrono::milliseconds(100);
    TranscriberCache cache(factory.make());

    const int n = 8;
    std::vector<std::shared_ptr<Engine>> engines(n);
    std::vector<std::error_code> errors(n);
    std::vector<std::thread> threads;
    for (int i = 0; i < n; ++i) {
        threads.emplace_back([&, i] { errors[i] = cache.get_or_create(path, engines[i]); });
    }
    for (auto &t : threads) t.join();

    assert(factory.loads == 1);
    for (int i = 0; i < n; ++i) {
        assert(!errors[i]);
        assert(engines[i] && engines[i] == engines[0]);
    }
    assert(cache.size() == 1);
    assert(cache.contains("base.en"));
}

static void test_failure_is_not_cached() {
    TempDir models;
    auto path = make_model(models.path, "tiny", 100, false);
    FakeFactory factory;
    factory.fail_first = true;
    TranscriberCache cache(factory.make());

    std::shared_ptr<Engine> engine;
    assert(cache.get_or_create(path, engine) == PipelineErrc::cache_creation_failed);
    assert(!engine);
    assert(!cache.contains("tiny"));

    assert(!cache.get_or_create(path, engine));
    assert(engine && engine->get_model_id() == "tiny");
    assert(factory.loads == 2);

    assert(cache.get_or_create(models / "ggml-absent.bin", engine) == PipelineErrc::model_not_found);
    assert(factory.loads == 2);
}

static void test_acceleration_policy() {
    TempDir models;
    TempDir state;
    auto path = make_model(models.path, "small", 100, true);
    FakeFactory factory;
    ModelStateStore store(state.path, models.path);
    TranscriberCache cache(factory.make(), &store);

    // not ready yet, auto stays on the CPU
    std::shared_ptr<Engine> engine;
    assert(!cache.get_or_create(path, engine));
    auto fake = std::dynamic_pointer_cast<FakeEngine>(engine);
    assert(fake->accel_calls == 0);
    assert(!cache.is_accel_ready("small"));

    // the warmer compiles it on the same instance
    store.set_warmer(make_cache_warmer(cache));
    assert(store.warm_models() == 1);
    assert(store.is_ready("small"));
    assert(cache.is_accel_ready("small"));
    assert(fake->accel_calls == 1);
    assert(fake->calls == 1);  // smoke test
    assert(factory.loads == 1);

    std::shared_ptr<Engine> again;
    assert(!cache.get_or_create(path, again));
    assert(again == engine);
    assert(fake->accel_calls == 1);
}

static void test_acceleration_failure() {
    TempDir models;
    TempDir state;
    make_model(models.path, "medium", 100, true);
    FakeFactory factory;
    factory.accel_ok = false;
    ModelStateStore store(state.path, models.path);
    TranscriberCache cache(factory.make(), &store);
    store.set_warmer(make_cache_warmer(cache));

    assert(store.warm_models() == 0);
    assert(store.get_state("medium") == ModelStatus::failed);
    assert(store.get_state("medium").reason == "no openvino device");
    assert(cache.get_accel_error("medium") == "no openvino device");
    // the CPU engine stays usable
    std::shared_ptr<Engine> engine;
    assert(!cache.get_or_create(models / "ggml-medium.bin", engine, AccelMode::off));
    assert(engine);
}

static void test_foreign_exception_from_loader() {
    TempDir models;
    auto path = make_model(models.path, "base", 100, false);
    int loads = 0;
    TranscriberCache cache([&loads](const ModelDescriptor &model) -> std::shared_ptr<Engine> {
        if (++loads == 1) throw 42;
        return std::make_shared<FakeEngine>(model.id);
    });

    std::shared_ptr<Engine> engine;
    assert(cache.get_or_create(path, engine) == PipelineErrc::cache_creation_failed);
    assert(!engine);
    assert(!cache.contains("base"));

    // the slot was released, the next call loads again
    assert(!cache.get_or_create(path, engine));
    assert(engine && engine->get_model_id() == "base");
    assert(loads == 2);
}

int main() {
    test_single_flight();
    test_failure_is_not_cached();
    test_acceleration_policy();
    test_acceleration_failure();
    test_foreign_exception_from_loader();
    return 0;
}
