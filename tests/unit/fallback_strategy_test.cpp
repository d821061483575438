#include <atomic>
#include <cassert>
#include <thread>
#include <vector>

#include "error.hpp"
#include "fallback_strategy.hpp"
#include "test_support.hpp"

static StrategyConfig mono_config() {
    StrategyConfig sc;
    sc.sample_rate = 16000;
    sc.channels = 1;
    return sc;
}

static void test_round_trip() {
    TempDir dir;
    auto engine = std::make_shared<FakeEngine>("tiny");
    FallbackStrategy strategy(dir / "tmp", engine);
    assert(strategy.state() == SessionState::created);
    assert(strategy.kind() == StrategyKind::fallback);

    auto canonical = dir / "recordings" / "take1.wav";
    assert(!strategy.start_recording(canonical, mono_config()));
    assert(strategy.state() == SessionState::recording);
    assert(fs::exists(strategy.get_staging_path()));
    assert(strategy.get_staging_path().parent_path() == dir / "tmp");

    const size_t seconds = 2;
    auto audio = tagged_samples(seconds * 16000, 7.0f);
    for (size_t off = 0; off < audio.size(); off += 8000) {
        assert(!strategy.process_samples(audio.data() + off, 8000));
    }
    assert(engine->calls == 0);

    TranscriptionResult result;
    assert(!strategy.finish_recording(result));
    assert(strategy.state() == SessionState::done);
    assert(result.text == "tiny:7");
    assert(result.strategy_used == "fallback");
    assert(result.chunks_processed == 0);
    assert(result.recording_bytes >= wav_header_size + seconds * 16000 * sizeof(float));
    assert(fs::file_size(canonical) == result.recording_bytes);
    assert(!fs::exists(strategy.get_staging_path()));
    assert(engine->get_sizes() == std::vector<size_t>{seconds * 16000});

    // finishing twice is refused and leaves the recording alone
    auto mtime = fs::last_write_time(canonical);
    TranscriptionResult again;
    assert(strategy.finish_recording(again) == PipelineErrc::invalid_state);
    assert(again.text.empty());
    assert(fs::file_size(canonical) == result.recording_bytes);
    assert(fs::last_write_time(canonical) == mtime);
    assert(strategy.state() == SessionState::done);
    assert(strategy.process_samples(audio.data(), 10) == PipelineErrc::invalid_state);
}

static void test_empty_recording() {
    TempDir dir;
    FallbackStrategy strategy(dir.path, std::make_shared<FakeEngine>("tiny"));
    auto canonical = dir / "empty.wav";
    assert(!strategy.start_recording(canonical, mono_config()));
    TranscriptionResult result;
    assert(strategy.finish_recording(result) == PipelineErrc::empty_recording);
    assert(strategy.state() == SessionState::failed);
    assert(!fs::exists(canonical));
    assert(count_files(dir.path, "staging_") == 0);
    assert(strategy.finish_recording(result) == PipelineErrc::invalid_state);
}

static void test_cancel_and_destroy() {
    TempDir dir;
    auto canonical = dir / "rec.wav";
    auto audio = tagged_samples(16000, 1.0f);
    {
        FallbackStrategy strategy(dir.path, std::make_shared<FakeEngine>("tiny"));
        assert(!strategy.start_recording(canonical, mono_config()));
        assert(!strategy.process_samples(audio.data(), audio.size()));
        assert(count_files(dir.path, "staging_") == 1);
        strategy.cancel();
        assert(strategy.state() == SessionState::failed);
        assert(count_files(dir.path, "staging_") == 0);
        TranscriptionResult result;
        assert(strategy.finish_recording(result) == PipelineErrc::invalid_state);
    }
    {
        FallbackStrategy strategy(dir.path, std::make_shared<FakeEngine>("tiny"));
        assert(!strategy.start_recording(canonical, mono_config()));
        assert(!strategy.process_samples(audio.data(), audio.size()));
    }
    assert(count_files(dir.path, "staging_") == 0);
    assert(!fs::exists(canonical));
}

static void test_inference_failure() {
    TempDir dir;
    auto engine = std::make_shared<FakeEngine>("tiny");
    engine->fail = true;
    FallbackStrategy strategy(dir.path, engine);
    assert(!strategy.start_recording(dir / "rec.wav", mono_config()));
    auto audio = tagged_samples(16000, 1.0f);
    assert(!strategy.process_samples(audio.data(), audio.size()));
    TranscriptionResult result;
    assert(strategy.finish_recording(result) == PipelineErrc::transcription_failed);
    assert(strategy.state() == SessionState::failed);
    assert(result.text.empty());
}

static void test_stereo_is_downmixed() {
    TempDir dir;
    auto engine = std::make_shared<FakeEngine>("tiny");
    FallbackStrategy strategy(dir.path, engine);
    auto sc = mono_config();
    sc.channels = 2;
    assert(!strategy.start_recording(dir / "rec.wav", sc));
    std::vector<float> stereo(16000 * 2);
    for (size_t i = 0; i < stereo.size(); i += 2) {
        stereo[i] = 2.0f;
        stereo[i + 1] = 4.0f;
    }
    assert(!strategy.process_samples(stereo.data(), stereo.size()));
    TranscriptionResult result;
    assert(!strategy.finish_recording(result));
    assert(result.text == "tiny:3");
    assert(engine->get_sizes() == std::vector<size_t>{16000});
    assert(result.recording_bytes == wav_header_size + stereo.size() * sizeof(float));
}

static void test_cancel_from_another_thread_while_feeding() {
    auto audio = tagged_samples(1600, 1.0f);
    for (int attempt = 0; attempt < 20; ++attempt) {
        TempDir dir;
        FallbackStrategy strategy(dir.path, std::make_shared<FakeEngine>("tiny"));
        assert(!strategy.start_recording(dir / "rec.wav", mono_config()));

        std::atomic<int> fed{0};
        std::thread feeder([&] {
            while (!strategy.process_samples(audio.data(), audio.size())) {
                ++fed;
            }
        });
        while (fed < attempt) {
            std::this_thread::yield();
        }
        strategy.cancel();
        feeder.join();

        assert(strategy.state() == SessionState::failed);
        assert(count_files(dir.path, "staging_") == 0);
        assert(!fs::exists(dir / "rec.wav"));
    }
}

static void test_cancel_from_another_thread_while_finishing() {
    auto audio = tagged_samples(16000, 2.0f);
    for (int attempt = 0; attempt < 20; ++attempt) {
        TempDir dir;
        auto canonical = dir / "rec.wav";
        FallbackStrategy strategy(dir.path, std::make_shared<FakeEngine>("tiny"));
        assert(!strategy.start_recording(canonical, mono_config()));
        assert(!strategy.process_samples(audio.data(), audio.size()));

        TranscriptionResult result;
        std::error_code ec;
        std::thread finisher([&] { ec = strategy.finish_recording(result); });
        if (attempt % 2) {
            std::this_thread::yield();
        }
        strategy.cancel();
        finisher.join();

        assert(count_files(dir.path, "staging_") == 0);
        if (!ec) {
            // finish claimed the session first, the recording is whole
            assert(strategy.state() == SessionState::done);
            assert(result.text == "tiny:2");
            assert(fs::file_size(canonical) == wav_header_size + audio.size() * sizeof(float));
        } else {
            assert(ec == PipelineErrc::invalid_state);
            assert(strategy.state() == SessionState::failed);
            assert(!fs::exists(canonical));
        }
    }
}

int main() {
    test_round_trip();
    test_empty_recording();
    test_cancel_and_destroy();
    test_inference_failure();
    test_stereo_is_downmixed();
    test_cancel_from_another_thread_while_feeding();
    test_cancel_from_another_thread_while_finishing();
    return 0;
}
