#include <boost/asio/thread_pool.hpp>

#include <cassert>
#include <vector>

#include "error.hpp"
#include "progressive_strategy.hpp"
#include "test_support.hpp"

static StrategyConfig progressive_config() {
    StrategyConfig sc;
    sc.sample_rate = 16000;
    sc.channels = 1;
    sc.chunk_duration_secs = 1;
    sc.refinement_chunk_secs = 2;
    sc.refinement_timeout_ms = 2000;
    return sc;
}

// five seconds: two full windows tagged 0 and 1, a trailing second tagged 2
static void feed(Strategy &strategy) {
    for (int window = 0; window < 3; ++window) {
        size_t frames = window < 2 ? 32000 : 16000;
        auto audio = tagged_samples(frames, static_cast<float>(window));
        for (size_t off = 0; off < audio.size(); off += 8000) {
            assert(!strategy.process_samples(audio.data() + off, 8000));
        }
    }
}

static void test_refined_merge_in_order() {
    TempDir dir;
    boost::asio::thread_pool pool(4);
    auto fast = std::make_shared<FakeEngine>("tiny", "f");
    auto accurate = std::make_shared<FakeEngine>("medium", "a");
    ProgressiveStrategy strategy(dir.path, fast, accurate, pool);
    assert(!strategy.start_recording(dir / "rec.wav", progressive_config()));
    feed(strategy);

    TranscriptionResult result;
    assert(!strategy.finish_recording(result));
    assert(result.text == "a0 a1 a2");
    assert(result.chunks_processed == 3);
    assert(result.strategy_used == "progressive");
    assert(result.recording_bytes == wav_header_size + 5 * 16000 * sizeof(float));
    assert(count_files(dir.path, "staging_") == 0);

    pool.join();
    // fast passes never straddle a window
    assert(fast->get_sizes() == (std::vector<size_t>{16000, 16000, 16000, 16000, 16000}));
    auto refined = accurate->get_sizes();
    assert(refined.size() == 3);
}

static void test_slow_refinement_uses_fast_text() {
    TempDir dir;
    boost::asio::thread_pool pool(4);
    auto fast = std::make_shared<FakeEngine>("tiny", "f");
    auto accurate = std::make_shared<FakeEngine>("medium", "a");
    accurate->delay = std::chrono::milliseconds(800);
    auto sc = progressive_config();
    sc.refinement_timeout_ms = 50;

    ProgressiveStrategy strategy(dir.path, fast, accurate, pool);
    assert(!strategy.start_recording(dir / "rec.wav", sc));
    feed(strategy);
    TranscriptionResult result;
    assert(!strategy.finish_recording(result));
    assert(result.text == "f0 f0 f1 f1 f2");
    assert(result.chunks_processed == 0);
    assert(strategy.state() == SessionState::done);
    pool.join();
}

static void test_finish_bounded_with_busy_pool() {
    TempDir dir;
    // one worker, every refinement far slower than the timeout
    boost::asio::thread_pool pool(1);
    auto fast = std::make_shared<FakeEngine>("tiny", "f");
    auto accurate = std::make_shared<FakeEngine>("medium", "a");
    accurate->delay = std::chrono::milliseconds(1500);
    auto sc = progressive_config();
    sc.refinement_timeout_ms = 50;

    ProgressiveStrategy strategy(dir.path, fast, accurate, pool);
    assert(!strategy.start_recording(dir / "rec.wav", sc));
    feed(strategy);
    auto start = std::chrono::steady_clock::now();
    TranscriptionResult result;
    assert(!strategy.finish_recording(result));
    auto took = std::chrono::steady_clock::now() - start;
    assert(took < std::chrono::milliseconds(1000));
    assert(result.text == "f0 f0 f1 f1 f2");
    assert(result.chunks_processed == 0);
    pool.join();
}

static void test_hung_fast_model_fails_in_time() {
    TempDir dir;
    boost::asio::thread_pool pool(1);
    auto fast = std::make_shared<FakeEngine>("tiny", "f");
    auto accurate = std::make_shared<FakeEngine>("medium", "a");
    fast->delay = std::chrono::milliseconds(1500);
    accurate->delay = std::chrono::milliseconds(1500);
    auto sc = progressive_config();
    sc.refinement_timeout_ms = 100;
    {
        ProgressiveStrategy strategy(dir.path, fast, accurate, pool);
        assert(!strategy.start_recording(dir / "rec.wav", sc));
        feed(strategy);
        auto start = std::chrono::steady_clock::now();
        TranscriptionResult result;
        assert(strategy.finish_recording(result) == PipelineErrc::transcription_failed);
        assert(std::chrono::steady_clock::now() - start < std::chrono::milliseconds(1000));
        assert(strategy.state() == SessionState::failed);
        assert(fs::exists(dir / "rec.wav"));
        assert(count_files(dir.path, "staging_") == 0);
    }
    pool.join();
}

static void test_failed_refinement_uses_fast_text() {
    TempDir dir;
    boost::asio::thread_pool pool(2);
    auto fast = std::make_shared<FakeEngine>("tiny", "f");
    auto accurate = std::make_shared<FakeEngine>("medium", "a");
    accurate->fail = true;
    ProgressiveStrategy strategy(dir.path, fast, accurate, pool);
    assert(!strategy.start_recording(dir / "rec.wav", progressive_config()));
    feed(strategy);
    TranscriptionResult result;
    assert(!strategy.finish_recording(result));
    assert(result.text == "f0 f0 f1 f1 f2");
    pool.join();
}

static void test_both_fail() {
    TempDir dir;
    boost::asio::thread_pool pool(2);
    auto fast = std::make_shared<FakeEngine>("tiny", "f");
    auto accurate = std::make_shared<FakeEngine>("medium", "a");
    fast->fail = true;
    accurate->fail = true;
    ProgressiveStrategy strategy(dir.path, fast, accurate, pool);
    assert(!strategy.start_recording(dir / "rec.wav", progressive_config()));
    feed(strategy);
    TranscriptionResult result;
    assert(strategy.finish_recording(result) == PipelineErrc::transcription_failed);
    assert(strategy.state() == SessionState::failed);
    assert(result.text.empty());
    pool.join();
}

static void test_partial_results() {
    TempDir dir;
    boost::asio::thread_pool pool(2);
    auto fast = std::make_shared<FakeEngine>("tiny", "f");
    auto accurate = std::make_shared<FakeEngine>("medium", "a");
    accurate->delay = std::chrono::milliseconds(300);
    ProgressiveStrategy strategy(dir.path, fast, accurate, pool);
    assert(!strategy.start_recording(dir / "rec.wav", progressive_config()));
    assert(strategy.partial_text().empty());

    auto audio = tagged_samples(16000, 4.0f);
    assert(!strategy.process_samples(audio.data(), audio.size()));
    for (int i = 0; i < 200 && strategy.partial_results().empty(); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    assert(strategy.partial_text() == "f4");

    TranscriptionResult result;
    assert(!strategy.finish_recording(result));
    assert(result.text == "a4");
    pool.join();
}

static void test_cancel() {
    TempDir dir;
    boost::asio::thread_pool pool(1);
    auto fast = std::make_shared<FakeEngine>("tiny", "f");
    auto accurate = std::make_shared<FakeEngine>("medium", "a");
    fast->delay = std::chrono::milliseconds(100);
    {
        ProgressiveStrategy strategy(dir.path, fast, accurate, pool);
        assert(!strategy.start_recording(dir / "rec.wav", progressive_config()));
        feed(strategy);
        strategy.cancel();
        assert(strategy.state() == SessionState::failed);
        assert(count_files(dir.path, "staging_") == 0);
        TranscriptionResult result;
        assert(strategy.finish_recording(result) == PipelineErrc::invalid_state);
    }
    // queued refinements outlive the strategy and see the cancel flag
    pool.join();
    assert(fast->calls < 5);
    assert(!fs::exists(dir / "rec.wav"));
}

int main() {
    test_refined_merge_in_order();
    test_slow_refinement_uses_fast_text();
    test_finish_bounded_with_busy_pool();
    test_hung_fast_model_fails_in_time();
    test_failed_refinement_uses_fast_text();
    test_both_fail();
    test_partial_results();
    test_cancel();
    return 0;
}
