//
//  strategy.hpp
//
//  Copyright (c) 2019 2025 Andrea Bondavalli. All rights reserved.
//
//  This program is free software: you can redistribute it and/or modify
//  it under the terms of the MIT license
//
//  This program is distributed in the hope that it will be useful,
//  but WITHOUT ANY WARRANTY; without even the implied warranty of
//  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.
//

#ifndef _STRATEGY_HPP_
#define _STRATEGY_HPP_

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>
#include <system_error>
#include <vector>

#include "config.hpp"
#include "wav.hpp"

enum class SessionState { created, recording, finishing, done, failed };

const char *to_string(SessionState state);

/* trims every piece and joins the non empty ones with a single space */
std::string join_texts(const std::vector<std::string> &texts);

struct TranscriptionResult {
  std::string text;
  uint64_t processing_time_ms{0};
  size_t chunks_processed{0};  // refinement windows that made it in
  std::string strategy_used;
  uint64_t recording_bytes{0};
};

/* One recording session. Created -> recording -> finishing -> done|failed.
   The staging file belongs to the strategy and is removed on every path
   out of it: finish, error, cancel or destruction. */
class Strategy {
public:
  explicit Strategy(const std::filesystem::path &temp_dir)
      : temp_dir_(temp_dir){};
  Strategy(const Strategy &) = delete;
  Strategy &operator=(const Strategy &) = delete;
  virtual ~Strategy();

  virtual StrategyKind kind() const = 0;
  const char *name() const { return to_string(kind()); }

  std::error_code start_recording(const std::filesystem::path &output_path,
                                  const StrategyConfig &config);
  std::error_code process_samples(const float *samples, size_t count);
  std::error_code finish_recording(TranscriptionResult &result);
  void cancel();

  /* texts available so far, in chronological order */
  virtual std::vector<std::string> partial_results() const { return {}; }
  std::string partial_text() const { return join_texts(partial_results()); }

  SessionState state() const { return state_; }
  const std::filesystem::path &get_staging_path() const {
    return staging_path_;
  }

protected:
  /* hooks for the concrete engines, called with the state already checked */
  virtual std::error_code on_start() { return {}; }
  /* samples after the staging write, downmixed to mono */
  virtual std::error_code on_samples(const float *mono, size_t frames) = 0;
  /* the canonical recording is in place when called */
  virtual std::error_code on_finish(TranscriptionResult &result) = 0;
  /* stop outstanding work, must not block on inference */
  virtual void on_cancel() {}

  /* reads the promoted recording back as mono floats */
  std::error_code load_recording(std::vector<float> &mono) const;

  StrategyConfig config_;
  std::filesystem::path temp_dir_;
  std::filesystem::path output_path_;
  std::filesystem::path staging_path_;

private:
  void fail(const std::error_code &ec);
  void release_staging();

  /* held around every use of the writer and the staging file, never
     across on_finish so cancel can reach a running inference */
  std::mutex session_mutex_;
  WavWriter writer_;
  std::atomic<SessionState> state_{SessionState::created};
};

#endif
