//
//  strategy.cpp
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

#include <chrono>

#include "error.hpp"
#include "log.hpp"
#include "staging.hpp"
#include "strategy.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;

const char *to_string(StrategyKind kind) {
  switch (kind) {
  case StrategyKind::progressive:
    return "progressive";
  case StrategyKind::fallback:
    return "fallback";
  case StrategyKind::external:
    return "external";
  }
  return "unknown";
}

std::optional<StrategyKind> strategy_kind_from_string(const std::string &name) {
  for (auto kind : {StrategyKind::progressive, StrategyKind::fallback,
                    StrategyKind::external}) {
    if (name == to_string(kind)) {
      return kind;
    }
  }
  /* "auto" and anything unknown leave the choice to the selector */
  return std::nullopt;
}

const char *to_string(SessionState state) {
  switch (state) {
  case SessionState::created:
    return "created";
  case SessionState::recording:
    return "recording";
  case SessionState::finishing:
    return "finishing";
  case SessionState::done:
    return "done";
  case SessionState::failed:
    return "failed";
  }
  return "unknown";
}

std::string join_texts(const std::vector<std::string> &texts) {
  std::string out;
  for (const auto &text : texts) {
    auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
      continue;
    }
    auto end = text.find_last_not_of(" \t\r\n");
    if (!out.empty()) {
      out += ' ';
    }
    out += text.substr(begin, end - begin + 1);
  }
  return out;
}

Strategy::~Strategy() { release_staging(); }

void Strategy::release_staging() {
  if (writer_.is_open() && !writer_.close()) {
    BOOST_LOG_TRIVIAL(warning) << "strategy:: error closing " << staging_path_;
  }
  if (!staging_path_.empty()) {
    std::error_code ec;
    if (fs::exists(staging_path_, ec)) {
      discard_staging(staging_path_);
    }
  }
}

void Strategy::fail(const std::error_code &ec) {
  BOOST_LOG_TRIVIAL(error) << "strategy:: " << name()
                           << " session failed: " << ec.message();
  on_cancel();
  release_staging();
  state_ = SessionState::failed;
}

std::error_code Strategy::start_recording(const fs::path &output_path,
                                          const StrategyConfig &config) {
  std::lock_guard<std::mutex> lock(session_mutex_);
  if (state_ != SessionState::created) {
    BOOST_LOG_TRIVIAL(error) << "strategy:: start_recording in state "
                             << to_string(state_);
    return PipelineErrc::invalid_state;
  }
  config_ = config;
  output_path_ = output_path;
  staging_path_ = temp_dir_ / ("staging_" + new_uuid_string() + ".wav");

  std::error_code dir_ec;
  fs::create_directories(temp_dir_, dir_ec);
  if (dir_ec || !writer_.open(staging_path_.string(), config_.sample_rate,
                          config_.channels)) {
    BOOST_LOG_TRIVIAL(error) << "strategy:: cannot open staging file "
                             << staging_path_;
    fail(PipelineErrc::staging_io_error);
    return PipelineErrc::staging_io_error;
  }

  if (auto ec = on_start()) {
    fail(ec);
    return ec;
  }
  state_ = SessionState::recording;
  BOOST_LOG_TRIVIAL(info) << "strategy:: " << name() << " recording "
                          << output_path_ << " staged in " << staging_path_;
  return {};
}

std::error_code Strategy::process_samples(const float *samples,
                                          size_t count) {
  std::lock_guard<std::mutex> lock(session_mutex_);
  if (state_ != SessionState::recording) {
    BOOST_LOG_TRIVIAL(warning) << "strategy:: samples in state "
                               << to_string(state_);
    return PipelineErrc::invalid_state;
  }
  if (!writer_.write(samples, count)) {
    fail(PipelineErrc::staging_io_error);
    return PipelineErrc::staging_io_error;
  }

  std::error_code ec;
  if (config_.channels > 1) {
    std::vector<float> interleaved(samples, samples + count);
    auto mono = downmix(interleaved, config_.channels);
    ec = on_samples(mono.data(), mono.size());
  } else {
    ec = on_samples(samples, count);
  }
  if (ec) {
    fail(ec);
  }
  return ec;
}

std::error_code Strategy::finish_recording(TranscriptionResult &result) {
  auto start = std::chrono::steady_clock::now();
  TranscriptionResult res;
  {
    std::lock_guard<std::mutex> lock(session_mutex_);
    auto expected = SessionState::recording;
    if (!state_.compare_exchange_strong(expected, SessionState::finishing)) {
      BOOST_LOG_TRIVIAL(error) << "strategy:: finish_recording in state "
                               << to_string(expected);
      return PipelineErrc::invalid_state;
    }

    if (!writer_.close()) {
      fail(PipelineErrc::staging_io_error);
      return PipelineErrc::staging_io_error;
    }

    if (auto ec = promote_staging(staging_path_, output_path_,
                                  config_.staging_min_bytes,
                                  res.recording_bytes)) {
      fail(ec);
      return ec;
    }
  }

  if (auto ec = on_finish(res)) {
    fail(ec);
    return ec;
  }

  res.strategy_used = name();
  res.processing_time_ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::steady_clock::now() - start)
          .count();
  result = std::move(res);
  state_ = SessionState::done;
  BOOST_LOG_TRIVIAL(info) << "strategy:: " << name() << " done, "
                          << result.text.size() << " chars in "
                          << result.processing_time_ms << " ms";
  return {};
}

void Strategy::cancel() {
  std::lock_guard<std::mutex> lock(session_mutex_);
  auto current = state_.load();
  if (current == SessionState::done || current == SessionState::failed) {
    return;
  }
  BOOST_LOG_TRIVIAL(info) << "strategy:: " << name() << " cancelled in state "
                          << to_string(current);
  if (current == SessionState::finishing) {
    /* finish_recording owns the staging file now, only stop the work */
    on_cancel();
    return;
  }
  on_cancel();
  release_staging();
  state_ = SessionState::failed;
}

std::error_code Strategy::load_recording(std::vector<float> &mono) const {
  WavData wav;
  if (!read_wav(output_path_.string(), wav)) {
    return PipelineErrc::staging_io_error;
  }
  mono = downmix(wav.samples, wav.channels);
  return {};
}
