//
//  progressive_strategy.cpp
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

#include <boost/asio/post.hpp>

#include <algorithm>
#include <chrono>

#include "error.hpp"
#include "log.hpp"
#include "progressive_strategy.hpp"

template <typename T> static bool is_ready(const std::shared_future<T> &f) {
  return f.valid() &&
         f.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
}

std::error_code ProgressiveStrategy::on_start() {
  chunk_frames_ =
      static_cast<size_t>(config_.chunk_duration_secs) * config_.sample_rate;
  window_frames_ =
      static_cast<size_t>(config_.refinement_chunk_secs) * config_.sample_rate;
  if (chunk_frames_ == 0 || window_frames_ == 0) {
    BOOST_LOG_TRIVIAL(error) << "progressive:: chunk durations must be > 0";
    return PipelineErrc::invalid_state;
  }
  chunk_buf_.reserve(chunk_frames_);
  window_buf_.reserve(window_frames_);
  BOOST_LOG_TRIVIAL(info) << "progressive:: fast " << fast_->get_model_id()
                          << " every " << config_.chunk_duration_secs
                          << "s, accurate " << accurate_->get_model_id()
                          << " every " << config_.refinement_chunk_secs << "s";
  return {};
}

std::shared_future<ProgressiveStrategy::Pass>
ProgressiveStrategy::schedule(boost::asio::thread_pool &pool,
                              const std::shared_ptr<Engine> &engine,
                              std::vector<float> samples) {
  /* the task only holds shared state, it may outlive the strategy */
  auto task = std::make_shared<std::packaged_task<Pass()>>(
      [engine, cancelled = cancelled_, samples = std::move(samples)]() {
        Pass pass;
        if (*cancelled) {
          return pass;
        }
        try {
          pass.ok = engine->transcribe(samples.data(), samples.size(),
                                       pass.text);
        } catch (const std::exception &e) {
          BOOST_LOG_TRIVIAL(error) << "progressive:: " << engine->get_model_id()
                                   << " pass threw: " << e.what();
          pass.ok = false;
        }
        return pass;
      });
  auto future = task->get_future().share();
  boost::asio::post(pool, [task]() { (*task)(); });
  return future;
}

void ProgressiveStrategy::flush_fast_chunk() {
  if (chunk_buf_.empty()) {
    return;
  }
  auto pass = schedule(fast_lane_, fast_, std::move(chunk_buf_));
  chunk_buf_.clear();
  std::lock_guard<std::mutex> lock(windows_mutex_);
  current_.fast.push_back(pass);
}

void ProgressiveStrategy::close_window() {
  flush_fast_chunk();
  if (window_buf_.empty()) {
    return;
  }
  BOOST_LOG_TRIVIAL(debug) << "progressive:: refining window of "
                           << window_buf_.size() << " frames";
  auto refined = schedule(pool_, accurate_, std::move(window_buf_));
  window_buf_.clear();
  std::lock_guard<std::mutex> lock(windows_mutex_);
  current_.refined = refined;
  windows_.push_back(std::move(current_));
  current_ = Window();
}

std::error_code ProgressiveStrategy::on_samples(const float *mono,
                                                size_t frames) {
  while (frames > 0) {
    /* never let a fast chunk straddle a window boundary */
    size_t room = std::min(chunk_frames_ - chunk_buf_.size(),
                           window_frames_ - window_buf_.size());
    size_t n = std::min(room, frames);
    chunk_buf_.insert(chunk_buf_.end(), mono, mono + n);
    window_buf_.insert(window_buf_.end(), mono, mono + n);
    mono += n;
    frames -= n;

    if (window_buf_.size() >= window_frames_) {
      close_window();
    } else if (chunk_buf_.size() >= chunk_frames_) {
      flush_fast_chunk();
    }
  }
  return {};
}

std::vector<std::string> ProgressiveStrategy::partial_results() const {
  std::vector<std::string> texts;
  std::lock_guard<std::mutex> lock(windows_mutex_);
  auto collect = [&texts](const Window &w) {
    if (is_ready(w.refined) && w.refined.get().ok) {
      texts.push_back(w.refined.get().text);
      return;
    }
    for (const auto &f : w.fast) {
      if (!is_ready(f)) {
        break;
      }
      if (f.get().ok) {
        texts.push_back(f.get().text);
      }
    }
  };
  for (const auto &w : windows_) {
    collect(w);
  }
  collect(current_);
  return texts;
}

std::error_code ProgressiveStrategy::on_finish(TranscriptionResult &result) {
  close_window();

  std::vector<Window> windows;
  {
    std::lock_guard<std::mutex> lock(windows_mutex_);
    windows = windows_;
  }
  auto timeout = std::chrono::milliseconds(config_.refinement_timeout_ms);
  auto deadline = std::chrono::steady_clock::now() + timeout;
  /* fast passes of the last chunk start at finish, give them one more
     timeout before giving up on a window */
  auto fast_deadline = deadline + timeout;

  std::vector<std::string> texts;
  size_t refined_count{0};
  for (size_t i = 0; i < windows.size(); ++i) {
    const auto &w = windows[i];
    if (w.refined.wait_until(deadline) == std::future_status::ready &&
        w.refined.get().ok) {
      texts.push_back(w.refined.get().text);
      ++refined_count;
      continue;
    }

    if (*cancelled_) {
      return PipelineErrc::cancelled;
    }
    BOOST_LOG_TRIVIAL(warning)
        << "progressive:: window " << i << ": "
        << make_error_code(PipelineErrc::refinement_timeout).message()
        << ", using fast text";
    std::vector<std::string> fast_texts;
    for (const auto &f : w.fast) {
      if (f.wait_until(fast_deadline) != std::future_status::ready) {
        BOOST_LOG_TRIVIAL(error) << "progressive:: window " << i
                                 << " fast pass still running at deadline";
        return PipelineErrc::transcription_failed;
      }
      const auto &pass = f.get();
      if (!pass.ok) {
        BOOST_LOG_TRIVIAL(error) << "progressive:: window " << i
                                 << " has no usable transcript";
        return PipelineErrc::transcription_failed;
      }
      fast_texts.push_back(pass.text);
    }
    texts.push_back(join_texts(fast_texts));
  }

  if (*cancelled_) {
    return PipelineErrc::cancelled;
  }
  result.text = join_texts(texts);
  result.chunks_processed = refined_count;
  BOOST_LOG_TRIVIAL(info) << "progressive:: " << refined_count << " of "
                          << windows.size() << " windows refined";
  return {};
}

void ProgressiveStrategy::on_cancel() {
  /* queued passes see the flag and return at once */
  *cancelled_ = true;
}
