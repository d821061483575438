//
//  progressive_strategy.hpp
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

#ifndef _PROGRESSIVE_STRATEGY_HPP_
#define _PROGRESSIVE_STRATEGY_HPP_

#include <boost/asio/thread_pool.hpp>

#include <atomic>
#include <future>
#include <memory>
#include <mutex>
#include <vector>

#include "engine.hpp"
#include "strategy.hpp"

/* Fast model on short chunks for immediate text, accurate model on
   refinement windows. At finish every window takes the refined text when it
   arrived before the deadline, the fast text otherwise. Fast passes run on
   their own single thread lane so refinements queued on the shared pool
   never delay them. */
class ProgressiveStrategy : public Strategy {
public:
  ProgressiveStrategy(const std::filesystem::path &temp_dir,
                      std::shared_ptr<Engine> fast,
                      std::shared_ptr<Engine> accurate,
                      boost::asio::thread_pool &pool)
      : Strategy(temp_dir), fast_(std::move(fast)),
        accurate_(std::move(accurate)), pool_(pool){};
  ~ProgressiveStrategy() override { cancel(); }

  StrategyKind kind() const override { return StrategyKind::progressive; }
  std::vector<std::string> partial_results() const override;

  const std::string &get_fast_model_id() const {
    return fast_->get_model_id();
  }
  const std::string &get_accurate_model_id() const {
    return accurate_->get_model_id();
  }

protected:
  std::error_code on_start() override;
  std::error_code on_samples(const float *mono, size_t frames) override;
  std::error_code on_finish(TranscriptionResult &result) override;
  void on_cancel() override;

private:
  struct Pass {
    bool ok{false};
    std::string text;
  };

  struct Window {
    std::vector<std::shared_future<Pass>> fast;
    std::shared_future<Pass> refined;
  };

  std::shared_future<Pass> schedule(boost::asio::thread_pool &pool,
                                    const std::shared_ptr<Engine> &engine,
                                    std::vector<float> samples);
  void flush_fast_chunk();
  void close_window();

  std::shared_ptr<Engine> fast_;
  std::shared_ptr<Engine> accurate_;
  boost::asio::thread_pool &pool_;
  std::shared_ptr<std::atomic_bool> cancelled_{
      std::make_shared<std::atomic_bool>(false)};

  size_t chunk_frames_{0};
  size_t window_frames_{0};
  std::vector<float> chunk_buf_;
  std::vector<float> window_buf_;

  mutable std::mutex windows_mutex_;
  std::vector<Window> windows_;  // closed windows, chronological
  Window current_;

  boost::asio::thread_pool fast_lane_{1};
};

#endif
