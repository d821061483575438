//
//  strategy_selector.hpp
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

#ifndef _STRATEGY_SELECTOR_HPP_
#define _STRATEGY_SELECTOR_HPP_

#include <boost/asio/thread_pool.hpp>

#include <filesystem>
#include <memory>
#include <optional>
#include <system_error>
#include <vector>

#include "config.hpp"
#include "model_registry.hpp"
#include "model_state.hpp"
#include "strategy.hpp"
#include "transcriber_cache.hpp"
#include "transcript_queue.hpp"

struct StrategyPlan {
  StrategyKind kind{StrategyKind::fallback};
  ModelDescriptor fast;      // the single model for fallback
  ModelDescriptor accurate;  // progressive only
};

/* Picks the strategy for a new session:
   1. a forced strategy wins, or fails with strategy_mismatch when its models
      are missing (fallback instead when forced_fallback is set)
   2. external when enabled and a queue is attached
   3. progressive when chunking applies and two distinct warm models exist
   4. fallback on the fastest model */
class StrategySelector {
public:
  StrategySelector(const ModelStateStore &states, TranscriberCache &cache,
                   boost::asio::thread_pool &pool,
                   std::shared_ptr<TranscriptQueue> queue = nullptr)
      : states_(states), cache_(cache), pool_(pool),
        queue_(std::move(queue)){};

  /* decision only, no engine is loaded */
  std::error_code plan(std::optional<double> duration_secs,
                       const StrategyConfig &config, StrategyPlan &plan) const;

  /* plans, loads the engines through the cache and builds a strategy that
     still has to be started */
  std::error_code select(std::optional<double> duration_secs,
                         const StrategyConfig &config,
                         const std::filesystem::path &temp_dir,
                         std::unique_ptr<Strategy> &strategy) const;

  /* a model is warm when it has nothing to warm or its state is ready */
  bool is_warm(const ModelDescriptor &model) const;

private:
  std::error_code plan_fallback(const std::vector<ModelDescriptor> &models,
                                StrategyPlan &plan) const;
  bool pick_pair(const std::vector<ModelDescriptor> &models,
                 StrategyPlan &plan) const;

  const ModelStateStore &states_;
  TranscriberCache &cache_;
  boost::asio::thread_pool &pool_;
  std::shared_ptr<TranscriptQueue> queue_;
};

/* fastest first: speed rank, then accelerated, then smaller */
bool faster_than(const ModelDescriptor &a, const ModelDescriptor &b);

#endif
