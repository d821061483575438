//
//  strategy_selector.cpp
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

#include <algorithm>
#include <iterator>

#include "error.hpp"
#include "external_strategy.hpp"
#include "fallback_strategy.hpp"
#include "log.hpp"
#include "progressive_strategy.hpp"
#include "strategy_selector.hpp"

bool faster_than(const ModelDescriptor &a, const ModelDescriptor &b) {
  auto ra = speed_rank(a.id);
  auto rb = speed_rank(b.id);
  if (ra != rb) {
    return ra < rb;
  }
  if (a.has_accel != b.has_accel) {
    return a.has_accel;
  }
  if (a.size != b.size) {
    return a.size < b.size;
  }
  return a.id < b.id;
}

bool StrategySelector::is_warm(const ModelDescriptor &model) const {
  return !model.has_accel || states_.is_ready(model.id);
}

std::error_code
StrategySelector::plan_fallback(const std::vector<ModelDescriptor> &models,
                                StrategyPlan &plan) const {
  std::vector<ModelDescriptor> warm;
  std::copy_if(models.begin(), models.end(), std::back_inserter(warm),
               [this](const ModelDescriptor &m) { return is_warm(m); });
  const auto &pool = warm.empty() ? models : warm;
  if (pool.empty()) {
    return PipelineErrc::model_not_found;
  }
  if (warm.empty()) {
    BOOST_LOG_TRIVIAL(warning) << "selector:: no warm model, using "
                               << "an unaccelerated one";
  }
  plan.kind = StrategyKind::fallback;
  plan.fast = *std::min_element(pool.begin(), pool.end(), faster_than);
  plan.accurate = ModelDescriptor();
  return {};
}

bool StrategySelector::pick_pair(const std::vector<ModelDescriptor> &models,
                                 StrategyPlan &plan) const {
  std::vector<ModelDescriptor> warm;
  std::copy_if(models.begin(), models.end(), std::back_inserter(warm),
               [this](const ModelDescriptor &m) { return is_warm(m); });
  if (warm.size() < 2) {
    return false;
  }
  auto fast = *std::min_element(warm.begin(), warm.end(), faster_than);
  /* most accurate: slowest class, then the biggest file */
  auto accurate = *std::max_element(
      warm.begin(), warm.end(),
      [](const ModelDescriptor &a, const ModelDescriptor &b) {
        auto ra = speed_rank(a.id);
        auto rb = speed_rank(b.id);
        return ra != rb ? ra < rb : a.size < b.size;
      });
  bool larger = speed_rank(accurate.id) > speed_rank(fast.id) ||
                accurate.size > fast.size;
  if (accurate.id == fast.id || !larger) {
    return false;
  }
  plan.kind = StrategyKind::progressive;
  plan.fast = fast;
  plan.accurate = accurate;
  return true;
}

std::error_code StrategySelector::plan(std::optional<double> duration_secs,
                                       const StrategyConfig &config,
                                       StrategyPlan &plan) const {
  std::vector<ModelDescriptor> models;
  for (const auto &model : ModelScan(config.models_dir)) {
    models.push_back(model);
  }
  if (models.empty() && !(config.external_enabled && queue_)) {
    BOOST_LOG_TRIVIAL(error) << "selector:: no models in "
                             << config.models_dir;
    return PipelineErrc::model_not_found;
  }

  auto mismatch = [&](const char *why) -> std::error_code {
    if (config.forced_fallback) {
      BOOST_LOG_TRIVIAL(warning) << "selector:: forced "
                                 << to_string(*config.forced_strategy) << " "
                                 << why << ", falling back";
      return plan_fallback(models, plan);
    }
    BOOST_LOG_TRIVIAL(error) << "selector:: forced "
                             << to_string(*config.forced_strategy) << " "
                             << why;
    return PipelineErrc::strategy_mismatch;
  };

  if (config.forced_strategy) {
    switch (*config.forced_strategy) {
    case StrategyKind::progressive:
      if (!pick_pair(models, plan)) {
        return mismatch("needs a fast and an accurate warm model");
      }
      return {};
    case StrategyKind::external:
      if (!queue_) {
        return mismatch("needs a transcript queue");
      }
      plan = StrategyPlan();
      plan.kind = StrategyKind::external;
      return {};
    case StrategyKind::fallback:
      return plan_fallback(models, plan);
    }
  }

  if (config.external_enabled && queue_) {
    plan = StrategyPlan();
    plan.kind = StrategyKind::external;
    return {};
  }

  bool long_enough = !duration_secs ||
                     *duration_secs >= config.chunking_threshold_secs;
  if (config.enable_chunking && long_enough && pick_pair(models, plan)) {
    return {};
  }
  return plan_fallback(models, plan);
}

std::error_code
StrategySelector::select(std::optional<double> duration_secs,
                         const StrategyConfig &config,
                         const std::filesystem::path &temp_dir,
                         std::unique_ptr<Strategy> &strategy) const {
  StrategyPlan p;
  if (auto ec = plan(duration_secs, config, p)) {
    return ec;
  }

  switch (p.kind) {
  case StrategyKind::external:
    BOOST_LOG_TRIVIAL(info) << "selector:: external backend";
    strategy = std::make_unique<ExternalStrategy>(temp_dir, queue_);
    return {};

  case StrategyKind::progressive: {
    std::shared_ptr<Engine> fast, accurate;
    if (auto ec = cache_.get_or_create(p.fast.path, fast)) {
      return ec;
    }
    if (auto ec = cache_.get_or_create(p.accurate.path, accurate)) {
      return ec;
    }
    BOOST_LOG_TRIVIAL(info) << "selector:: progressive " << p.fast.id
                            << " -> " << p.accurate.id;
    strategy = std::make_unique<ProgressiveStrategy>(temp_dir, fast, accurate,
                                                     pool_);
    return {};
  }

  case StrategyKind::fallback: {
    std::shared_ptr<Engine> engine;
    if (auto ec = cache_.get_or_create(p.fast.path, engine)) {
      return ec;
    }
    BOOST_LOG_TRIVIAL(info) << "selector:: fallback on " << p.fast.id;
    strategy = std::make_unique<FallbackStrategy>(temp_dir, engine);
    return {};
  }
  }
  return PipelineErrc::strategy_mismatch;
}
