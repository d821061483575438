//
//  transcriber_cache.cpp
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

#include <vector>

#include "error.hpp"
#include "log.hpp"
#include "transcriber_cache.hpp"
#include "utils.hpp"

std::error_code
TranscriberCache::get_or_create(const std::filesystem::path &model_path,
                                std::shared_ptr<Engine> &engine,
                                AccelMode mode) {
  auto model = describe_model(model_path);
  if (!model) {
    BOOST_LOG_TRIVIAL(error) << "cache:: model not found " << model_path;
    return PipelineErrc::model_not_found;
  }

  std::shared_ptr<Slot> slot;
  std::promise<std::shared_ptr<Engine>> promise;
  bool creator{false};
  {
    std::lock_guard<std::mutex> lock(slots_mutex_);
    auto it = slots_.find(model->id);
    if (it == slots_.end()) {
      slot = std::make_shared<Slot>();
      slot->engine = promise.get_future().share();
      slots_[model->id] = slot;
      creator = true;
    } else {
      slot = it->second;
    }
  }

  if (creator) {
    BOOST_LOG_TRIVIAL(info) << "cache:: creating transcriber for "
                            << model->id;
    std::shared_ptr<Engine> created;
    {
      TimeElapsed te("cache:: load of " + model->id);
      try {
        created = factory_(*model);
      } catch (const std::exception &e) {
        BOOST_LOG_TRIVIAL(error) << "cache:: load of " << model->id
                                 << " threw: " << e.what();
      } catch (...) {
        BOOST_LOG_TRIVIAL(error) << "cache:: load of " << model->id
                                 << " threw an unknown exception";
      }
    }
    if (!created) {
      /* drop the slot so the next caller retries */
      std::lock_guard<std::mutex> lock(slots_mutex_);
      slots_.erase(model->id);
    }
    promise.set_value(created);
  } else {
    BOOST_LOG_TRIVIAL(debug) << "cache:: reusing transcriber for "
                             << model->id;
  }

  auto loaded = slot->engine.get();
  if (!loaded) {
    BOOST_LOG_TRIVIAL(error) << "cache:: cannot create transcriber for "
                             << model->id;
    return PipelineErrc::cache_creation_failed;
  }

  if (auto ec = ensure_acceleration(*model, *slot, *loaded, mode)) {
    return ec;
  }
  engine = loaded;
  return {};
}

std::error_code TranscriberCache::ensure_acceleration(
    const ModelDescriptor &model, Slot &slot, Engine &engine, AccelMode mode) {
  bool wanted = mode == AccelMode::force ||
                (mode == AccelMode::automatic && states_ != nullptr &&
                 states_->is_ready(model.id));
  if (!wanted || slot.accel_ready) {
    return {};
  }
  if (!model.has_accel) {
    if (mode == AccelMode::force) {
      BOOST_LOG_TRIVIAL(warning) << "cache:: no accelerated variant for "
                                 << model.id;
      return PipelineErrc::warm_up_failed;
    }
    return {};
  }

  std::lock_guard<std::mutex> lock(accel_mutex_);
  if (slot.accel_ready) {
    return {};
  }
  std::string reason;
  if (!engine.init_acceleration(reason)) {
    slot.accel_error = reason;
    if (mode == AccelMode::force) {
      BOOST_LOG_TRIVIAL(error) << "cache:: acceleration init of " << model.id
                               << " failed: " << reason;
      return PipelineErrc::warm_up_failed;
    }
    BOOST_LOG_TRIVIAL(warning) << "cache:: acceleration init of " << model.id
                               << " failed, staying on CPU: " << reason;
    return {};
  }
  slot.accel_error.clear();
  slot.accel_ready = true;
  BOOST_LOG_TRIVIAL(info) << "cache:: acceleration enabled for " << model.id;
  return {};
}

bool TranscriberCache::contains(const std::string &id) const {
  std::lock_guard<std::mutex> lock(slots_mutex_);
  return slots_.count(id) > 0;
}

bool TranscriberCache::is_accel_ready(const std::string &id) const {
  std::lock_guard<std::mutex> lock(slots_mutex_);
  auto it = slots_.find(id);
  return it != slots_.end() && it->second->accel_ready;
}

std::string TranscriberCache::get_accel_error(const std::string &id) const {
  std::shared_ptr<Slot> slot;
  {
    std::lock_guard<std::mutex> lock(slots_mutex_);
    auto it = slots_.find(id);
    if (it == slots_.end()) {
      return {};
    }
    slot = it->second;
  }
  std::lock_guard<std::mutex> lock(accel_mutex_);
  return slot->accel_error;
}

size_t TranscriberCache::size() const {
  std::lock_guard<std::mutex> lock(slots_mutex_);
  return slots_.size();
}

ModelStateStore::Warmer make_cache_warmer(TranscriberCache &cache) {
  return [&cache](const ModelDescriptor &model, std::string &reason) {
    std::shared_ptr<Engine> engine;
    if (auto ec = cache.get_or_create(model.path, engine, AccelMode::force)) {
      auto detail = cache.get_accel_error(model.id);
      reason = detail.empty() ? ec.message() : detail;
      return false;
    }
    /* smoke test on one second of silence */
    std::vector<float> silence(16000, 0.0f);
    std::string text;
    if (!engine->transcribe(silence.data(), silence.size(), text)) {
      reason = "smoke test transcription failed";
      return false;
    }
    return true;
  };
}
