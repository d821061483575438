//
//  transcriber_cache.hpp
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

#ifndef _TRANSCRIBER_CACHE_HPP_
#define _TRANSCRIBER_CACHE_HPP_

#include <atomic>
#include <filesystem>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <system_error>

#include "engine.hpp"
#include "model_state.hpp"

enum class AccelMode {
  automatic,  // only when the state store reports ready
  force,      // warm-up path, compile regardless of state
  off
};

/* Loaded engines keyed by model id. Concurrent requests for one id share a
   single load; the accelerated encoder compile is serialized process wide.
   Entries live as long as the cache, nothing is evicted. */
class TranscriberCache {
public:
  explicit TranscriberCache(EngineFactory factory,
                            const ModelStateStore *states = nullptr)
      : factory_(std::move(factory)), states_(states) {}
  TranscriberCache(const TranscriberCache &) = delete;

  std::error_code get_or_create(const std::filesystem::path &model_path,
                                std::shared_ptr<Engine> &engine,
                                AccelMode mode = AccelMode::automatic);

  bool contains(const std::string &id) const;
  bool is_accel_ready(const std::string &id) const;
  std::string get_accel_error(const std::string &id) const;
  size_t size() const;

private:
  struct Slot {
    std::shared_future<std::shared_ptr<Engine>> engine;
    std::atomic_bool accel_ready{false};
    std::string accel_error;  // guarded by accel_mutex_
  };

  std::error_code ensure_acceleration(const ModelDescriptor &model,
                                      Slot &slot, Engine &engine,
                                      AccelMode mode);

  EngineFactory factory_;
  const ModelStateStore *states_;
  mutable std::mutex slots_mutex_;
  std::map<std::string, std::shared_ptr<Slot>> slots_;
  mutable std::mutex accel_mutex_;
};

/* warm-up used by the state store: loads the model through the cache with
   forced acceleration and runs one second of silence through it */
ModelStateStore::Warmer make_cache_warmer(TranscriberCache &cache);

#endif
