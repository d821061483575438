//
//  model_state.hpp
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

#ifndef _MODEL_STATE_HPP_
#define _MODEL_STATE_HPP_

#include <filesystem>
#include <functional>
#include <future>
#include <map>
#include <mutex>
#include <set>
#include <shared_mutex>
#include <string>
#include <system_error>
#include <vector>

#include "model_registry.hpp"

enum class ModelStatus { not_downloaded, downloaded, warming, ready, failed };

const char *to_string(ModelStatus status);
bool model_status_from_string(const std::string &name, ModelStatus &status);

struct ModelState {
  ModelStatus status{ModelStatus::not_downloaded};
  std::string reason;       // set when failed
  std::string last_warmed;  // set when ready

  static ModelState failed(const std::string &reason) {
    return {ModelStatus::failed, reason, {}};
  }
  bool operator==(ModelStatus s) const { return status == s; }
  bool operator!=(ModelStatus s) const { return status != s; }
};

/* forward only, except failed -> warming for a retry */
bool transition_allowed(ModelStatus from, ModelStatus to);

/* Acceleration state of every model, persisted in
   <state_dir>/model_states.json. One writer at a time, readers see the
   last committed value. */
class ModelStateStore {
public:
  /* loads and smoke tests the accelerated variant, fills reason on failure */
  using Warmer =
      std::function<bool(const ModelDescriptor &model, std::string &reason)>;

  ModelStateStore(const std::filesystem::path &state_dir,
                  const std::filesystem::path &models_dir);
  ModelStateStore(const ModelStateStore &) = delete;

  void set_warmer(Warmer warmer) { warmer_ = std::move(warmer); }

  ModelState get_state(const std::string &id) const;
  std::error_code set_state(const std::string &id, const ModelState &state);
  bool is_ready(const std::string &id) const;
  bool is_any_warming() const;
  std::vector<std::string> warming_models() const;
  std::map<std::string, ModelState> list() const;

  /* a model and its accelerated variant showed up on disk */
  void mark_downloaded(const std::string &id, bool has_accel);

  ModelScan discover_warmable_models() const {
    return ModelScan(models_dir_, true);
  }

  /* warms every discovered model not ready yet, returns how many
     reached ready during this call */
  size_t warm_models(bool retry_failed = false);
  std::future<size_t> warm_models_async(bool retry_failed = false);

  /* manual retry of a failed model */
  std::error_code retry(const std::string &id);

  const std::filesystem::path &get_state_file() const { return state_file_; }

private:
  bool load();
  bool persist(const std::map<std::string, ModelState> &states);
  /* warmed is set when this call took the model to ready */
  std::error_code warm_one(const ModelDescriptor &model, bool &warmed);
  bool try_begin_warm(const std::string &id);
  void end_warm(const std::string &id);

  std::filesystem::path state_file_;
  std::filesystem::path models_dir_;
  Warmer warmer_;

  mutable std::shared_mutex states_mutex_;
  std::map<std::string, ModelState> states_;

  std::mutex warm_mutex_;
  std::set<std::string> warming_;
};

#endif
