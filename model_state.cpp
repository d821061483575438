//
//  model_state.cpp
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

#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

#include "error.hpp"
#include "log.hpp"
#include "model_state.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;
namespace pt = boost::property_tree;

static const std::string interrupted_reason("interrupted");

const char *to_string(ModelStatus status) {
  switch (status) {
  case ModelStatus::not_downloaded:
    return "not_downloaded";
  case ModelStatus::downloaded:
    return "downloaded";
  case ModelStatus::warming:
    return "warming";
  case ModelStatus::ready:
    return "ready";
  case ModelStatus::failed:
    return "failed";
  }
  return "unknown";
}

bool model_status_from_string(const std::string &name, ModelStatus &status) {
  for (auto s : {ModelStatus::not_downloaded, ModelStatus::downloaded,
                 ModelStatus::warming, ModelStatus::ready,
                 ModelStatus::failed}) {
    if (name == to_string(s)) {
      status = s;
      return true;
    }
  }
  return false;
}

bool transition_allowed(ModelStatus from, ModelStatus to) {
  switch (to) {
  case ModelStatus::not_downloaded:
    return from == ModelStatus::not_downloaded;
  case ModelStatus::downloaded:
    return from == ModelStatus::not_downloaded ||
           from == ModelStatus::downloaded;
  case ModelStatus::warming:
    return from == ModelStatus::downloaded || from == ModelStatus::failed;
  case ModelStatus::ready:
    return from == ModelStatus::warming || from == ModelStatus::ready;
  case ModelStatus::failed:
    return from == ModelStatus::downloaded || from == ModelStatus::warming ||
           from == ModelStatus::failed;
  }
  return false;
}

ModelStateStore::ModelStateStore(const fs::path &state_dir,
                                 const fs::path &models_dir)
    : state_file_(state_dir / "model_states.json"), models_dir_(models_dir) {
  load();
}

bool ModelStateStore::load() {
  std::error_code ec;
  if (!fs::exists(state_file_, ec)) {
    BOOST_LOG_TRIVIAL(debug) << "model_state:: no state file "
                             << state_file_;
    return false;
  }

  pt::ptree tree;
  try {
    pt::read_json(state_file_.string(), tree);
  } catch (const pt::json_parser_error &e) {
    BOOST_LOG_TRIVIAL(warning) << "model_state:: ignoring unreadable "
                               << state_file_ << ": " << e.what();
    return false;
  }

  std::unique_lock lock(states_mutex_);
  auto models = tree.get_child_optional("models");
  if (!models) {
    return true;
  }
  /* ids contain dots, iterate instead of using ptree paths */
  for (const auto &[id, node] : *models) {
    ModelState state;
    if (!model_status_from_string(node.get<std::string>("state", ""),
                                  state.status)) {
      BOOST_LOG_TRIVIAL(warning) << "model_state:: unknown state for " << id;
      continue;
    }
    state.reason = node.get<std::string>("reason", "");
    state.last_warmed = node.get<std::string>("last_warmed", "");
    if (state.status == ModelStatus::warming) {
      BOOST_LOG_TRIVIAL(warning) << "model_state:: warm-up of " << id
                                 << " was interrupted";
      state = ModelState::failed(interrupted_reason);
    }
    states_[id] = state;
  }
  BOOST_LOG_TRIVIAL(info) << "model_state:: loaded " << states_.size()
                          << " model states from " << state_file_;
  return true;
}

bool ModelStateStore::persist(const std::map<std::string, ModelState> &states) {
  pt::ptree models;
  for (const auto &[id, state] : states) {
    pt::ptree node;
    node.put("state", to_string(state.status));
    if (!state.reason.empty()) {
      node.put("reason", state.reason);
    }
    if (!state.last_warmed.empty()) {
      node.put("last_warmed", state.last_warmed);
    }
    models.push_back(std::make_pair(id, node));
  }
  pt::ptree tree;
  tree.add_child("models", models);

  auto tmp_file = state_file_;
  tmp_file += ".tmp";
  try {
    pt::write_json(tmp_file.string(), tree);
  } catch (const pt::json_parser_error &e) {
    BOOST_LOG_TRIVIAL(warning) << "model_state:: cannot write " << tmp_file
                               << ": " << e.what();
    return false;
  }

  std::error_code ec;
  fs::rename(tmp_file, state_file_, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(warning) << "model_state:: cannot replace "
                               << state_file_ << ": " << ec.message();
    fs::remove(tmp_file, ec);
    return false;
  }
  return true;
}

ModelState ModelStateStore::get_state(const std::string &id) const {
  std::shared_lock lock(states_mutex_);
  auto it = states_.find(id);
  if (it == states_.end()) {
    return {};
  }
  return it->second;
}

std::error_code ModelStateStore::set_state(const std::string &id,
                                           const ModelState &state) {
  std::unique_lock lock(states_mutex_);
  ModelStatus current = ModelStatus::not_downloaded;
  auto it = states_.find(id);
  if (it != states_.end()) {
    current = it->second.status;
  }
  if (!transition_allowed(current, state.status)) {
    BOOST_LOG_TRIVIAL(warning) << "model_state:: rejecting " << id << " "
                               << to_string(current) << " -> "
                               << to_string(state.status);
    return PipelineErrc::invalid_transition;
  }

  auto next = states_;
  auto &entry = next[id];
  entry.status = state.status;
  entry.reason = state.status == ModelStatus::failed ? state.reason : "";
  if (state.status == ModelStatus::ready) {
    entry.last_warmed =
        state.last_warmed.empty() ? iso8601_now() : state.last_warmed;
  }

  /* memory state is authoritative even if the disk refuses the write */
  if (!persist(next)) {
    BOOST_LOG_TRIVIAL(warning) << "model_state:: state of " << id
                               << " kept in memory only";
  }
  states_.swap(next);
  BOOST_LOG_TRIVIAL(debug) << "model_state:: " << id << " "
                           << to_string(current) << " -> "
                           << to_string(state.status);
  return {};
}

bool ModelStateStore::is_ready(const std::string &id) const {
  return get_state(id) == ModelStatus::ready;
}

bool ModelStateStore::is_any_warming() const {
  std::shared_lock lock(states_mutex_);
  for (const auto &[id, state] : states_) {
    if (state == ModelStatus::warming) {
      return true;
    }
  }
  return false;
}

std::vector<std::string> ModelStateStore::warming_models() const {
  std::vector<std::string> ids;
  std::shared_lock lock(states_mutex_);
  for (const auto &[id, state] : states_) {
    if (state == ModelStatus::warming) {
      ids.push_back(id);
    }
  }
  return ids;
}

std::map<std::string, ModelState> ModelStateStore::list() const {
  std::shared_lock lock(states_mutex_);
  return states_;
}

void ModelStateStore::mark_downloaded(const std::string &id, bool has_accel) {
  if (!has_accel || get_state(id) != ModelStatus::not_downloaded) {
    return;
  }
  BOOST_LOG_TRIVIAL(info) << "model_state:: accelerated variant of " << id
                          << " downloaded";
  if (auto ec = set_state(id, {ModelStatus::downloaded, {}, {}})) {
    BOOST_LOG_TRIVIAL(warning) << "model_state:: cannot mark " << id
                               << " downloaded: " << ec.message();
  }
}

bool ModelStateStore::try_begin_warm(const std::string &id) {
  std::lock_guard<std::mutex> lock(warm_mutex_);
  return warming_.insert(id).second;
}

void ModelStateStore::end_warm(const std::string &id) {
  std::lock_guard<std::mutex> lock(warm_mutex_);
  warming_.erase(id);
}

std::error_code ModelStateStore::warm_one(const ModelDescriptor &model,
                                          bool &warmed) {
  warmed = false;
  if (!try_begin_warm(model.id)) {
    BOOST_LOG_TRIVIAL(info) << "model_state:: " << model.id
                            << " already warming, skipping";
    return {};
  }
  struct WarmGuard {
    ModelStateStore &store;
    const std::string &id;
    ~WarmGuard() { store.end_warm(id); }
  } guard{*this, model.id};

  /* another caller may have finished while we waited for the lock */
  if (is_ready(model.id)) {
    return {};
  }

  if (auto ec = set_state(model.id, {ModelStatus::warming, {}, {}})) {
    return ec;
  }

  TimeElapsed te("model_state:: warm-up of " + model.id);
  std::string reason;
  bool ok{false};
  if (!warmer_) {
    reason = "no warmer configured";
  } else {
    try {
      ok = warmer_(model, reason);
    } catch (const std::exception &e) {
      reason = e.what();
    }
  }

  if (!ok) {
    BOOST_LOG_TRIVIAL(warning) << "model_state:: warm-up of " << model.id
                               << " failed: " << reason;
    if (auto ec = set_state(model.id, ModelState::failed(reason))) {
      return ec;
    }
    return PipelineErrc::warm_up_failed;
  }

  BOOST_LOG_TRIVIAL(info) << "model_state:: " << model.id
                          << " acceleration ready";
  if (auto ec = set_state(model.id, {ModelStatus::ready, {}, {}})) {
    return ec;
  }
  warmed = true;
  return {};
}

size_t ModelStateStore::warm_models(bool retry_failed) {
  BOOST_LOG_TRIVIAL(info) << "model_state:: warming models in "
                          << models_dir_;
  size_t warmed{0};
  size_t found{0};
  for (const auto &model : discover_warmable_models()) {
    found++;
    mark_downloaded(model.id, model.has_accel);

    auto state = get_state(model.id);
    if (state == ModelStatus::ready) {
      BOOST_LOG_TRIVIAL(info) << "model_state:: " << model.id
                              << " already ready, skipping warm-up";
      continue;
    }
    if (state == ModelStatus::failed && !retry_failed) {
      BOOST_LOG_TRIVIAL(info) << "model_state:: " << model.id
                              << " failed before (" << state.reason
                              << "), retry required";
      continue;
    }
    bool done{false};
    if (auto ec = warm_one(model, done)) {
      BOOST_LOG_TRIVIAL(debug) << "model_state:: " << model.id << ": "
                               << ec.message();
    } else if (done) {
      warmed++;
    }
  }

  if (found == 0) {
    BOOST_LOG_TRIVIAL(warning) << "model_state:: no models with an "
                               << "accelerated variant found";
  }
  return warmed;
}

std::future<size_t> ModelStateStore::warm_models_async(bool retry_failed) {
  return std::async(std::launch::async,
                    [this, retry_failed]() { return warm_models(retry_failed); });
}

std::error_code ModelStateStore::retry(const std::string &id) {
  if (get_state(id) != ModelStatus::failed) {
    return PipelineErrc::invalid_transition;
  }
  auto path = models_dir_ / ("ggml-" + id + ".bin");
  auto model = describe_model(path);
  if (!model || !model->has_accel) {
    BOOST_LOG_TRIVIAL(warning) << "model_state:: cannot retry " << id
                               << ", model files missing";
    return PipelineErrc::model_not_found;
  }
  bool warmed{false};
  return warm_one(*model, warmed);
}
