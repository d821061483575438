//
//  config.hpp
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

#ifndef _CONFIG_HPP_
#define _CONFIG_HPP_

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

/* strategy override names accepted by --strategy */
enum class StrategyKind { progressive, fallback, external };

const char *to_string(StrategyKind kind);
std::optional<StrategyKind> strategy_kind_from_string(const std::string &name);

/* per session settings handed to the selector and the strategies */
struct StrategyConfig {
  std::optional<StrategyKind> forced_strategy;
  bool enable_chunking{true};
  uint16_t chunking_threshold_secs{3};
  uint16_t chunk_duration_secs{5};
  uint16_t refinement_chunk_secs{10};
  uint32_t refinement_timeout_ms{5000};
  bool forced_fallback{false};
  bool external_enabled{false};
  uint32_t external_timeout_ms{30000};
  uint32_t staging_min_bytes{44};
  uint32_t sample_rate{16000};
  uint8_t channels{1};
  std::string models_dir{"./models"};
};

class Config {
 public:
  uint8_t get_channels() const { return channels_; }
  uint32_t get_sample_rate() const { return sample_rate_; }
  const std::string& get_models_dir() const { return models_dir_; }
  const std::string& get_state_dir() const { return state_dir_; }
  const std::string& get_temp_dir() const { return temp_dir_; }
  const std::string& get_language() const { return language_; }
  const std::string& get_openvino_device() const { return openvino_device_; }
  int get_log_severity() const { return log_severity_; };
  uint8_t get_threads() const { return threads_; };
  uint8_t get_workers() const { return workers_; };
  const std::string& get_strategy() const { return strategy_; };
  bool get_enable_chunking() const { return enable_chunking_; };
  uint16_t get_chunking_threshold() const { return chunking_threshold_; };
  uint16_t get_chunk_duration() const { return chunk_duration_; };
  uint16_t get_refinement_chunk() const { return refinement_chunk_; };
  uint32_t get_refinement_timeout() const { return refinement_timeout_; };
  bool get_forced_fallback() const { return forced_fallback_; };
  uint32_t get_staging_min_bytes() const { return staging_min_bytes_; };
  bool get_external_enabled() const { return external_enabled_; };
  uint32_t get_external_timeout() const { return external_timeout_; };

  void set_channels(uint8_t channels) { channels_ = channels; }
  void set_sample_rate(uint32_t sample_rate) { sample_rate_ = sample_rate; };
  void set_models_dir(const std::string& models_dir) {
    models_dir_ = models_dir;
  }
  void set_state_dir(const std::string& state_dir) { state_dir_ = state_dir; }
  void set_temp_dir(const std::string& temp_dir) { temp_dir_ = temp_dir; }
  void set_language(const std::string& language) { language_ = language; }
  void set_openvino_device(const std::string& openvino_device) {
    openvino_device_ = openvino_device;
  }
  void set_log_severity(int log_severity) { log_severity_ = log_severity; };
  void set_threads(uint8_t threads) { threads_ = threads; };
  void set_workers(uint8_t workers) { workers_ = workers; };
  void set_strategy(const std::string& strategy) { strategy_ = strategy; };
  void set_enable_chunking(bool enable_chunking) {
    enable_chunking_ = enable_chunking;
  };
  void set_chunking_threshold(uint16_t chunking_threshold) {
    chunking_threshold_ = chunking_threshold;
  };
  void set_chunk_duration(uint16_t chunk_duration) {
    chunk_duration_ = chunk_duration;
  };
  void set_refinement_chunk(uint16_t refinement_chunk) {
    refinement_chunk_ = refinement_chunk;
  };
  void set_refinement_timeout(uint32_t refinement_timeout) {
    refinement_timeout_ = refinement_timeout;
  };
  void set_forced_fallback(bool forced_fallback) {
    forced_fallback_ = forced_fallback;
  };
  void set_staging_min_bytes(uint32_t staging_min_bytes) {
    staging_min_bytes_ = staging_min_bytes;
  };
  void set_external_enabled(bool external_enabled) {
    external_enabled_ = external_enabled;
  };
  void set_external_timeout(uint32_t external_timeout) {
    external_timeout_ = external_timeout;
  };

  StrategyConfig get_strategy_config() const {
    StrategyConfig sc;
    sc.forced_strategy = strategy_kind_from_string(strategy_);
    sc.enable_chunking = enable_chunking_;
    sc.chunking_threshold_secs = chunking_threshold_;
    sc.chunk_duration_secs = chunk_duration_;
    sc.refinement_chunk_secs = refinement_chunk_;
    sc.refinement_timeout_ms = refinement_timeout_;
    sc.forced_fallback = forced_fallback_;
    sc.external_enabled = external_enabled_;
    sc.external_timeout_ms = external_timeout_;
    sc.staging_min_bytes = staging_min_bytes_;
    sc.sample_rate = sample_rate_;
    sc.channels = channels_;
    sc.models_dir = models_dir_;
    return sc;
  }

 private:
  uint8_t channels_{1};
  uint32_t sample_rate_{16000};
  std::string models_dir_{"./models"};
  std::string state_dir_{"."};
  std::string temp_dir_{"/tmp"};
  std::string language_{"en"};
  std::string openvino_device_{"CPU"};
  int log_severity_{2};
  uint8_t threads_{4};
  uint8_t workers_{2};
  std::string strategy_{"auto"};
  bool enable_chunking_{true};
  uint16_t chunking_threshold_{3};
  uint16_t chunk_duration_{5};
  uint16_t refinement_chunk_{10};
  uint32_t refinement_timeout_{5000};
  bool forced_fallback_{false};
  uint32_t staging_min_bytes_{44};
  bool external_enabled_{false};
  uint32_t external_timeout_{30000};
};

#endif
