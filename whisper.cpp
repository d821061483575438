//
//  whisper.cpp
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

#include <boost/algorithm/string.hpp>

#include "log.hpp"
#include "utils.hpp"
#include "whisper.hpp"

WhisperEngine::~WhisperEngine() {
  if (ctx_ != nullptr) {
    whisper_free(ctx_);
    ctx_ = nullptr;
  }
}

bool WhisperEngine::init() {
  TimeElapsed te("whisper:: loading " + model_.id);
  struct whisper_context_params cparams = whisper_context_default_params();
  /* acceleration goes through the openvino encoder only */
  cparams.use_gpu = false;

  ctx_ = whisper_init_from_file_with_params(model_.path.c_str(), cparams);
  if (ctx_ == nullptr) {
    BOOST_LOG_TRIVIAL(error) << "whisper:: failed to initialize context from "
                             << model_.path;
    return false;
  }
  BOOST_LOG_TRIVIAL(info) << "whisper:: model " << model_.id << " loaded, "
                          << "openvino encoder "
                          << (model_.has_accel ? "available" : "not found");
  return true;
}

bool WhisperEngine::init_acceleration(std::string &reason) {
  if (!model_.has_accel) {
    reason = "no openvino encoder for " + model_.id;
    return false;
  }

  std::lock_guard<std::mutex> lock(ctx_mutex_);
  if (ctx_ == nullptr) {
    reason = "context not initialized";
    return false;
  }
  TimeElapsed te("whisper:: openvino encoder compile for " + model_.id);
  BOOST_LOG_TRIVIAL(info) << "whisper:: compiling openvino encoder on "
                          << config_.get_openvino_device()
                          << ", first compile can take minutes";
  auto cache_dir = model_.path.parent_path().string();
  if (whisper_ctx_init_openvino_encoder(ctx_, model_.accel_path.c_str(),
                                        config_.get_openvino_device().c_str(),
                                        cache_dir.c_str()) != 0) {
    reason = "openvino encoder init failed on device " +
             config_.get_openvino_device();
    return false;
  }
  return true;
}

bool WhisperEngine::transcribe(const float *samples, size_t count,
                               std::string &text) {
  std::lock_guard<std::mutex> lock(ctx_mutex_);
  if (ctx_ == nullptr) {
    BOOST_LOG_TRIVIAL(error) << "whisper:: context not initialized";
    return false;
  }

  whisper_full_params wparams =
      whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
  wparams.print_progress = false;
  wparams.print_special = false;
  wparams.print_realtime = false;
  wparams.print_timestamps = false;
  wparams.translate = false;
  wparams.no_context = true;
  wparams.single_segment = false;
  wparams.language = config_.get_language().c_str();
  wparams.n_threads = config_.get_threads();
  /* stricter decoding, fewer hallucinations at window boundaries */
  wparams.suppress_blank = true;
  wparams.temperature = 0.0f;
  wparams.temperature_inc = 0.2f;
  wparams.entropy_thold = 2.4f;
  wparams.logprob_thold = -1.0f;
  wparams.no_speech_thold = 0.6f;

  BOOST_LOG_TRIVIAL(debug) << "whisper:: " << model_.id << " transcribing "
                           << count << " samples";
  if (whisper_full(ctx_, wparams, samples, static_cast<int>(count)) != 0) {
    BOOST_LOG_TRIVIAL(error) << "whisper:: failed to process audio";
    return false;
  }

  std::stringstream output_text;
  const int n_segments = whisper_full_n_segments(ctx_);
  for (int i = 0; i < n_segments; ++i) {
    const char *segment = whisper_full_get_segment_text(ctx_, i);
    output_text << segment << ' ';
  }
  text = boost::trim_copy(output_text.str());
  return true;
}

EngineFactory whisper_engine_factory(const Config &config) {
  return [&config](const ModelDescriptor &model) -> std::shared_ptr<Engine> {
    auto engine = std::make_shared<WhisperEngine>(config, model);
    if (!engine->init()) {
      return nullptr;
    }
    return engine;
  };
}
