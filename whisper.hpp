//
//  whisper.hpp
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

#ifndef _WHISPER_HPP_
#define _WHISPER_HPP_

#include <mutex>
#include <sstream>
#include <whisper.h>

#include "config.hpp"
#include "engine.hpp"

class WhisperEngine : public Engine {
public:
  WhisperEngine(const Config &config, const ModelDescriptor &model)
      : config_(config), model_(model){};
  WhisperEngine(const WhisperEngine &) = delete;
  ~WhisperEngine() override;

  bool init();
  bool transcribe(const float *samples, size_t count,
                  std::string &text) override;
  bool init_acceleration(std::string &reason) override;
  const std::string &get_model_id() const override { return model_.id; }

private:
  const Config &config_;
  ModelDescriptor model_;
  std::mutex ctx_mutex_;
  struct whisper_context *ctx_{0};
};

/* EngineFactory backed by whisper.cpp */
EngineFactory whisper_engine_factory(const Config &config);

#endif
