//
//  engine.hpp
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

#ifndef _ENGINE_HPP_
#define _ENGINE_HPP_

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "model_registry.hpp"

/* Opaque inference engine for one model. Implementations serialize
   concurrent transcribe() calls themselves. */
class Engine {
public:
  virtual ~Engine() = default;

  /* mono float samples at 16 kHz */
  virtual bool transcribe(const float *samples, size_t count,
                          std::string &text) = 0;

  /* compiles the accelerated encoder, slow, called once per engine */
  virtual bool init_acceleration(std::string &reason) = 0;

  virtual const std::string &get_model_id() const = 0;
};

/* loads an engine, nullptr on failure */
using EngineFactory =
    std::function<std::shared_ptr<Engine>(const ModelDescriptor &)>;

#endif
