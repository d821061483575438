//
//  error.cpp
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

#include "error.hpp"

namespace {

class PipelineCategory : public std::error_category {
public:
  const char *name() const noexcept override { return "voxpipe"; }

  std::string message(int ev) const override {
    switch (static_cast<PipelineErrc>(ev)) {
    case PipelineErrc::model_not_found:
      return "model not found";
    case PipelineErrc::warm_up_failed:
      return "acceleration warm-up failed";
    case PipelineErrc::cache_creation_failed:
      return "cannot create transcriber";
    case PipelineErrc::empty_recording:
      return "recording is empty";
    case PipelineErrc::staging_io_error:
      return "staging file I/O error";
    case PipelineErrc::strategy_mismatch:
      return "forced strategy cannot be satisfied";
    case PipelineErrc::refinement_timeout:
      return "refinement pass timed out";
    case PipelineErrc::invalid_state:
      return "operation not allowed in current state";
    case PipelineErrc::invalid_transition:
      return "model state transition not allowed";
    case PipelineErrc::transcription_failed:
      return "transcription failed";
    case PipelineErrc::cancelled:
      return "recording cancelled";
    case PipelineErrc::external_timeout:
      return "external service did not answer in time";
    case PipelineErrc::external_error:
      return "external service returned an error";
    }
    return "unknown error";
  }
};

} // namespace

const std::error_category &pipeline_category() {
  static PipelineCategory category;
  return category;
}

std::error_code make_error_code(PipelineErrc e) {
  return {static_cast<int>(e), pipeline_category()};
}
