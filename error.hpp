//
//  error.hpp
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

#ifndef _ERROR_HPP_
#define _ERROR_HPP_

#include <string>
#include <system_error>

enum class PipelineErrc {
  model_not_found = 1,
  warm_up_failed,
  cache_creation_failed,
  empty_recording,
  staging_io_error,
  strategy_mismatch,
  refinement_timeout,  // never fatal, reported through logs only
  invalid_state,
  invalid_transition,
  transcription_failed,
  cancelled,
  external_timeout,
  external_error,
};

const std::error_category &pipeline_category();

std::error_code make_error_code(PipelineErrc e);

namespace std {
template <> struct is_error_code_enum<PipelineErrc> : true_type {};
} // namespace std

#endif
