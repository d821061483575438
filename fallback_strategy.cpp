//
//  fallback_strategy.cpp
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
#include "fallback_strategy.hpp"
#include "log.hpp"
#include "utils.hpp"

std::error_code FallbackStrategy::on_finish(TranscriptionResult &result) {
  std::vector<float> mono;
  if (auto ec = load_recording(mono)) {
    BOOST_LOG_TRIVIAL(error) << "fallback:: cannot read back " << output_path_;
    return ec;
  }

  std::string text;
  {
    TimeElapsed te("fallback:: " + engine_->get_model_id() + " inference");
    if (!engine_->transcribe(mono.data(), mono.size(), text)) {
      BOOST_LOG_TRIVIAL(error) << "fallback:: inference failed on "
                               << mono.size() << " samples";
      return PipelineErrc::transcription_failed;
    }
  }
  result.text = join_texts({text});
  result.chunks_processed = 0;
  return {};
}
