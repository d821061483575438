//
//  external_strategy.cpp
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

#include <boost/uuid/uuid_io.hpp>

#include <algorithm>
#include <chrono>

#include "error.hpp"
#include "external_strategy.hpp"
#include "log.hpp"
#include "utils.hpp"
#include "wire.hpp"

using namespace std::chrono;

/* pull() granularity, bounds how long a cancel goes unnoticed */
static constexpr milliseconds poll_interval{100};

std::error_code ExternalStrategy::on_finish(TranscriptionResult &result) {
  AudioChunk request;
  request.id = new_uuid();
  request.sample_rate = config_.sample_rate;
  request.channels = 1;
  request.timestamp = epoch_seconds_now();
  if (auto ec = load_recording(request.samples)) {
    return ec;
  }

  BOOST_LOG_TRIVIAL(info) << "external:: sending " << request.samples.size()
                          << " samples as " << request.id;
  if (!queue_->push(encode(request))) {
    BOOST_LOG_TRIVIAL(error) << "external:: queue refused " << request.id;
    return PipelineErrc::external_error;
  }

  auto deadline = steady_clock::now() + milliseconds(config_.external_timeout_ms);
  while (!cancelled_) {
    auto now = steady_clock::now();
    if (now >= deadline) {
      break;
    }
    auto wait = std::min(poll_interval,
                         duration_cast<milliseconds>(deadline - now));
    std::vector<uint8_t> reply;
    if (!queue_->pull(reply, wait)) {
      continue;
    }

    MessageTag tag;
    if (!peek_tag(reply, tag)) {
      BOOST_LOG_TRIVIAL(warning) << "external:: dropping malformed reply";
      continue;
    }
    if (tag == MessageTag::transcript) {
      Transcript transcript;
      if (!decode(reply, transcript)) {
        BOOST_LOG_TRIVIAL(warning) << "external:: dropping bad transcript";
        continue;
      }
      if (transcript.id != request.id) {
        BOOST_LOG_TRIVIAL(debug) << "external:: dropping reply for "
                                 << transcript.id;
        continue;
      }
      BOOST_LOG_TRIVIAL(info) << "external:: transcript from "
                              << (transcript.model.empty() ? "worker"
                                                           : transcript.model)
                              << " in " << transcript.processing_time_ms
                              << " ms";
      result.text = join_texts({transcript.text});
      result.chunks_processed = 0;
      return {};
    }
    if (tag == MessageTag::transcription_error) {
      TranscriptionError error;
      if (!decode(reply, error) || error.id != request.id) {
        continue;
      }
      BOOST_LOG_TRIVIAL(error) << "external:: worker failed " << request.id
                               << " (" << error.code << "): " << error.message;
      return PipelineErrc::external_error;
    }
    BOOST_LOG_TRIVIAL(warning) << "external:: unexpected message tag "
                               << static_cast<int>(tag);
  }

  if (cancelled_) {
    return PipelineErrc::cancelled;
  }
  BOOST_LOG_TRIVIAL(error) << "external:: no reply for " << request.id
                           << " within " << config_.external_timeout_ms
                           << " ms";
  return PipelineErrc::external_timeout;
}
