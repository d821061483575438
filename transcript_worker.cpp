//
//  transcript_worker.cpp
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

#include "log.hpp"
#include "strategy.hpp"
#include "transcript_worker.hpp"
#include "utils.hpp"
#include "wire.hpp"

using namespace std::chrono_literals;

bool TranscriptWorker::start() {
  if (running_) {
    return true;
  }
  BOOST_LOG_TRIVIAL(info) << "worker:: serving with "
                          << engine_->get_model_id();
  running_ = true;
  res_ = std::async(std::launch::async, &TranscriptWorker::serve, this);
  return true;
}

void TranscriptWorker::stop() {
  if (!running_) {
    return;
  }
  running_ = false;
  res_.get();
  BOOST_LOG_TRIVIAL(info) << "worker:: stopped after " << served_
                          << " requests";
}

void TranscriptWorker::serve() {
  while (running_) {
    std::vector<uint8_t> bytes;
    if (!queue_->pull(bytes, 100ms)) {
      continue;
    }
    if (!handle(bytes)) {
      BOOST_LOG_TRIVIAL(warning) << "worker:: dropping malformed request";
    }
  }
}

bool TranscriptWorker::handle(const std::vector<uint8_t> &bytes) {
  AudioChunk request;
  if (!decode(bytes, request)) {
    return false;
  }
  BOOST_LOG_TRIVIAL(debug) << "worker:: request " << request.id << " with "
                           << request.samples.size() << " samples";

  auto fail = [&](const std::string &code, const std::string &message) {
    TranscriptionError error;
    error.id = request.id;
    error.code = code;
    error.message = message;
    error.timestamp = epoch_seconds_now();
    return queue_->push(encode(error));
  };

  if (request.channels == 0 || request.sample_rate != 16000) {
    return fail("unsupported_format",
                "expected 16000 Hz audio, got " +
                    std::to_string(request.sample_rate) + " Hz");
  }

  auto mono = downmix(request.samples, request.channels);
  Transcript reply;
  reply.id = request.id;
  reply.model = engine_->get_model_id();
  TimeElapsed te("worker:: request " + to_string(request.id));
  if (!engine_->transcribe(mono.data(), mono.size(), reply.text)) {
    return fail("transcription_failed", "engine could not transcribe");
  }
  reply.text = join_texts({reply.text});
  reply.confidence = 1.0f;
  reply.processing_time_ms = te.elapsed();
  reply.timestamp = epoch_seconds_now();
  ++served_;
  return queue_->push(encode(reply));
}
