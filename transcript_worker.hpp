//
//  transcript_worker.hpp
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

#ifndef _TRANSCRIPT_WORKER_HPP_
#define _TRANSCRIPT_WORKER_HPP_

#include <atomic>
#include <future>
#include <memory>

#include "engine.hpp"
#include "transcript_queue.hpp"

/* Serving end of the external backend: pulls AudioChunk requests, answers
   with a Transcript or a TranscriptionError carrying the request id. */
class TranscriptWorker {
public:
  TranscriptWorker(std::shared_ptr<TranscriptQueue> queue,
                   std::shared_ptr<Engine> engine)
      : queue_(std::move(queue)), engine_(std::move(engine)){};
  TranscriptWorker(const TranscriptWorker &) = delete;
  ~TranscriptWorker() { stop(); }

  bool start();
  void stop();
  size_t get_served() const { return served_; }

private:
  void serve();
  bool handle(const std::vector<uint8_t> &bytes);

  std::shared_ptr<TranscriptQueue> queue_;
  std::shared_ptr<Engine> engine_;
  std::future<void> res_;
  std::atomic_bool running_{false};
  std::atomic<size_t> served_{0};
};

#endif
