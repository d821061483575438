//
//  transcript_queue.hpp
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

#ifndef _TRANSCRIPT_QUEUE_HPP_
#define _TRANSCRIPT_QUEUE_HPP_

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

/* Byte queue towards an external transcription process. push() sends one
   encoded request, pull() waits for one encoded reply. */
class TranscriptQueue {
public:
  virtual ~TranscriptQueue() = default;
  virtual bool push(std::vector<uint8_t> bytes) = 0;
  /* false when nothing arrived before the timeout */
  virtual bool pull(std::vector<uint8_t> &bytes,
                    std::chrono::milliseconds timeout) = 0;
};

/* one direction of an in-process connection */
class ByteChannel {
public:
  void send(std::vector<uint8_t> bytes);
  bool receive(std::vector<uint8_t> &bytes,
               std::chrono::milliseconds timeout);

private:
  std::mutex mutex_;
  std::condition_variable cond_;
  std::deque<std::vector<uint8_t>> items_;
};

/* one end of a loopback connection */
class InProcessQueue : public TranscriptQueue {
public:
  InProcessQueue(std::shared_ptr<ByteChannel> out,
                 std::shared_ptr<ByteChannel> in)
      : out_(std::move(out)), in_(std::move(in)){};

  bool push(std::vector<uint8_t> bytes) override;
  bool pull(std::vector<uint8_t> &bytes,
            std::chrono::milliseconds timeout) override;

private:
  std::shared_ptr<ByteChannel> out_;
  std::shared_ptr<ByteChannel> in_;
};

/* client end first, worker end second */
std::pair<std::shared_ptr<InProcessQueue>, std::shared_ptr<InProcessQueue>>
make_queue_pair();

#endif
