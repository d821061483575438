//
//  transcript_queue.cpp
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

#include "transcript_queue.hpp"

void ByteChannel::send(std::vector<uint8_t> bytes) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    items_.push_back(std::move(bytes));
  }
  cond_.notify_one();
}

bool ByteChannel::receive(std::vector<uint8_t> &bytes,
                          std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  if (!cond_.wait_for(lock, timeout, [this] { return !items_.empty(); })) {
    return false;
  }
  bytes = std::move(items_.front());
  items_.pop_front();
  return true;
}

bool InProcessQueue::push(std::vector<uint8_t> bytes) {
  out_->send(std::move(bytes));
  return true;
}

bool InProcessQueue::pull(std::vector<uint8_t> &bytes,
                          std::chrono::milliseconds timeout) {
  return in_->receive(bytes, timeout);
}

std::pair<std::shared_ptr<InProcessQueue>, std::shared_ptr<InProcessQueue>>
make_queue_pair() {
  auto requests = std::make_shared<ByteChannel>();
  auto replies = std::make_shared<ByteChannel>();
  return {std::make_shared<InProcessQueue>(requests, replies),
          std::make_shared<InProcessQueue>(replies, requests)};
}
