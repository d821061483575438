//
//  wire.cpp
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

#include <boost/endian/conversion.hpp>

#include <algorithm>
#include <chrono>
#include <cstring>

#include "wire.hpp"

namespace {

class Writer {
public:
  explicit Writer(MessageTag tag) { buf_.push_back(static_cast<uint8_t>(tag)); }

  void put_id(const boost::uuids::uuid &id) {
    buf_.insert(buf_.end(), id.begin(), id.end());
  }

  template <typename T> void put(T value) {
    boost::endian::native_to_little_inplace(value);
    auto p = reinterpret_cast<const uint8_t *>(&value);
    buf_.insert(buf_.end(), p, p + sizeof(T));
  }

  void put(float value) {
    uint32_t bits;
    std::memcpy(&bits, &value, sizeof(bits));
    put(bits);
  }

  void put(double value) {
    uint64_t bits;
    std::memcpy(&bits, &value, sizeof(bits));
    put(bits);
  }

  void put(const std::string &value) {
    put(static_cast<uint32_t>(value.size()));
    buf_.insert(buf_.end(), value.begin(), value.end());
  }

  void put(const std::vector<float> &values) {
    put(static_cast<uint32_t>(values.size()));
    for (auto v : values) {
      put(v);
    }
  }

  std::vector<uint8_t> take() { return std::move(buf_); }

private:
  std::vector<uint8_t> buf_;
};

class Reader {
public:
  Reader(const std::vector<uint8_t> &buf, MessageTag tag) : buf_(buf) {
    ok_ = !buf_.empty() && buf_[0] == static_cast<uint8_t>(tag);
    pos_ = 1;
  }

  void get_id(boost::uuids::uuid &id) {
    if (!need(id.size())) {
      return;
    }
    std::copy_n(buf_.begin() + pos_, id.size(), id.begin());
    pos_ += id.size();
  }

  template <typename T> void get(T &value) {
    if (!need(sizeof(T))) {
      return;
    }
    std::memcpy(&value, buf_.data() + pos_, sizeof(T));
    boost::endian::little_to_native_inplace(value);
    pos_ += sizeof(T);
  }

  void get(float &value) {
    uint32_t bits{0};
    get(bits);
    std::memcpy(&value, &bits, sizeof(value));
  }

  void get(double &value) {
    uint64_t bits{0};
    get(bits);
    std::memcpy(&value, &bits, sizeof(value));
  }

  void get(std::string &value) {
    uint32_t size{0};
    get(size);
    if (!need(size)) {
      return;
    }
    value.assign(buf_.begin() + pos_, buf_.begin() + pos_ + size);
    pos_ += size;
  }

  void get(std::vector<float> &values) {
    uint32_t count{0};
    get(count);
    if (!need(static_cast<size_t>(count) * sizeof(float))) {
      return;
    }
    values.resize(count);
    for (auto &v : values) {
      get(v);
    }
  }

  /* everything read and nothing left over */
  bool done() const { return ok_ && pos_ == buf_.size(); }

private:
  bool need(size_t n) {
    if (ok_ && buf_.size() - pos_ < n) {
      ok_ = false;
    }
    return ok_;
  }

  const std::vector<uint8_t> &buf_;
  size_t pos_{0};
  bool ok_{false};
};

} // namespace

std::vector<uint8_t> encode(const AudioChunk &msg) {
  Writer w(MessageTag::audio_chunk);
  w.put_id(msg.id);
  w.put(msg.samples);
  w.put(msg.sample_rate);
  w.put(msg.channels);
  w.put(msg.timestamp);
  return w.take();
}

std::vector<uint8_t> encode(const Transcript &msg) {
  Writer w(MessageTag::transcript);
  w.put_id(msg.id);
  w.put(msg.text);
  w.put(msg.confidence);
  w.put(msg.timestamp);
  w.put(msg.model);
  w.put(msg.processing_time_ms);
  return w.take();
}

std::vector<uint8_t> encode(const TranscriptionError &msg) {
  Writer w(MessageTag::transcription_error);
  w.put_id(msg.id);
  w.put(msg.message);
  w.put(msg.code);
  w.put(msg.timestamp);
  return w.take();
}

bool peek_tag(const std::vector<uint8_t> &bytes, MessageTag &tag) {
  if (bytes.empty() || bytes[0] < 1 || bytes[0] > 3) {
    return false;
  }
  tag = static_cast<MessageTag>(bytes[0]);
  return true;
}

bool decode(const std::vector<uint8_t> &bytes, AudioChunk &msg) {
  Reader r(bytes, MessageTag::audio_chunk);
  r.get_id(msg.id);
  r.get(msg.samples);
  r.get(msg.sample_rate);
  r.get(msg.channels);
  r.get(msg.timestamp);
  return r.done();
}

bool decode(const std::vector<uint8_t> &bytes, Transcript &msg) {
  Reader r(bytes, MessageTag::transcript);
  r.get_id(msg.id);
  r.get(msg.text);
  r.get(msg.confidence);
  r.get(msg.timestamp);
  r.get(msg.model);
  r.get(msg.processing_time_ms);
  return r.done();
}

bool decode(const std::vector<uint8_t> &bytes, TranscriptionError &msg) {
  Reader r(bytes, MessageTag::transcription_error);
  r.get_id(msg.id);
  r.get(msg.message);
  r.get(msg.code);
  r.get(msg.timestamp);
  return r.done();
}

double epoch_seconds_now() {
  using namespace std::chrono;
  return duration_cast<duration<double>>(
             system_clock::now().time_since_epoch())
      .count();
}
