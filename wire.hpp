//
//  wire.hpp
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

#ifndef _WIRE_HPP_
#define _WIRE_HPP_

#include <boost/uuid/uuid.hpp>

#include <cstdint>
#include <string>
#include <vector>

/* Messages exchanged with an external transcription process.
   Little endian: u8 tag, 16 byte id, then the fields in declaration order.
   Strings and sample arrays carry a u32 count prefix. */
enum class MessageTag : uint8_t {
  audio_chunk = 1,
  transcript = 2,
  transcription_error = 3
};

struct AudioChunk {
  boost::uuids::uuid id{};
  std::vector<float> samples;
  uint32_t sample_rate{16000};
  uint16_t channels{1};
  double timestamp{0};  // seconds since epoch
};

struct Transcript {
  boost::uuids::uuid id{};
  std::string text;
  float confidence{0};
  double timestamp{0};
  std::string model;
  uint64_t processing_time_ms{0};
};

struct TranscriptionError {
  boost::uuids::uuid id{};
  std::string message;
  std::string code;
  double timestamp{0};
};

std::vector<uint8_t> encode(const AudioChunk &msg);
std::vector<uint8_t> encode(const Transcript &msg);
std::vector<uint8_t> encode(const TranscriptionError &msg);

/* tag of an encoded message, false when empty or unknown */
bool peek_tag(const std::vector<uint8_t> &bytes, MessageTag &tag);

/* false on a wrong tag, truncated input or trailing bytes */
bool decode(const std::vector<uint8_t> &bytes, AudioChunk &msg);
bool decode(const std::vector<uint8_t> &bytes, Transcript &msg);
bool decode(const std::vector<uint8_t> &bytes, TranscriptionError &msg);

double epoch_seconds_now();

#endif
