//
//  wav.hpp
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

#ifndef _WAV_HPP_
#define _WAV_HPP_

#include <cstdint>
#include <fstream>
#include <string>
#include <vector>

constexpr size_t wav_header_size = 44;

/* writes 32 bit float WAV, header is patched on every flush so the file
   on disk is always a readable WAV */
class WavWriter {
public:
  WavWriter() = default;
  WavWriter(const WavWriter &) = delete;
  WavWriter &operator=(const WavWriter &) = delete;
  ~WavWriter();

  bool open(const std::string &path, uint32_t sample_rate, uint16_t channels);
  bool write(const float *samples, size_t count);
  bool flush();
  bool close();

  bool is_open() const { return file_.is_open(); }
  uint64_t get_data_bytes() const { return data_bytes_; }
  uint64_t get_file_bytes() const { return wav_header_size + data_bytes_; }
  const std::string &get_path() const { return path_; }

private:
  bool write_header();

  std::ofstream file_;
  std::string path_;
  uint32_t sample_rate_{16000};
  uint16_t channels_{1};
  uint64_t data_bytes_{0};
};

struct WavData {
  std::vector<float> samples;
  uint32_t sample_rate{0};
  uint16_t channels{0};
};

/* reads 16/24/32 bit PCM or 32 bit float WAV into interleaved floats */
bool read_wav(const std::string &path, WavData &out);

/* averages interleaved channels into one */
std::vector<float> downmix(const std::vector<float> &interleaved,
                           uint16_t channels);

#endif
