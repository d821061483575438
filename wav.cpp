//
//  wav.cpp
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

#include <cstring>

#include "log.hpp"
#include "wav.hpp"

namespace {

constexpr uint16_t format_pcm = 1;
constexpr uint16_t format_float = 3;
constexpr uint16_t format_extensible = 0xFFFE;

void put_u16(uint8_t *p, uint16_t v) {
  p[0] = v & 0xff;
  p[1] = (v >> 8) & 0xff;
}

void put_u32(uint8_t *p, uint32_t v) {
  p[0] = v & 0xff;
  p[1] = (v >> 8) & 0xff;
  p[2] = (v >> 16) & 0xff;
  p[3] = (v >> 24) & 0xff;
}

uint16_t get_u16(const uint8_t *p) { return p[0] | (p[1] << 8); }

uint32_t get_u32(const uint8_t *p) {
  return p[0] | (p[1] << 8) | (p[2] << 16) |
         (static_cast<uint32_t>(p[3]) << 24);
}

} // namespace

WavWriter::~WavWriter() {
  if (file_.is_open()) {
    close();
  }
}

bool WavWriter::open(const std::string &path, uint32_t sample_rate,
                     uint16_t channels) {
  if (file_.is_open()) {
    BOOST_LOG_TRIVIAL(error) << "wav:: writer already open on " << path_;
    return false;
  }
  path_ = path;
  sample_rate_ = sample_rate;
  channels_ = channels;
  data_bytes_ = 0;
  file_.open(path, std::ios::binary | std::ios::trunc);
  if (!file_.is_open()) {
    BOOST_LOG_TRIVIAL(error) << "wav:: cannot open " << path;
    return false;
  }
  return write_header();
}

bool WavWriter::write_header() {
  uint8_t header[wav_header_size];
  uint16_t block_align = channels_ * sizeof(float);
  std::memcpy(header, "RIFF", 4);
  put_u32(header + 4, static_cast<uint32_t>(36 + data_bytes_));
  std::memcpy(header + 8, "WAVE", 4);
  std::memcpy(header + 12, "fmt ", 4);
  put_u32(header + 16, 16);
  put_u16(header + 20, format_float);
  put_u16(header + 22, channels_);
  put_u32(header + 24, sample_rate_);
  put_u32(header + 28, sample_rate_ * block_align);
  put_u16(header + 32, block_align);
  put_u16(header + 34, 32);
  std::memcpy(header + 36, "data", 4);
  put_u32(header + 40, static_cast<uint32_t>(data_bytes_));

  auto pos = file_.tellp();
  file_.seekp(0);
  file_.write(reinterpret_cast<const char *>(header), sizeof(header));
  if (pos > 0) {
    file_.seekp(pos);
  }
  return file_.good();
}

bool WavWriter::write(const float *samples, size_t count) {
  if (!file_.is_open()) {
    return false;
  }
  std::vector<uint32_t> le(count);
  for (size_t i = 0; i < count; ++i) {
    std::memcpy(&le[i], &samples[i], sizeof(float));
    boost::endian::native_to_little_inplace(le[i]);
  }
  file_.write(reinterpret_cast<const char *>(le.data()),
              count * sizeof(uint32_t));
  if (!file_.good()) {
    BOOST_LOG_TRIVIAL(error) << "wav:: write failed on " << path_;
    return false;
  }
  data_bytes_ += count * sizeof(float);
  return true;
}

bool WavWriter::flush() {
  if (!file_.is_open()) {
    return false;
  }
  if (!write_header()) {
    BOOST_LOG_TRIVIAL(error) << "wav:: cannot update header of " << path_;
    return false;
  }
  file_.flush();
  return file_.good();
}

bool WavWriter::close() {
  if (!file_.is_open()) {
    return true;
  }
  bool ret = flush();
  file_.close();
  return ret && !file_.fail();
}

bool read_wav(const std::string &path, WavData &out) {
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    BOOST_LOG_TRIVIAL(error) << "wav:: cannot open " << path;
    return false;
  }

  uint8_t riff[12];
  if (!file.read(reinterpret_cast<char *>(riff), sizeof(riff)) ||
      std::memcmp(riff, "RIFF", 4) || std::memcmp(riff + 8, "WAVE", 4)) {
    BOOST_LOG_TRIVIAL(error) << "wav:: not a RIFF/WAVE file " << path;
    return false;
  }

  uint16_t format{0}, bits{0};
  bool have_fmt{false};
  std::vector<uint8_t> data;
  uint8_t chunk[8];
  while (file.read(reinterpret_cast<char *>(chunk), sizeof(chunk))) {
    uint32_t size = get_u32(chunk + 4);
    if (!std::memcmp(chunk, "fmt ", 4)) {
      std::vector<uint8_t> fmt(size);
      if (size < 16 || !file.read(reinterpret_cast<char *>(fmt.data()), size)) {
        BOOST_LOG_TRIVIAL(error) << "wav:: truncated fmt chunk in " << path;
        return false;
      }
      format = get_u16(fmt.data());
      out.channels = get_u16(fmt.data() + 2);
      out.sample_rate = get_u32(fmt.data() + 4);
      bits = get_u16(fmt.data() + 14);
      if (format == format_extensible && size >= 26) {
        format = get_u16(fmt.data() + 24);
      }
      have_fmt = true;
    } else if (!std::memcmp(chunk, "data", 4)) {
      data.resize(size);
      file.read(reinterpret_cast<char *>(data.data()), size);
      /* a file still being written may be shorter than declared */
      data.resize(file.gcount());
      break;
    } else {
      file.seekg(size + (size & 1), std::ios::cur);
    }
  }

  if (!have_fmt || out.channels == 0) {
    BOOST_LOG_TRIVIAL(error) << "wav:: missing fmt chunk in " << path;
    return false;
  }

  auto sample_size = bits / 8;
  if (sample_size == 0) {
    return false;
  }
  out.samples.clear();
  out.samples.reserve(data.size() / sample_size);
  for (size_t offset = 0; offset + sample_size <= data.size();
       offset += sample_size) {
    const uint8_t *in = data.data() + offset;
    float pcmFloat{0};
    if (format == format_float && sample_size == 4) {
      uint32_t bits;
      std::memcpy(&bits, in, sizeof(bits));
      boost::endian::little_to_native_inplace(bits);
      std::memcpy(&pcmFloat, &bits, sizeof(float));
    } else if (format == format_pcm) {
      switch (sample_size) {
      case 2: {
        int16_t pcm = *in | (*(in + 1) << 8);
        pcmFloat = static_cast<float>(pcm) / 32768.0f;
      } break;
      case 3: {
        int32_t pcm = *in | (*(in + 1) << 8) | (*(in + 2) << 16);
        // If the most significant bit of the 24th bit is set
        if (*(in + 2) & 0x80) {
          pcm |= (0xFF << 24); // Fill the upper 8 bits with 1s
        }
        pcmFloat = static_cast<float>(pcm) / 8388608.0f;
      } break;
      case 4: {
        int32_t pcm =
            *in | (*(in + 1) << 8) | (*(in + 2) << 16) | (*(in + 3) << 24);
        pcmFloat = static_cast<float>(pcm) / 2147483648.0f;
      } break;
      default:
        BOOST_LOG_TRIVIAL(error) << "wav:: unsupported sample size " << bits;
        return false;
      }
    } else {
      BOOST_LOG_TRIVIAL(error) << "wav:: unsupported format " << format;
      return false;
    }
    out.samples.push_back(pcmFloat);
  }
  return true;
}

std::vector<float> downmix(const std::vector<float> &interleaved,
                           uint16_t channels) {
  if (channels <= 1) {
    return interleaved;
  }
  std::vector<float> mono;
  mono.reserve(interleaved.size() / channels);
  for (size_t offset = 0; offset + channels <= interleaved.size();
       offset += channels) {
    float sum{0};
    for (uint16_t ch = 0; ch < channels; ch++) {
      sum += interleaved[offset + ch];
    }
    mono.push_back(sum / channels);
  }
  return mono;
}
