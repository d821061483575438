//
//  staging.cpp
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

#include <fcntl.h>
#include <unistd.h>

#include "error.hpp"
#include "log.hpp"
#include "staging.hpp"

namespace fs = std::filesystem;

static bool sync_file(const fs::path &path) {
  int fd = ::open(path.c_str(), O_RDONLY);
  if (fd < 0) {
    return false;
  }
  bool ret = ::fsync(fd) == 0;
  ::close(fd);
  return ret;
}

void discard_staging(const fs::path &staging) {
  std::error_code ec;
  if (fs::remove(staging, ec)) {
    BOOST_LOG_TRIVIAL(debug) << "staging:: removed " << staging;
  } else if (ec) {
    BOOST_LOG_TRIVIAL(warning) << "staging:: cannot remove " << staging
                               << ": " << ec.message();
  }
}

std::error_code promote_staging(const fs::path &staging,
                                const fs::path &canonical, uint64_t min_bytes,
                                uint64_t &bytes) {
  std::error_code ec;
  auto staging_bytes = fs::file_size(staging, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "staging:: cannot stat " << staging << ": "
                             << ec.message();
    discard_staging(staging);
    return PipelineErrc::staging_io_error;
  }
  if (staging_bytes <= min_bytes) {
    BOOST_LOG_TRIVIAL(error) << "staging:: " << staging << " has "
                             << staging_bytes << " bytes, no audio to keep";
    discard_staging(staging);
    return PipelineErrc::empty_recording;
  }

  auto part = canonical;
  part += ".part";
  auto fail = [&](const std::string &what) {
    BOOST_LOG_TRIVIAL(error) << "staging:: " << what << " promoting "
                             << staging << " to " << canonical;
    std::error_code rm_ec;
    fs::remove(part, rm_ec);
    discard_staging(staging);
    return make_error_code(PipelineErrc::staging_io_error);
  };

  if (canonical.has_parent_path()) {
    fs::create_directories(canonical.parent_path(), ec);
    if (ec) {
      return fail("cannot create directory (" + ec.message() + ")");
    }
  }

  fs::copy_file(staging, part, fs::copy_options::overwrite_existing, ec);
  if (ec) {
    return fail("copy failed (" + ec.message() + ")");
  }
  if (!sync_file(part)) {
    return fail("fsync failed");
  }
  auto part_bytes = fs::file_size(part, ec);
  if (ec || part_bytes != staging_bytes) {
    return fail("size mismatch after copy (" + std::to_string(part_bytes) +
                " != " + std::to_string(staging_bytes) + ")");
  }

  fs::rename(part, canonical, ec);
  if (ec) {
    return fail("rename failed (" + ec.message() + ")");
  }
  auto final_bytes = fs::file_size(canonical, ec);
  if (ec || final_bytes != staging_bytes) {
    /* the rename replaced the canonical file, drop the bad copy */
    std::error_code rm_ec;
    fs::remove(canonical, rm_ec);
    return fail("integrity check failed");
  }

  discard_staging(staging);
  bytes = final_bytes;
  BOOST_LOG_TRIVIAL(info) << "staging:: promoted " << bytes << " bytes to "
                          << canonical;
  return {};
}
