//
//  model_registry.cpp
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

#include <boost/algorithm/string.hpp>

#include "log.hpp"
#include "model_registry.hpp"

namespace fs = std::filesystem;

static const std::string model_prefix("ggml-");
static const std::string model_suffix(".bin");
static const std::string accel_suffix("-encoder-openvino.xml");

std::string model_id_from_path(const fs::path &path) {
  auto name = path.filename().string();
  if (!boost::starts_with(name, model_prefix) ||
      !boost::ends_with(name, model_suffix) ||
      name.size() <= model_prefix.size() + model_suffix.size()) {
    return {};
  }
  return name.substr(model_prefix.size(), name.size() - model_prefix.size() -
                                              model_suffix.size());
}

fs::path accel_path_for(const fs::path &model_path) {
  return model_path.parent_path() /
         (model_prefix + model_id_from_path(model_path) + accel_suffix);
}

std::optional<ModelDescriptor> describe_model(const fs::path &path) {
  std::error_code ec;
  if (!fs::is_regular_file(path, ec)) {
    return std::nullopt;
  }
  auto id = model_id_from_path(path);
  if (id.empty()) {
    return std::nullopt;
  }
  ModelDescriptor desc;
  desc.id = id;
  desc.path = path;
  desc.size = fs::file_size(path, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(warning) << "registry:: cannot stat " << path << ": "
                               << ec.message();
    return std::nullopt;
  }
  auto accel = accel_path_for(path);
  desc.has_accel = fs::exists(accel, ec);
  if (desc.has_accel) {
    desc.accel_path = accel;
  }
  return desc;
}

int speed_rank(const std::string &model_id) {
  static const char *families[] = {"tiny", "base", "small", "medium", "large"};
  int rank = 0;
  for (auto family : families) {
    if (boost::starts_with(model_id, family)) {
      return rank;
    }
    rank++;
  }
  return rank;
}

ModelScan::iterator::iterator(fs::directory_iterator it, bool warmable_only)
    : dir_it_(std::move(it)), warmable_only_(warmable_only) {
  settle();
}

ModelScan::iterator &ModelScan::iterator::operator++() {
  std::error_code ec;
  dir_it_.increment(ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(warning) << "registry:: scan interrupted: "
                               << ec.message();
    dir_it_ = fs::directory_iterator();
    return *this;
  }
  settle();
  return *this;
}

void ModelScan::iterator::settle() {
  std::error_code ec;
  while (dir_it_ != fs::directory_iterator()) {
    auto desc = describe_model(dir_it_->path());
    if (desc && (!warmable_only_ || desc->has_accel)) {
      current_ = std::move(*desc);
      return;
    }
    dir_it_.increment(ec);
    if (ec) {
      dir_it_ = fs::directory_iterator();
    }
  }
}

ModelScan::iterator ModelScan::begin() const {
  std::error_code ec;
  fs::directory_iterator it(dir_, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(warning) << "registry:: cannot scan " << dir_ << ": "
                               << ec.message();
    return end();
  }
  return iterator(std::move(it), warmable_only_);
}
