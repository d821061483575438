//
//  model_registry.hpp
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

#ifndef _MODEL_REGISTRY_HPP_
#define _MODEL_REGISTRY_HPP_

#include <cstdint>
#include <filesystem>
#include <iterator>
#include <optional>
#include <string>

struct ModelDescriptor {
  std::string id;               // "tiny.en" for ggml-tiny.en.bin
  std::filesystem::path path;
  uint64_t size{0};
  bool has_accel{false};
  std::filesystem::path accel_path;
};

/* "ggml-tiny.en.bin" -> "tiny.en", empty when the name does not match */
std::string model_id_from_path(const std::filesystem::path &path);

/* ggml-<id>-encoder-openvino.xml beside the model */
std::filesystem::path accel_path_for(const std::filesystem::path &model_path);

/* describes the model at path, nullopt if it is not a model file */
std::optional<ModelDescriptor>
describe_model(const std::filesystem::path &path);

/* 0 tiny, 1 base, 2 small, 3 medium, 4 large, 5 anything else */
int speed_rank(const std::string &model_id);

/* Lazy view over the models of a directory. Every begin() starts a fresh
   directory scan, entries are produced while iterating. */
class ModelScan {
public:
  class iterator {
  public:
    using iterator_category = std::input_iterator_tag;
    using value_type = ModelDescriptor;
    using difference_type = std::ptrdiff_t;
    using pointer = const ModelDescriptor *;
    using reference = const ModelDescriptor &;

    iterator() = default;

    reference operator*() const { return current_; }
    pointer operator->() const { return &current_; }
    iterator &operator++();
    bool operator==(const iterator &other) const {
      return dir_it_ == other.dir_it_;
    }
    bool operator!=(const iterator &other) const { return !(*this == other); }

  private:
    friend class ModelScan;
    iterator(std::filesystem::directory_iterator it, bool warmable_only);
    void settle();

    std::filesystem::directory_iterator dir_it_;
    bool warmable_only_{false};
    ModelDescriptor current_;
  };

  explicit ModelScan(std::filesystem::path dir, bool warmable_only = false)
      : dir_(std::move(dir)), warmable_only_(warmable_only) {}

  iterator begin() const;
  iterator end() const { return iterator(); }

private:
  std::filesystem::path dir_;
  bool warmable_only_;
};

inline ModelScan discover_models(const std::filesystem::path &dir) {
  return ModelScan(dir);
}

#endif
