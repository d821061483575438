//
//  external_strategy.hpp
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

#ifndef _EXTERNAL_STRATEGY_HPP_
#define _EXTERNAL_STRATEGY_HPP_

#include <atomic>
#include <memory>

#include "strategy.hpp"
#include "transcript_queue.hpp"

/* Records to staging and hands the promoted audio to an external
   transcription process, waiting for the reply carrying the same id. */
class ExternalStrategy : public Strategy {
public:
  ExternalStrategy(const std::filesystem::path &temp_dir,
                   std::shared_ptr<TranscriptQueue> queue)
      : Strategy(temp_dir), queue_(std::move(queue)){};
  ~ExternalStrategy() override { cancel(); }

  StrategyKind kind() const override { return StrategyKind::external; }

protected:
  std::error_code on_samples(const float *, size_t) override { return {}; }
  std::error_code on_finish(TranscriptionResult &result) override;
  void on_cancel() override { cancelled_ = true; }

private:
  std::shared_ptr<TranscriptQueue> queue_;
  std::atomic_bool cancelled_{false};
};

#endif
