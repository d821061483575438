//
//  fallback_strategy.hpp
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

#ifndef _FALLBACK_STRATEGY_HPP_
#define _FALLBACK_STRATEGY_HPP_

#include <memory>

#include "engine.hpp"
#include "strategy.hpp"

/* Records to staging only and runs one model over the whole promoted file. */
class FallbackStrategy : public Strategy {
public:
  FallbackStrategy(const std::filesystem::path &temp_dir,
                   std::shared_ptr<Engine> engine)
      : Strategy(temp_dir), engine_(std::move(engine)){};
  ~FallbackStrategy() override { cancel(); }

  StrategyKind kind() const override { return StrategyKind::fallback; }
  const std::string &get_model_id() const { return engine_->get_model_id(); }

protected:
  std::error_code on_samples(const float *, size_t) override { return {}; }
  std::error_code on_finish(TranscriptionResult &result) override;

private:
  std::shared_ptr<Engine> engine_;
};

#endif
