//
//  main.cpp
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

#include <boost/asio/thread_pool.hpp>
#include <boost/program_options.hpp>
#include <algorithm>
#include <atomic>
#include <iostream>
#include <optional>
#include <signal.h>
#include <thread>

#include "config.hpp"
#include "error.hpp"
#include "log.hpp"
#include "model_state.hpp"
#include "strategy_selector.hpp"
#include "transcriber_cache.hpp"
#include "transcript_worker.hpp"
#include "wav.hpp"
#include "whisper.hpp"

namespace po = boost::program_options;
namespace postyle = boost::program_options::command_line_style;

static const std::string version("voxpipe-1.0.0");
static std::atomic<bool> terminate = false;

void termination_handler(int signum) {
  BOOST_LOG_TRIVIAL(info) << "main:: got signal " << signum;
  // Terminate program
  terminate = true;
}

bool is_terminated() { return terminate.load(); }

const std::string &get_version() { return version; }

static void check(const std::error_code &ec, const std::string &what) {
  if (ec) {
    throw std::runtime_error("main:: " + what + ": " + ec.message());
  }
}

static void print_states(const ModelStateStore &store) {
  for (const auto &[id, state] : store.list()) {
    std::cout << id << ": " << to_string(state.status);
    if (!state.reason.empty()) {
      std::cout << " (" << state.reason << ")";
    }
    std::cout << '\n';
  }
}

static std::shared_ptr<TranscriptWorker>
start_loopback_worker(const Config &config, TranscriberCache &cache,
                      std::shared_ptr<TranscriptQueue> worker_end) {
  /* the loopback backend serves with the fastest model on disk */
  std::optional<ModelDescriptor> best;
  for (const auto &model : ModelScan(config.get_models_dir())) {
    if (!best || faster_than(model, *best)) {
      best = model;
    }
  }
  if (!best) {
    throw std::runtime_error("main:: no model for the external worker");
  }
  std::shared_ptr<Engine> engine;
  check(cache.get_or_create(best->path, engine), "external worker");
  auto worker = std::make_shared<TranscriptWorker>(worker_end, engine);
  if (!worker->start()) {
    throw std::runtime_error("main:: external worker start failed");
  }
  return worker;
}

int main(int argc, char *argv[]) {
  int rc(EXIT_SUCCESS);
  po::options_description desc("Options");
  desc.add_options()
      ("version,v", "Print version and exit")
      ("input,i", po::value<std::string>(), "WAV file to replay as a recording")
      ("output,w", po::value<std::string>()->default_value("recording.wav"), "Canonical recording path")
      ("models_dir,m", po::value<std::string>()->default_value("models"), "Directory holding ggml-<id>.bin models")
      ("state_dir,S", po::value<std::string>()->default_value("."), "Directory holding model_states.json")
      ("temp_dir,T", po::value<std::string>()->default_value("/tmp"), "Directory for staging files")
      ("strategy,s", po::value<std::string>()->default_value("auto"), "auto, progressive, fallback or external")
      ("chunking,k", po::value<bool>()->default_value(true), "Enable/disable progressive chunking")
      ("chunking_threshold,c", po::value<int>()->default_value(3), "Minimum duration in seconds for progressive")
      ("chunk_duration,u", po::value<int>()->default_value(5), "Fast model chunk duration in seconds")
      ("refinement_chunk,R", po::value<int>()->default_value(10), "Refinement window duration in seconds")
      ("refinement_timeout,t", po::value<int>()->default_value(5000), "Refinement deadline in ms after finish")
      ("forced_fallback,f", po::value<bool>()->default_value(false), "Fall back when a forced strategy has no models")
      ("external,x", po::value<bool>()->default_value(false), "Route sessions to the loopback external backend")
      ("external_timeout,X", po::value<int>()->default_value(30000), "External backend reply timeout in ms")
      ("warm,W", "Warm up the accelerated models and exit")
      ("retry_failed,F", "With --warm, retry models that failed before")
      ("language,l", po::value<std::string>()->default_value("en"), "Whisper default language")
      ("openvino_device,o", po::value<std::string>()->default_value("CPU"), "Whisper openvino device to use")
      ("threads,j", po::value<int>()->default_value(4), "Whisper threads per inference")
      ("workers,n", po::value<int>()->default_value(2), "Inference worker threads")
      ("log_level,d", po::value<int>()->default_value(2), "Log level from 0=trace to 5=fatal")
      ("help,h", "Print this help " "message");
  int unix_style = postyle::unix_style | postyle::short_allow_next;

  po::variables_map vm;
  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(desc)
                  .style(unix_style)
                  .run(),
              vm);

    po::notify(vm);

    if (vm.count("version")) {
      std::cout << version << '\n';
      return EXIT_SUCCESS;
    }
    if (vm.count("help")) {
      std::cout << "USAGE: " << argv[0] << '\n' << desc << '\n';
      return EXIT_SUCCESS;
    }
    if (!vm.count("warm") && !vm.count("input")) {
      throw po::error("either --input or --warm is required");
    }

  } catch (po::error &poe) {
    std::cerr << poe.what() << '\n'
              << "USAGE: " << argv[0] << '\n'
              << desc << '\n';
    return EXIT_FAILURE;
  }

  signal(SIGINT, termination_handler);
  signal(SIGTERM, termination_handler);
  signal(SIGCHLD, SIG_IGN);

  Config config;
  config.set_models_dir(vm["models_dir"].as<std::string>());
  config.set_state_dir(vm["state_dir"].as<std::string>());
  config.set_temp_dir(vm["temp_dir"].as<std::string>());
  config.set_strategy(vm["strategy"].as<std::string>());
  config.set_enable_chunking(vm["chunking"].as<bool>());
  config.set_chunking_threshold(vm["chunking_threshold"].as<int>());
  config.set_chunk_duration(vm["chunk_duration"].as<int>());
  config.set_refinement_chunk(vm["refinement_chunk"].as<int>());
  config.set_refinement_timeout(vm["refinement_timeout"].as<int>());
  config.set_forced_fallback(vm["forced_fallback"].as<bool>());
  config.set_external_enabled(vm["external"].as<bool>());
  config.set_external_timeout(vm["external_timeout"].as<int>());
  config.set_language(vm["language"].as<std::string>());
  config.set_openvino_device(vm["openvino_device"].as<std::string>());
  config.set_threads(vm["threads"].as<int>());
  config.set_workers(vm["workers"].as<int>());
  config.set_log_severity(vm["log_level"].as<int>());

  /* init logging */
  log_init(config);

  BOOST_LOG_TRIVIAL(debug) << "main:: initializing ...";
  try {
    ModelStateStore store(config.get_state_dir(), config.get_models_dir());
    TranscriberCache cache(whisper_engine_factory(config), &store);
    store.set_warmer(make_cache_warmer(cache));

    if (vm.count("warm")) {
      auto ready = store.warm_models(vm.count("retry_failed") > 0);
      BOOST_LOG_TRIVIAL(info) << "main:: " << ready << " models warmed";
      print_states(store);
      std::cout << "exiting with code: " << rc << std::endl;
      return rc;
    }

    WavData wav;
    if (!read_wav(vm["input"].as<std::string>(), wav)) {
      throw std::runtime_error("main:: cannot read input WAV");
    }
    if (wav.sample_rate != config.get_sample_rate()) {
      throw std::runtime_error("main:: input must be sampled at " +
                               std::to_string(config.get_sample_rate()) +
                               " Hz");
    }
    config.set_channels(wav.channels);
    double duration =
        static_cast<double>(wav.samples.size()) / wav.channels /
        wav.sample_rate;

    boost::asio::thread_pool pool(std::max(1, int(config.get_workers())));
    std::shared_ptr<TranscriptQueue> client_end;
    std::shared_ptr<TranscriptWorker> worker;
    if (config.get_external_enabled()) {
      auto queues = make_queue_pair();
      client_end = queues.first;
      worker = start_loopback_worker(config, cache, queues.second);
    }

    StrategySelector selector(store, cache, pool, client_end);
    std::unique_ptr<Strategy> strategy;
    auto sc = config.get_strategy_config();
    check(selector.select(duration, sc, config.get_temp_dir(), strategy),
          "strategy selection failed");
    check(strategy->start_recording(vm["output"].as<std::string>(), sc),
          "start recording failed");

    BOOST_LOG_TRIVIAL(debug) << "main:: init done, replaying " << duration
                             << "s of audio ...";
    /* 500 ms chunks, like a live capture */
    size_t chunk = config.get_sample_rate() / 2 * wav.channels;
    for (size_t offset = 0; offset < wav.samples.size() && !is_terminated();
         offset += chunk) {
      size_t count = std::min(chunk, wav.samples.size() - offset);
      check(strategy->process_samples(wav.samples.data() + offset, count),
            "processing samples failed");
      BOOST_LOG_TRIVIAL(trace) << "main:: partial: "
                               << strategy->partial_text();
    }

    if (is_terminated()) {
      strategy->cancel();
      rc = EXIT_FAILURE;
    } else {
      TranscriptionResult result;
      check(strategy->finish_recording(result), "transcription failed");
      BOOST_LOG_TRIVIAL(info)
          << "main:: " << result.strategy_used << " took "
          << result.processing_time_ms << " ms, "
          << result.chunks_processed << " refined chunks, "
          << result.recording_bytes << " bytes recorded";
      std::cout << "Transcription:\n" << result.text << std::endl;
    }

    strategy.reset();
    if (worker) {
      worker->stop();
    }
    pool.join();
  } catch (std::exception &e) {
    BOOST_LOG_TRIVIAL(fatal) << "main:: fatal exception error: " << e.what();
    rc = EXIT_FAILURE;
  }

  std::cout << "exiting with code: " << rc << std::endl;
  return rc;
}
