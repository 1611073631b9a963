// Repository: Monoplay
// Component: Host Player
// Purpose: Runs the playback pipeline on a workstation with host stand-ins
//          for the panel and buzzer.
// Copyright (c) 2025 Monoplay
//
// The panel is replaced by a null sink (default) or a PBM frame dump
// (--pbm-dir); the buzzer logs tone changes (visible with MONOPLAY_DEBUG=1).
// Playback runs until the stream ends (--no-loop) or SIGINT/SIGTERM.

#include <atomic>
#include <csignal>
#include <iostream>
#include <memory>
#include <utility>

#include "monoplay/audio/LoggingBuzzer.hpp"
#include "monoplay/output/AsyncDisplaySink.h"
#include "monoplay/output/NullDisplaySink.h"
#include "monoplay/output/PbmSequenceSink.h"
#include "monoplay/runtime/PlaybackOrchestrator.h"
#include "monoplay/runtime/PlayerCli.h"
#include "monoplay/runtime/PlayerConfig.h"
#include "monoplay/stream/FileByteSource.hpp"
#include "monoplay/timing/IWaitStrategy.hpp"
#include "monoplay/util/Logger.hpp"
#include "time/SteadyTimeSource.hpp"

namespace {

using monoplay::runtime::CliArgs;
using monoplay::runtime::PlayerConfig;
using monoplay::util::Logger;

// =============================================================================
// Global state for signal handling
// =============================================================================
std::atomic<bool> g_stop_requested{false};

void SignalHandler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_stop_requested.store(true, std::memory_order_release);
  }
}

}  // namespace

int main(int argc, char* argv[]) {
  const CliArgs args = monoplay::runtime::ParseArgs(argc, argv);
  if (args.help) {
    monoplay::runtime::PrintUsage(argv[0]);
    return 0;
  }
  if (!args.valid) {
    std::cerr << "Error: " << args.error << "\n\n";
    monoplay::runtime::PrintUsage(argv[0]);
    return 2;
  }

  PlayerConfig config;
  if (!monoplay::runtime::LoadConfig(args, config)) {
    return 2;
  }
  Logger::Info("[Player] Config " + config.ToJson());

  std::signal(SIGINT, SignalHandler);
  std::signal(SIGTERM, SignalHandler);

  monoplay::stream::FileByteSource video(config.video_source_path);
  monoplay::stream::FileByteSource melody(config.melody_source_path);

  std::unique_ptr<monoplay::output::IDisplaySink> display;
  if (!args.pbm_dir.empty()) {
    display = std::make_unique<monoplay::output::PbmSequenceSink>(args.pbm_dir);
  } else {
    display = std::make_unique<monoplay::output::NullDisplaySink>();
  }
  if (config.async_transfer) {
    display = std::make_unique<monoplay::output::AsyncDisplaySink>(std::move(display));
  }

  monoplay::audio::LoggingBuzzer buzzer;
  SteadyTimeSource time_source;
  monoplay::timing::RealtimeWaitStrategy wait;

  monoplay::runtime::PlaybackOrchestrator::Dependencies deps;
  deps.video = &video;
  deps.melody = config.melody_source_path.empty() ? nullptr : &melody;
  deps.display = display.get();
  deps.buzzer = &buzzer;
  deps.time_source = &time_source;
  deps.wait = &wait;

  int exit_code = 0;
  {
    monoplay::runtime::PlaybackOrchestrator orchestrator(config, deps);
    orchestrator.Run(&g_stop_requested);

    const auto& metrics = orchestrator.metrics();
    Logger::Info("[Player] Finished: " + metrics.ToLogLine());
    if (args.print_metrics) {
      std::cout << metrics.GeneratePrometheusText();
    }
    if (!g_stop_requested.load() &&
        orchestrator.last_fault() !=
            monoplay::runtime::PlaybackOrchestrator::FaultCause::kNone &&
        metrics.passes_completed_total == 0) {
      exit_code = 1;
    }
  }
  return exit_code;
}
