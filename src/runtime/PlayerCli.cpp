// Repository: Monoplay
// Component: Player Command Line
// Purpose: Parse host player flags and merge them over the JSON config.
// Copyright (c) 2025 Monoplay

#include "monoplay/runtime/PlayerCli.h"

#include <cstddef>
#include <cstdint>
#include <exception>
#include <fstream>
#include <iostream>
#include <sstream>

#include "monoplay/util/Logger.hpp"

namespace monoplay::runtime {

using monoplay::util::Logger;

namespace {

bool ParseInt(const std::string& text, int32_t& out) {
  try {
    size_t consumed = 0;
    const int value = std::stoi(text, &consumed);
    if (consumed != text.size()) return false;
    out = value;
    return true;
  } catch (const std::exception&) {
    return false;
  }
}

}  // namespace

void PrintUsage(const char* program_name) {
  std::cerr << "Usage: " << program_name << " [OPTIONS]\n"
            << "\n"
            << "Plays a compressed monochrome video with a single-tone melody.\n"
            << "\n"
            << "STREAMS:\n"
            << "  --video PATH         Compressed frame stream (u16 LE length + zlib record)\n"
            << "  --melody PATH        Tone stream (u16 LE tone*10, u16 LE frames); missing = silent\n"
            << "\n"
            << "PLAYBACK:\n"
            << "  --config PATH        JSON configuration file (flags below override it)\n"
            << "  --fps N              Target frame rate (sets the frame interval)\n"
            << "  --interval-ms N      Target frame interval in milliseconds\n"
            << "  --width N            Frame width in pixels (default 128)\n"
            << "  --height N           Frame height in pixels (default 160)\n"
            << "  --duty N             Buzzer PWM duty 0..1023 (default 560)\n"
            << "  --no-loop            Stop after one pass\n"
            << "  --max-faults N       Halt after N consecutive faults (0 = never)\n"
            << "\n"
            << "OUTPUT:\n"
            << "  --pbm-dir DIR        Write every displayed frame as DIR/frame_NNNNNN.pbm\n"
            << "  --async              Queue display transfers on a transfer thread\n"
            << "  --metrics            Print Prometheus metrics on exit\n"
            << "  --help               Show this help message\n"
            << "\n"
            << "EXAMPLES:\n"
            << "  " << program_name << " --video badapple_zlib.bin --melody melody.bin --fps 20\n"
            << "  " << program_name << " --video clip.bin --no-loop --pbm-dir /tmp/frames\n"
            << "\n";
}

CliArgs ParseArgs(int argc, const char* const argv[]) {
  CliArgs args;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    auto next_int = [&](int32_t& out) {
      if (i + 1 >= argc || !ParseInt(argv[i + 1], out)) {
        args.error = "Expected integer after " + arg;
        return false;
      }
      ++i;
      return true;
    };
    auto next_value = [&](std::string& out) {
      if (i + 1 >= argc) {
        args.error = "Expected value after " + arg;
        return false;
      }
      out = argv[++i];
      return true;
    };

    if (arg == "--help" || arg == "-h") {
      args.help = true;
      args.valid = true;
      return args;
    } else if (arg == "--config") {
      if (!next_value(args.config_path)) return args;
    } else if (arg == "--video") {
      if (!next_value(args.overrides.video_source_path)) return args;
      args.has_video = true;
    } else if (arg == "--melody") {
      if (!next_value(args.overrides.melody_source_path)) return args;
      args.has_melody = true;
    } else if (arg == "--fps") {
      int32_t fps = 0;
      if (!next_int(fps)) return args;
      if (fps <= 0) {
        args.error = "--fps must be positive";
        return args;
      }
      args.overrides.target_frame_interval_ms = 1000 / fps;
      args.has_interval = true;
    } else if (arg == "--interval-ms") {
      if (!next_int(args.overrides.target_frame_interval_ms)) return args;
      args.has_interval = true;
    } else if (arg == "--width") {
      if (!next_int(args.overrides.width)) return args;
      args.has_width = true;
    } else if (arg == "--height") {
      if (!next_int(args.overrides.height)) return args;
      args.has_height = true;
    } else if (arg == "--duty") {
      if (!next_int(args.overrides.buzzer_duty)) return args;
      args.has_duty = true;
    } else if (arg == "--max-faults") {
      if (!next_int(args.overrides.max_consecutive_faults)) return args;
      args.has_max_faults = true;
    } else if (arg == "--no-loop") {
      args.no_loop = true;
    } else if (arg == "--async") {
      args.async = true;
    } else if (arg == "--pbm-dir") {
      if (!next_value(args.pbm_dir)) return args;
    } else if (arg == "--metrics") {
      args.print_metrics = true;
    } else {
      args.error = "Unknown argument: " + arg;
      return args;
    }
  }

  args.valid = true;
  return args;
}

bool LoadConfig(const CliArgs& args, PlayerConfig& config) {
  if (!args.config_path.empty()) {
    std::ifstream in(args.config_path);
    if (!in.is_open()) {
      Logger::Error("[Player] Cannot read config " + args.config_path);
      return false;
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    auto parsed = PlayerConfig::FromJson(buffer.str());
    if (!parsed) {
      return false;
    }
    config = *parsed;
  }

  const PlayerConfig& o = args.overrides;
  if (args.has_video) config.video_source_path = o.video_source_path;
  if (args.has_melody) config.melody_source_path = o.melody_source_path;
  if (args.has_interval) config.target_frame_interval_ms = o.target_frame_interval_ms;
  if (args.has_width) config.width = o.width;
  if (args.has_height) config.height = o.height;
  if (args.has_duty) config.buzzer_duty = o.buzzer_duty;
  if (args.has_max_faults) config.max_consecutive_faults = o.max_consecutive_faults;
  if (args.no_loop) config.loop_enabled = false;
  if (args.async) config.async_transfer = true;

  std::string error;
  if (!config.IsValid(&error)) {
    Logger::Error("[Player] Invalid configuration: " + error);
    return false;
  }
  return true;
}

}  // namespace monoplay::runtime
