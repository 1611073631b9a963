// Repository: Monoplay
// Component: Player Command Line
// Purpose: Parse host player flags and merge them over the JSON config.
// Copyright (c) 2025 Monoplay

#ifndef MONOPLAY_RUNTIME_PLAYER_CLI_H_
#define MONOPLAY_RUNTIME_PLAYER_CLI_H_

#include <string>

#include "monoplay/runtime/PlayerConfig.h"

namespace monoplay::runtime {

struct CliArgs {
  std::string config_path;
  std::string pbm_dir;
  bool print_metrics = false;
  bool help = false;
  bool valid = false;
  std::string error;  // Set when !valid

  // Per-field overrides, applied on top of the config file.
  PlayerConfig overrides;
  bool has_video = false;
  bool has_melody = false;
  bool has_interval = false;
  bool has_width = false;
  bool has_height = false;
  bool has_duty = false;
  bool has_max_faults = false;
  bool no_loop = false;
  bool async = false;
};

CliArgs ParseArgs(int argc, const char* const argv[]);

// Loads args.config_path (if any), applies the flag overrides and
// validates the result. Logs and returns false on any failure.
bool LoadConfig(const CliArgs& args, PlayerConfig& config);

void PrintUsage(const char* program_name);

}  // namespace monoplay::runtime

#endif  // MONOPLAY_RUNTIME_PLAYER_CLI_H_
