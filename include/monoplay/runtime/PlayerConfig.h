// Repository: Monoplay
// Component: PlayerConfig Domain
// Purpose: Startup configuration for a playback instance. Read once, never
//          reloaded during playback.
// Copyright (c) 2025 Monoplay

#ifndef MONOPLAY_RUNTIME_PLAYER_CONFIG_H_
#define MONOPLAY_RUNTIME_PLAYER_CONFIG_H_

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "monoplay/buffer/FrameBuffer.hpp"

namespace monoplay::runtime {

// PlayerConfig carries everything the encoder and player must agree on
// out-of-band (geometry, frame interval) plus local playback policy.
struct PlayerConfig {
  // Pacing
  int32_t target_frame_interval_ms = 50;  // 20 fps
  bool loop_enabled = true;

  // Streams
  std::string video_source_path = "badapple_zlib.bin";
  std::string melody_source_path = "melody.bin";  // Missing file = silent

  // Geometry (derives MONO_SIZE)
  int32_t width = 128;
  int32_t height = 160;

  // Devices
  int32_t buzzer_duty = 560;       // 0..1023, acts as volume
  int32_t backlight_level = 255;   // 0..255, applied at the start of each pass
  bool async_transfer = false;     // Wrap the sink in AsyncDisplaySink

  // Recovery policy
  int32_t loop_delay_ms = 500;
  int32_t fault_backoff_ms = 500;
  int32_t max_consecutive_faults = 0;  // 0 = unlimited
  int32_t max_record_bytes = 0;        // 0 = MonoSize() + 64

  buffer::FrameGeometry Geometry() const;
  size_t MonoSize() const { return Geometry().MonoSize(); }

  // Scratch capacity for one compressed record.
  size_t RecordCapacity() const;

  // Parse PlayerConfig from a flat JSON object. Missing keys keep their
  // defaults; unknown keys are ignored.
  // Returns empty optional on parse/validation failure.
  static std::optional<PlayerConfig> FromJson(const std::string& json_str);

  // Convert to JSON string (for logging).
  std::string ToJson() const;

  // Validate ranges. On failure, `error` (if non-null) names the field.
  bool IsValid(std::string* error = nullptr) const;
};

}  // namespace monoplay::runtime

#endif  // MONOPLAY_RUNTIME_PLAYER_CONFIG_H_
