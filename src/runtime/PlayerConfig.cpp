// Repository: Monoplay
// Component: PlayerConfig Domain Implementation
// Purpose: Parse and validate PlayerConfig from JSON.
// Copyright (c) 2025 Monoplay

#include "monoplay/runtime/PlayerConfig.h"

#include <optional>
#include <regex>
#include <sstream>
#include <stdexcept>

#include "monoplay/util/Logger.hpp"

namespace monoplay::runtime {

using monoplay::util::Logger;

namespace {
  // Simple JSON parser for the PlayerConfig schema.
  // The schema is flat and fixed, so fields are extracted by pattern.

  // Extract integer value from JSON object field.
  // Returns false if absent; sets `malformed` if present but unparsable.
  bool ExtractInt(const std::string& json, const std::string& field_name,
                  int32_t& out_value, bool& malformed) {
    std::string pattern_str = "\"" + field_name + "\"\\s*:\\s*(-?\\d+)";
    std::regex pattern(pattern_str);
    std::smatch match;
    if (std::regex_search(json, match, pattern)) {
      try {
        out_value = std::stoi(match[1].str());
        return true;
      } catch (const std::exception&) {
        malformed = true;
        return false;
      }
    }
    return false;
  }

  bool ExtractBool(const std::string& json, const std::string& field_name,
                   bool& out_value) {
    std::string pattern_str = "\"" + field_name + "\"\\s*:\\s*(true|false)";
    std::regex pattern(pattern_str);
    std::smatch match;
    if (std::regex_search(json, match, pattern)) {
      out_value = match[1].str() == "true";
      return true;
    }
    return false;
  }

  // Extract string value from JSON object field (no escape handling;
  // paths with quotes are not supported).
  bool ExtractString(const std::string& json, const std::string& field_name,
                     std::string& out_value) {
    std::string pattern_str = "\"" + field_name + "\"\\s*:\\s*\"([^\"]*)\"";
    std::regex pattern(pattern_str);
    std::smatch match;
    if (std::regex_search(json, match, pattern)) {
      out_value = match[1].str();
      return true;
    }
    return false;
  }

  bool LooksLikeObject(const std::string& json) {
    const auto first = json.find_first_not_of(" \t\r\n");
    const auto last = json.find_last_not_of(" \t\r\n");
    return first != std::string::npos && json[first] == '{' &&
           json[last] == '}';
  }

  // Compressed stream size bound for one record (u16 length prefix).
  constexpr int32_t kMaxRecordBytesLimit = 65535;
  // Headroom over MONO_SIZE for incompressible frames.
  constexpr size_t kRecordHeadroomBytes = 64;
}

buffer::FrameGeometry PlayerConfig::Geometry() const {
  buffer::FrameGeometry geometry;
  geometry.width = width;
  geometry.height = height;
  return geometry;
}

size_t PlayerConfig::RecordCapacity() const {
  if (max_record_bytes > 0) {
    return static_cast<size_t>(max_record_bytes);
  }
  const size_t derived = MonoSize() + kRecordHeadroomBytes;
  return derived > static_cast<size_t>(kMaxRecordBytesLimit)
             ? static_cast<size_t>(kMaxRecordBytesLimit)
             : derived;
}

std::optional<PlayerConfig> PlayerConfig::FromJson(const std::string& json_str) {
  if (!LooksLikeObject(json_str)) {
    Logger::Error("[Config] Not a JSON object");
    return std::nullopt;
  }

  PlayerConfig config;
  bool malformed = false;

  ExtractInt(json_str, "target_frame_interval_ms",
             config.target_frame_interval_ms, malformed);
  ExtractBool(json_str, "loop_enabled", config.loop_enabled);
  ExtractString(json_str, "video_source_path", config.video_source_path);
  ExtractString(json_str, "melody_source_path", config.melody_source_path);
  ExtractInt(json_str, "width", config.width, malformed);
  ExtractInt(json_str, "height", config.height, malformed);
  ExtractInt(json_str, "buzzer_duty", config.buzzer_duty, malformed);
  ExtractInt(json_str, "backlight_level", config.backlight_level, malformed);
  ExtractBool(json_str, "async_transfer", config.async_transfer);
  ExtractInt(json_str, "loop_delay_ms", config.loop_delay_ms, malformed);
  ExtractInt(json_str, "fault_backoff_ms", config.fault_backoff_ms, malformed);
  ExtractInt(json_str, "max_consecutive_faults",
             config.max_consecutive_faults, malformed);
  ExtractInt(json_str, "max_record_bytes", config.max_record_bytes, malformed);

  if (malformed) {
    Logger::Error("[Config] Numeric field out of range");
    return std::nullopt;
  }

  std::string error;
  if (!config.IsValid(&error)) {
    Logger::Error("[Config] Invalid configuration: " + error);
    return std::nullopt;
  }
  return config;
}

std::string PlayerConfig::ToJson() const {
  std::ostringstream oss;
  oss << "{"
      << "\"target_frame_interval_ms\":" << target_frame_interval_ms << ","
      << "\"loop_enabled\":" << (loop_enabled ? "true" : "false") << ","
      << "\"video_source_path\":\"" << video_source_path << "\","
      << "\"melody_source_path\":\"" << melody_source_path << "\","
      << "\"width\":" << width << ","
      << "\"height\":" << height << ","
      << "\"buzzer_duty\":" << buzzer_duty << ","
      << "\"backlight_level\":" << backlight_level << ","
      << "\"async_transfer\":" << (async_transfer ? "true" : "false") << ","
      << "\"loop_delay_ms\":" << loop_delay_ms << ","
      << "\"fault_backoff_ms\":" << fault_backoff_ms << ","
      << "\"max_consecutive_faults\":" << max_consecutive_faults << ","
      << "\"max_record_bytes\":" << max_record_bytes
      << "}";
  return oss.str();
}

bool PlayerConfig::IsValid(std::string* error) const {
  auto fail = [error](const std::string& what) {
    if (error != nullptr) *error = what;
    return false;
  };

  if (width <= 0 || width > 4096) return fail("width");
  if (height <= 0 || height > 4096) return fail("height");
  if (target_frame_interval_ms <= 0 || target_frame_interval_ms > 10000) {
    return fail("target_frame_interval_ms");
  }
  if (buzzer_duty < 0 || buzzer_duty > 1023) return fail("buzzer_duty");
  if (backlight_level < 0 || backlight_level > 255) return fail("backlight_level");
  if (loop_delay_ms < 0) return fail("loop_delay_ms");
  if (fault_backoff_ms < 0) return fail("fault_backoff_ms");
  if (max_consecutive_faults < 0) return fail("max_consecutive_faults");
  if (max_record_bytes < 0 || max_record_bytes > kMaxRecordBytesLimit) {
    return fail("max_record_bytes");
  }
  if (video_source_path.empty()) return fail("video_source_path");
  return true;
}

}  // namespace monoplay::runtime
