// Repository: Monoplay
// Component: Null Display Sink
// Purpose: Headless sink. Accepts and counts frames (benchmarks, dry runs).
// Copyright (c) 2025 Monoplay

#ifndef MONOPLAY_OUTPUT_NULL_DISPLAY_SINK_H_
#define MONOPLAY_OUTPUT_NULL_DISPLAY_SINK_H_

#include <cstdint>
#include <string>

#include "monoplay/output/IDisplaySink.h"

namespace monoplay::output {

class NullDisplaySink : public IDisplaySink {
 public:
  bool Blit(const buffer::FrameBuffer&) override {
    ++frames_;
    return true;
  }
  bool SetBacklight(uint8_t level) override {
    backlight_ = level;
    return true;
  }
  std::string GetName() const override { return "null"; }

  uint64_t frames() const { return frames_; }
  uint8_t backlight() const { return backlight_; }

 private:
  uint64_t frames_ = 0;
  uint8_t backlight_ = 0;
};

}  // namespace monoplay::output

#endif  // MONOPLAY_OUTPUT_NULL_DISPLAY_SINK_H_
