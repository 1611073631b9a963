// Repository: Monoplay
// Component: Logging Buzzer
// Purpose: Host stand-in for the PWM buzzer; logs tone changes.
// Copyright (c) 2025 Monoplay

#ifndef MONOPLAY_AUDIO_LOGGING_BUZZER_HPP_
#define MONOPLAY_AUDIO_LOGGING_BUZZER_HPP_

#include <cstdint>
#include <string>

#include "monoplay/audio/IBuzzer.hpp"

namespace monoplay::audio {

// Emits one Debug line per tone change (not per call), so a steady note
// spanning many frames produces a single line.
class LoggingBuzzer : public IBuzzer {
 public:
  LoggingBuzzer() = default;

  bool SetTone(uint32_t frequency_hz, uint16_t duty) override;
  bool Silence() override;
  std::string Name() const override { return "logging-buzzer"; }

  uint32_t current_frequency_hz() const { return frequency_hz_; }
  uint16_t current_duty() const { return duty_; }
  uint64_t tone_changes() const { return tone_changes_; }

 private:
  uint32_t frequency_hz_ = 0;
  uint16_t duty_ = 0;
  uint64_t tone_changes_ = 0;
};

}  // namespace monoplay::audio

#endif  // MONOPLAY_AUDIO_LOGGING_BUZZER_HPP_
