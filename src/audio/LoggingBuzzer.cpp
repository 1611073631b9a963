// Repository: Monoplay
// Component: Logging Buzzer
// Purpose: Host stand-in for the PWM buzzer; logs tone changes.
// Copyright (c) 2025 Monoplay

#include "monoplay/audio/LoggingBuzzer.hpp"

#include <algorithm>
#include <sstream>

#include "monoplay/util/Logger.hpp"

namespace monoplay::audio {

using monoplay::util::Logger;

bool LoggingBuzzer::SetTone(uint32_t frequency_hz, uint16_t duty) {
  if (frequency_hz == 0) {
    return Silence();
  }
  duty = std::min(duty, kMaxBuzzerDuty);
  if (frequency_hz != frequency_hz_ || duty != duty_) {
    frequency_hz_ = frequency_hz;
    duty_ = duty;
    ++tone_changes_;
    std::ostringstream oss;
    oss << "[Buzzer] tone " << frequency_hz << "Hz duty=" << duty;
    Logger::Debug(oss.str());
  }
  return true;
}

bool LoggingBuzzer::Silence() {
  if (frequency_hz_ != 0 || duty_ != 0) {
    frequency_hz_ = 0;
    duty_ = 0;
    ++tone_changes_;
    Logger::Debug("[Buzzer] silence");
  }
  return true;
}

}  // namespace monoplay::audio
