// Repository: Monoplay
// Component: Buzzer Interface
// Purpose: Abstract single-tone PWM buzzer driver contract.
// Copyright (c) 2025 Monoplay

#ifndef MONOPLAY_AUDIO_IBUZZER_HPP_
#define MONOPLAY_AUDIO_IBUZZER_HPP_

#include <cstdint>
#include <string>

namespace monoplay::audio {

// Highest PWM duty value accepted by SetTone().
constexpr uint16_t kMaxBuzzerDuty = 1023;

// IBuzzer is implemented by the board's PWM driver (external) and by host
// stand-ins. A false return means the driver reported a hardware fault;
// the orchestrator treats it as SinkUnavailable.
class IBuzzer {
 public:
  virtual ~IBuzzer() = default;

  // Drive the buzzer at `frequency_hz` with PWM duty 0..kMaxBuzzerDuty.
  // frequency_hz == 0 mutes, same as Silence().
  virtual bool SetTone(uint32_t frequency_hz, uint16_t duty) = 0;

  virtual bool Silence() = 0;

  virtual std::string Name() const = 0;
};

}  // namespace monoplay::audio

#endif  // MONOPLAY_AUDIO_IBUZZER_HPP_
