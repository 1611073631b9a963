#pragma once
#include <chrono>

// Monotonic time for frame pacing. Production: SteadyTimeSource.
// Tests: DeterministicTimeSource (virtual time advanced by the test).
class ITimeSource {
public:
  virtual ~ITimeSource() = default;
  virtual std::chrono::steady_clock::time_point Now() const = 0;
};
