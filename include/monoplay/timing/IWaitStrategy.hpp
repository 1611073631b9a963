// Repository: Monoplay
// Component: Wait Strategy Interface
// Purpose: Decouple sleeping from pacing math in PacingController.
//          Production: RealtimeWaitStrategy sleeps for the residual.
//          Tests: DeterministicWaitStrategy (advances virtual time, no sleep).
// Copyright (c) 2025 Monoplay

#ifndef MONOPLAY_TIMING_IWAIT_STRATEGY_HPP_
#define MONOPLAY_TIMING_IWAIT_STRATEGY_HPP_

#include <chrono>
#include <thread>

namespace monoplay::timing {

class IWaitStrategy {
 public:
  virtual void WaitFor(std::chrono::nanoseconds duration) = 0;
  virtual ~IWaitStrategy() = default;
};

class RealtimeWaitStrategy : public IWaitStrategy {
 public:
  void WaitFor(std::chrono::nanoseconds duration) override {
    if (duration.count() > 0) {
      std::this_thread::sleep_for(duration);
    }
  }
};

}  // namespace monoplay::timing

#endif  // MONOPLAY_TIMING_IWAIT_STRATEGY_HPP_
