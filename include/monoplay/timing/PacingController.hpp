// Repository: Monoplay
// Component: Pacing Controller
// Purpose: Holds a fixed target frame interval by sleeping the residual of
//          each cycle; accumulates overruns as drift instead of skipping.
// Copyright (c) 2025 Monoplay
//
// Pacing is relative per cycle: elapsed = now - cycle_start; if elapsed is
// under the target the controller sleeps (target - elapsed), otherwise it
// does not sleep and reports the overrun. Overruns are never repaid by
// shortening later cycles or dropping frames. Every frame is shown, and
// the tone-to-frame index mapping stays exact at the cost of a slower
// observed frame rate.

#ifndef MONOPLAY_TIMING_PACING_CONTROLLER_HPP_
#define MONOPLAY_TIMING_PACING_CONTROLLER_HPP_

#include <chrono>

#include "monoplay/timing/IWaitStrategy.hpp"
#include "time/ITimeSource.hpp"

namespace monoplay::timing {

struct CycleTiming {
  std::chrono::nanoseconds elapsed{0};  // Work time before the sleep
  std::chrono::nanoseconds slept{0};    // Residual requested from the wait strategy
  std::chrono::nanoseconds overrun{0};  // elapsed - target when elapsed > target

  bool overran() const { return overrun.count() > 0; }
};

class PacingController {
 public:
  // `time_source` and `wait` must outlive the controller.
  PacingController(std::chrono::milliseconds target_interval,
                   ITimeSource* time_source, IWaitStrategy* wait);

  std::chrono::steady_clock::time_point BeginCycle();
  CycleTiming EndCycle(std::chrono::steady_clock::time_point start);

  std::chrono::milliseconds target_interval() const { return target_interval_; }

 private:
  std::chrono::milliseconds target_interval_;
  ITimeSource* time_source_;
  IWaitStrategy* wait_;
};

}  // namespace monoplay::timing

#endif  // MONOPLAY_TIMING_PACING_CONTROLLER_HPP_
