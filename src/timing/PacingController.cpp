// Repository: Monoplay
// Component: Pacing Controller
// Purpose: Holds a fixed target frame interval by sleeping the residual of
//          each cycle; accumulates overruns as drift instead of skipping.
// Copyright (c) 2025 Monoplay

#include "monoplay/timing/PacingController.hpp"

#include <sstream>

#include "monoplay/util/Logger.hpp"

namespace monoplay::timing {

using monoplay::util::Logger;

PacingController::PacingController(std::chrono::milliseconds target_interval,
                                   ITimeSource* time_source,
                                   IWaitStrategy* wait)
    : target_interval_(target_interval),
      time_source_(time_source),
      wait_(wait) {}

std::chrono::steady_clock::time_point PacingController::BeginCycle() {
  return time_source_->Now();
}

CycleTiming PacingController::EndCycle(
    std::chrono::steady_clock::time_point start) {
  CycleTiming timing;
  timing.elapsed = std::chrono::duration_cast<std::chrono::nanoseconds>(
      time_source_->Now() - start);

  const auto target =
      std::chrono::duration_cast<std::chrono::nanoseconds>(target_interval_);
  if (timing.elapsed < target) {
    timing.slept = target - timing.elapsed;
    wait_->WaitFor(timing.slept);
    return timing;
  }
  if (timing.elapsed == target) {
    return timing;
  }

  timing.overrun = timing.elapsed - target;

  std::ostringstream oss;
  oss << "[Pacing] Cycle overran target by "
      << std::chrono::duration_cast<std::chrono::microseconds>(timing.overrun)
             .count()
      << "us (elapsed="
      << std::chrono::duration_cast<std::chrono::milliseconds>(timing.elapsed)
             .count()
      << "ms target=" << target_interval_.count() << "ms)";
  Logger::Debug(oss.str());
  return timing;
}

}  // namespace monoplay::timing
