// Repository: Monoplay
// Component: Deterministic Wait Strategy (test only)
// Purpose: Virtual sleep: advances DeterministicTimeSource by exactly the
//          requested duration and records it. No wall-clock dependency.
// Copyright (c) 2025 Monoplay

#ifndef MONOPLAY_TESTS_SUPPORT_DETERMINISTIC_WAIT_STRATEGY_HPP_
#define MONOPLAY_TESTS_SUPPORT_DETERMINISTIC_WAIT_STRATEGY_HPP_

#include <chrono>
#include <cstdint>
#include <vector>

#include "DeterministicTimeSource.hpp"
#include "monoplay/timing/IWaitStrategy.hpp"

namespace monoplay::timing {

class DeterministicWaitStrategy : public IWaitStrategy {
 public:
  explicit DeterministicWaitStrategy(DeterministicTimeSource* ts) : ts_(ts) {}

  void WaitFor(std::chrono::nanoseconds duration) override {
    waits_.push_back(duration);
    if (duration.count() > 0) {
      ts_->AdvanceNs(duration.count());
    }
  }

  const std::vector<std::chrono::nanoseconds>& waits() const { return waits_; }

  int64_t TotalWaitMs() const {
    std::chrono::nanoseconds total{0};
    for (const auto& w : waits_) total += w;
    return std::chrono::duration_cast<std::chrono::milliseconds>(total).count();
  }

  void Clear() { waits_.clear(); }

 private:
  DeterministicTimeSource* ts_;
  std::vector<std::chrono::nanoseconds> waits_;
};

}  // namespace monoplay::timing

#endif  // MONOPLAY_TESTS_SUPPORT_DETERMINISTIC_WAIT_STRATEGY_HPP_
