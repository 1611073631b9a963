#pragma once
#include "time/ITimeSource.hpp"
#include <chrono>

class SteadyTimeSource : public ITimeSource {
public:
  std::chrono::steady_clock::time_point Now() const override {
    return std::chrono::steady_clock::now();
  }
};
