// Repository: Monoplay
// Component: Playback Metrics Tests
// Purpose: Verify Prometheus output and the end-of-pass summary line.
// Copyright (c) 2025 Monoplay

#include <gtest/gtest.h>

#include <string>

#include "monoplay/runtime/PlaybackMetrics.hpp"

namespace monoplay::tests {
namespace {

using runtime::PlaybackMetrics;

TEST(PlaybackMetricsTest, InitializeToZero) {
  PlaybackMetrics m;
  EXPECT_EQ(m.frames_displayed_total, 0);
  EXPECT_EQ(m.corrupt_frames_total, 0);
  EXPECT_EQ(m.passes_completed_total, 0);
  EXPECT_EQ(m.faults_total, 0);
  EXPECT_EQ(m.max_overrun_ms, 0);
  EXPECT_EQ(m.last_pass_drift_ms, 0);
}

TEST(PlaybackMetricsTest, PrometheusTextCarriesEveryCounter) {
  PlaybackMetrics m;
  m.frames_displayed_total = 6570;
  m.corrupt_frames_total = 2;
  m.truncated_stream_total = 1;
  m.max_overrun_ms = 17;

  const std::string text = m.GeneratePrometheusText();
  EXPECT_NE(text.find("# TYPE monoplay_frames_displayed_total counter"), std::string::npos);
  EXPECT_NE(text.find("monoplay_frames_displayed_total 6570"), std::string::npos);
  EXPECT_NE(text.find("monoplay_corrupt_frames_total 2"), std::string::npos);
  EXPECT_NE(text.find("monoplay_truncated_stream_total 1"), std::string::npos);
  EXPECT_NE(text.find("# TYPE monoplay_max_overrun_ms gauge"), std::string::npos);
  EXPECT_NE(text.find("monoplay_max_overrun_ms 17"), std::string::npos);
}

TEST(PlaybackMetricsTest, LogLineSummarisesPasses) {
  PlaybackMetrics m;
  m.passes_started_total = 3;
  m.passes_completed_total = 2;
  m.frames_displayed_total = 42;

  const std::string line = m.ToLogLine();
  EXPECT_NE(line.find("frames=42"), std::string::npos);
  EXPECT_NE(line.find("passes=2/3"), std::string::npos);
}

}  // namespace
}  // namespace monoplay::tests
