// Repository: Monoplay
// Component: Playback Metrics
// Purpose: Passive observability counters for the playback loop.
// Copyright (c) 2025 Monoplay
//
// These metrics are passive observations only. They do NOT affect
// execution, timing, or control flow.

#ifndef MONOPLAY_RUNTIME_PLAYBACK_METRICS_HPP_
#define MONOPLAY_RUNTIME_PLAYBACK_METRICS_HPP_

#include <cstdint>
#include <sstream>
#include <string>

namespace monoplay::runtime {

// Accumulated across passes for the lifetime of an orchestrator.
// Written by the playback loop only.
struct PlaybackMetrics {
  // ---- Frames ----
  int64_t frames_displayed_total = 0;
  int64_t corrupt_frames_total = 0;     // Repeated previous frame
  int64_t oversized_records_total = 0;  // Subset of corrupt frames

  // ---- Passes ----
  int64_t passes_started_total = 0;
  int64_t passes_completed_total = 0;   // Reached end of stream

  // ---- Faults ----
  int64_t faults_total = 0;
  int64_t truncated_stream_total = 0;
  int64_t read_error_total = 0;
  int64_t open_failure_total = 0;
  int64_t sink_unavailable_total = 0;

  // ---- Pacing ----
  int64_t overrun_cycles_total = 0;
  int64_t max_overrun_ms = 0;
  int32_t last_pass_drift_ms = 0;       // cumulative_drift_ms at pass end

  // One-line summary for the end-of-pass log.
  std::string ToLogLine() const {
    std::ostringstream oss;
    oss << "frames=" << frames_displayed_total
        << " corrupt=" << corrupt_frames_total
        << " passes=" << passes_completed_total << "/" << passes_started_total
        << " faults=" << faults_total
        << " (truncated=" << truncated_stream_total
        << " read_error=" << read_error_total
        << " open=" << open_failure_total
        << " sink=" << sink_unavailable_total << ")"
        << " overruns=" << overrun_cycles_total
        << " max_overrun_ms=" << max_overrun_ms
        << " drift_ms=" << last_pass_drift_ms;
    return oss.str();
  }

  // Generate Prometheus text exposition format
  std::string GeneratePrometheusText() const {
    std::ostringstream oss;
    auto counter = [&oss](const char* name, const char* help, int64_t value) {
      oss << "# HELP " << name << " " << help << "\n";
      oss << "# TYPE " << name << " counter\n";
      oss << name << " " << value << "\n";
    };
    auto gauge = [&oss](const char* name, const char* help, int64_t value) {
      oss << "# HELP " << name << " " << help << "\n";
      oss << "# TYPE " << name << " gauge\n";
      oss << name << " " << value << "\n";
    };

    counter("monoplay_frames_displayed_total", "Frames handed to the display sink",
            frames_displayed_total);
    counter("monoplay_corrupt_frames_total", "Frames replaced by the previous frame",
            corrupt_frames_total);
    counter("monoplay_oversized_records_total", "Records exceeding the scratch capacity",
            oversized_records_total);
    counter("monoplay_passes_started_total", "Playback passes started",
            passes_started_total);
    counter("monoplay_passes_completed_total", "Playback passes that reached end of stream",
            passes_completed_total);
    counter("monoplay_faults_total", "Faults that restarted or halted a pass",
            faults_total);
    counter("monoplay_truncated_stream_total", "Passes aborted by a truncated record",
            truncated_stream_total);
    counter("monoplay_read_error_total", "Passes aborted by a storage read error",
            read_error_total);
    counter("monoplay_open_failure_total", "Passes that could not open the video stream",
            open_failure_total);
    counter("monoplay_sink_unavailable_total", "Display or buzzer hardware faults",
            sink_unavailable_total);
    counter("monoplay_overrun_cycles_total", "Cycles that exceeded the target interval",
            overrun_cycles_total);
    gauge("monoplay_max_overrun_ms", "Worst single-cycle overrun",
          max_overrun_ms);
    gauge("monoplay_last_pass_drift_ms", "Cumulative drift of the last pass",
          last_pass_drift_ms);
    return oss.str();
  }
};

}  // namespace monoplay::runtime

#endif  // MONOPLAY_RUNTIME_PLAYBACK_METRICS_HPP_
