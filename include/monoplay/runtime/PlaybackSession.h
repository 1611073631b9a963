// Repository: Monoplay
// Component: PlaybackSession
// Purpose: Per-pass playback state, owned and mutated only by the
//          PlaybackOrchestrator (once per cycle).
// Copyright (c) 2025 Monoplay

#ifndef MONOPLAY_RUNTIME_PLAYBACK_SESSION_H_
#define MONOPLAY_RUNTIME_PLAYBACK_SESSION_H_

#include <cstdint>

#include "monoplay/buffer/FrameBuffer.hpp"

namespace monoplay::runtime {

struct PlaybackSession {
  uint32_t frame_index = 0;  // Frames displayed in the current pass
  buffer::BufferId active_buffer_role = buffer::BufferId::kA;  // Front buffer
  int32_t cumulative_drift_ms = 0;  // Sum of cycle overruns this pass
  int64_t cumulative_drift_ns = 0;  // Unrounded sum; drift_ms is derived from it
  uint32_t melody_event_index = 0;
  uint16_t frames_remaining_in_event = 0;
  uint32_t loop_count = 0;  // Completed passes; survives ResetForPass()

  // Return to initial values for a new pass, keeping loop_count.
  void ResetForPass() {
    const uint32_t loops = loop_count;
    *this = PlaybackSession{};
    loop_count = loops;
  }
};

}  // namespace monoplay::runtime

#endif  // MONOPLAY_RUNTIME_PLAYBACK_SESSION_H_
