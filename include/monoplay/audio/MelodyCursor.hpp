// Repository: Monoplay
// Component: Melody Cursor
// Purpose: Walks the run-length-encoded tone stream in lockstep with the
//          video frame index, yielding the active tone for each frame.
// Copyright (c) 2025 Monoplay
//
// Melody record layout (4 bytes, little-endian):
//   u16 tone_code        frequency in Hz * 10, 0 = silence
//   u16 duration_frames  number of video frames the tone stays active
//
// Only the current event is held in memory; records are read on demand.

#ifndef MONOPLAY_AUDIO_MELODY_CURSOR_HPP_
#define MONOPLAY_AUDIO_MELODY_CURSOR_HPP_

#include <cstdint>

#include "monoplay/stream/IByteSource.hpp"

namespace monoplay::audio {

constexpr uint16_t kSilenceToneCode = 0;
constexpr size_t kMelodyRecordBytes = 4;

struct MelodyEvent {
  uint16_t tone_code = kSilenceToneCode;
  uint16_t duration_frames = 0;
};

// Integer Hz for a tone code (truncating, as the PWM driver takes whole Hz).
inline uint32_t ToneCodeToHz(uint16_t tone_code) {
  return static_cast<uint32_t>(tone_code / 10);
}

class MelodyCursor {
 public:
  // `source` may be nullptr (no melody configured); it must otherwise
  // outlive the cursor.
  explicit MelodyCursor(stream::IByteSource* source);

  MelodyCursor(const MelodyCursor&) = delete;
  MelodyCursor& operator=(const MelodyCursor&) = delete;

  // Rewind to the first event. Re-opens the source; an unavailable source
  // leaves the cursor exhausted (silent throughout).
  void Reset();

  // Release the source (end of pass).
  void Close();

  // Tone code for `frame_index`. Forward-only: one frame of the active
  // event is consumed per call. Returns kSilenceToneCode once all events
  // are exhausted.
  uint16_t ToneForFrame(uint32_t frame_index);

  uint32_t event_index() const { return event_index_; }
  uint16_t frames_remaining_in_event() const { return frames_remaining_; }
  bool exhausted() const { return exhausted_; }
  bool has_source() const { return source_open_; }

 private:
  uint16_t AdvanceOneFrame();
  bool LoadNextEvent();

  stream::IByteSource* source_;
  bool source_open_ = false;
  bool exhausted_ = true;
  uint16_t tone_code_ = kSilenceToneCode;
  uint16_t frames_remaining_ = 0;
  uint32_t event_index_ = 0;
  uint32_t events_loaded_ = 0;
  uint32_t next_frame_ = 0;
};

}  // namespace monoplay::audio

#endif  // MONOPLAY_AUDIO_MELODY_CURSOR_HPP_
