// Repository: Monoplay
// Component: Melody Cursor
// Purpose: Walks the run-length-encoded tone stream in lockstep with the
//          video frame index, yielding the active tone for each frame.
// Copyright (c) 2025 Monoplay

#include "monoplay/audio/MelodyCursor.hpp"

#include <sstream>

#include "monoplay/util/Logger.hpp"

namespace monoplay::audio {

using monoplay::util::Logger;

MelodyCursor::MelodyCursor(stream::IByteSource* source) : source_(source) {}

void MelodyCursor::Reset() {
  Close();
  tone_code_ = kSilenceToneCode;
  frames_remaining_ = 0;
  event_index_ = 0;
  events_loaded_ = 0;
  next_frame_ = 0;
  exhausted_ = true;

  if (source_ == nullptr) {
    Logger::Info("[Melody] No melody source, playing silent");
    return;
  }
  if (!source_->Open()) {
    std::ostringstream oss;
    oss << "[Melody] Melody " << source_->Name()
        << " unavailable, playing silent";
    Logger::Warn(oss.str());
    return;
  }
  source_open_ = true;
  exhausted_ = false;
}

void MelodyCursor::Close() {
  if (source_open_ && source_ != nullptr) {
    source_->Close();
  }
  source_open_ = false;
}

uint16_t MelodyCursor::ToneForFrame(uint32_t frame_index) {
  if (frame_index < next_frame_) {
    std::ostringstream oss;
    oss << "[Melody] Frame " << frame_index << " requested behind cursor at "
        << next_frame_ << "; holding current tone";
    Logger::Warn(oss.str());
    return exhausted_ ? kSilenceToneCode : tone_code_;
  }
  // Catch up over frames that were never requested.
  while (next_frame_ < frame_index) {
    AdvanceOneFrame();
  }
  return AdvanceOneFrame();
}

uint16_t MelodyCursor::AdvanceOneFrame() {
  ++next_frame_;
  while (frames_remaining_ == 0) {
    if (!LoadNextEvent()) {
      tone_code_ = kSilenceToneCode;
      return kSilenceToneCode;
    }
  }
  --frames_remaining_;
  return tone_code_;
}

bool MelodyCursor::LoadNextEvent() {
  if (exhausted_) return false;

  uint8_t record[kMelodyRecordBytes] = {0, 0, 0, 0};
  const size_t got = source_->Read(record, sizeof(record));
  if (got < sizeof(record)) {
    if (source_->HasError()) {
      std::ostringstream oss;
      oss << "[Melody] Read error after " << events_loaded_
          << " events; silent from here";
      Logger::Warn(oss.str());
    } else if (got > 0) {
      std::ostringstream oss;
      oss << "[Melody] Ignoring trailing partial record (" << got << " bytes)";
      Logger::Warn(oss.str());
    }
    exhausted_ = true;
    if (events_loaded_ > 0) {
      event_index_ = events_loaded_;
    }
    return false;
  }

  MelodyEvent event;
  event.tone_code = static_cast<uint16_t>(record[0] | (record[1] << 8));
  event.duration_frames = static_cast<uint16_t>(record[2] | (record[3] << 8));

  event_index_ = events_loaded_;
  ++events_loaded_;
  tone_code_ = event.tone_code;
  frames_remaining_ = event.duration_frames;
  return true;
}

}  // namespace monoplay::audio
