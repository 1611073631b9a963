// Repository: Monoplay
// Component: PBM Sequence Sink
// Purpose: Host sink that writes every displayed frame as a binary PBM (P4)
//          image, for inspecting playback without the panel.
// Copyright (c) 2025 Monoplay

#ifndef MONOPLAY_OUTPUT_PBM_SEQUENCE_SINK_H_
#define MONOPLAY_OUTPUT_PBM_SEQUENCE_SINK_H_

#include <cstdint>
#include <string>
#include <vector>

#include "monoplay/output/IDisplaySink.h"

namespace monoplay::output {

// Files are named <directory>/frame_<NNNNNN>.pbm, numbered from 0 across
// the sink's lifetime (loop passes continue the numbering).
//
// Frame bit 1 is a lit pixel; PBM bit 1 is black, so rows are inverted on
// write. Backlight level 0 writes an all-black frame.
class PbmSequenceSink : public IDisplaySink {
 public:
  explicit PbmSequenceSink(std::string directory);

  bool Blit(const buffer::FrameBuffer& frame) override;
  bool SetBacklight(uint8_t level) override;
  std::string GetName() const override;

  uint64_t frames_written() const { return frames_written_; }

  // Path the next Blit() will write to.
  std::string NextPath() const;

 private:
  std::string directory_;
  uint8_t backlight_ = 255;
  uint64_t frames_written_ = 0;
  std::vector<uint8_t> row_;
};

}  // namespace monoplay::output

#endif  // MONOPLAY_OUTPUT_PBM_SEQUENCE_SINK_H_
