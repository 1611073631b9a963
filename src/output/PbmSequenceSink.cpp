// Repository: Monoplay
// Component: PBM Sequence Sink
// Purpose: Host sink that writes every displayed frame as a binary PBM (P4)
//          image, for inspecting playback without the panel.
// Copyright (c) 2025 Monoplay

#include "monoplay/output/PbmSequenceSink.h"

#include <fstream>
#include <iomanip>
#include <sstream>
#include <utility>

#include "monoplay/buffer/FrameBuffer.hpp"
#include "monoplay/util/Logger.hpp"

namespace monoplay::output {

using monoplay::util::Logger;

PbmSequenceSink::PbmSequenceSink(std::string directory)
    : directory_(std::move(directory)) {}

std::string PbmSequenceSink::GetName() const {
  return "pbm:" + directory_;
}

std::string PbmSequenceSink::NextPath() const {
  std::ostringstream oss;
  oss << directory_ << "/frame_" << std::setw(6) << std::setfill('0')
      << frames_written_ << ".pbm";
  return oss.str();
}

bool PbmSequenceSink::SetBacklight(uint8_t level) {
  backlight_ = level;
  return true;
}

bool PbmSequenceSink::Blit(const buffer::FrameBuffer& frame) {
  const auto& geometry = frame.geometry();
  const size_t stride = geometry.StrideBytes();
  const std::string path = NextPath();

  std::ofstream out(path, std::ios::out | std::ios::binary | std::ios::trunc);
  if (!out.is_open()) {
    Logger::Error("[PbmSink] Cannot create " + path);
    return false;
  }
  out << "P4\n" << geometry.width << " " << geometry.height << "\n";

  row_.resize(stride);
  for (int32_t y = 0; y < geometry.height; ++y) {
    const uint8_t* src = frame.data() + static_cast<size_t>(y) * stride;
    for (size_t i = 0; i < stride; ++i) {
      row_[i] = backlight_ == 0 ? 0xFF : static_cast<uint8_t>(~src[i]);
    }
    out.write(reinterpret_cast<const char*>(row_.data()),
              static_cast<std::streamsize>(stride));
  }
  out.flush();
  if (!out.good()) {
    Logger::Error("[PbmSink] Write failed for " + path);
    return false;
  }
  ++frames_written_;
  return true;
}

}  // namespace monoplay::output
