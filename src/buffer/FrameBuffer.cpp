// Repository: Monoplay
// Component: Frame Buffer
// Purpose: Fixed-size packed 1-bit-per-pixel frame storage (MONO_HLSB layout).
// Copyright (c) 2025 Monoplay

#include "monoplay/buffer/FrameBuffer.hpp"

#include <algorithm>
#include <cstring>

namespace monoplay::buffer {

const char* BufferIdName(BufferId id) {
  return id == BufferId::kA ? "A" : "B";
}

FrameBuffer::FrameBuffer(BufferId id, FrameGeometry geometry)
    : id_(id), geometry_(geometry), bytes_(geometry.MonoSize(), 0) {}

void FrameBuffer::Clear() {
  std::fill(bytes_.begin(), bytes_.end(), 0);
}

void FrameBuffer::CopyFrom(const FrameBuffer& other) {
  if (&other == this) return;
  const size_t n = std::min(bytes_.size(), other.bytes_.size());
  std::memcpy(bytes_.data(), other.bytes_.data(), n);
}

bool FrameBuffer::PixelAt(int32_t x, int32_t y) const {
  if (x < 0 || y < 0 || x >= geometry_.width || y >= geometry_.height) {
    return false;
  }
  const size_t index = static_cast<size_t>(y) * geometry_.StrideBytes() +
                       static_cast<size_t>(x / 8);
  return (bytes_[index] >> (7 - (x % 8))) & 0x1;
}

}  // namespace monoplay::buffer
