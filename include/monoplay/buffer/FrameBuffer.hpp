// Repository: Monoplay
// Component: Frame Buffer
// Purpose: Fixed-size packed 1-bit-per-pixel frame storage (MONO_HLSB layout).
// Copyright (c) 2025 Monoplay

#ifndef MONOPLAY_BUFFER_FRAME_BUFFER_HPP_
#define MONOPLAY_BUFFER_FRAME_BUFFER_HPP_

#include <cstddef>
#include <cstdint>
#include <vector>

namespace monoplay::buffer {

// Identity of one of the two pool buffers. The role a buffer plays (front
// or back) changes every cycle; its identity never does.
enum class BufferId : uint8_t {
  kA = 0,
  kB = 1,
};

const char* BufferIdName(BufferId id);

// Frame dimensions shared out-of-band between encoder and player.
// Rows are padded to a whole byte: MonoSize = height * ceil(width / 8).
struct FrameGeometry {
  int32_t width = 128;
  int32_t height = 160;

  size_t StrideBytes() const {
    return static_cast<size_t>((width + 7) / 8);
  }
  size_t MonoSize() const {
    return StrideBytes() * static_cast<size_t>(height);
  }
};

// FrameBuffer owns exactly MonoSize bytes, allocated once at construction.
// Pixel (x, y) lives in byte y * stride + x / 8, bit (7 - x % 8); a set bit
// is a lit pixel.
class FrameBuffer {
 public:
  FrameBuffer(BufferId id, FrameGeometry geometry);

  FrameBuffer(const FrameBuffer&) = delete;
  FrameBuffer& operator=(const FrameBuffer&) = delete;

  BufferId id() const { return id_; }
  const FrameGeometry& geometry() const { return geometry_; }

  uint8_t* data() { return bytes_.data(); }
  const uint8_t* data() const { return bytes_.data(); }
  size_t size() const { return bytes_.size(); }

  // Fill with dark pixels (all bits clear).
  void Clear();

  // Copy the full contents of another buffer of identical geometry.
  void CopyFrom(const FrameBuffer& other);

  bool PixelAt(int32_t x, int32_t y) const;

 private:
  BufferId id_;
  FrameGeometry geometry_;
  std::vector<uint8_t> bytes_;
};

}  // namespace monoplay::buffer

#endif  // MONOPLAY_BUFFER_FRAME_BUFFER_HPP_
