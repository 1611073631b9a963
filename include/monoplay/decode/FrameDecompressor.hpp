// Repository: Monoplay
// Component: Frame Decompressor
// Purpose: Streaming zlib inflate of one compressed record directly into a
//          frame buffer's storage (no intermediate full-frame buffer).
// Copyright (c) 2025 Monoplay

#ifndef MONOPLAY_DECODE_FRAME_DECOMPRESSOR_HPP_
#define MONOPLAY_DECODE_FRAME_DECOMPRESSOR_HPP_

#include <cstddef>
#include <cstdint>
#include <string>

#include <zlib.h>

#include "monoplay/buffer/FrameBuffer.hpp"

namespace monoplay::decode {

enum class DecompressResult {
  kOk,            // Exactly MonoSize bytes written
  kSizeMismatch,  // Stream inflated to more or fewer than MonoSize bytes
  kMalformed      // zlib rejected the stream, or it ended early
};

const char* DecompressResultName(DecompressResult result);

// FrameDecompressor owns one inflate state for its whole lifetime.
// Init() allocates it (once); each Decompress() only resets it, so the
// steady-state cycle performs no heap allocation.
//
// Header detection: zlib or gzip wrapper (windowBits 15 + 32).
// On any failure the target buffer contents are unspecified; the caller
// substitutes the previous frame.
class FrameDecompressor {
 public:
  FrameDecompressor();
  ~FrameDecompressor();

  FrameDecompressor(const FrameDecompressor&) = delete;
  FrameDecompressor& operator=(const FrameDecompressor&) = delete;

  // Returns false if zlib cannot allocate its state.
  bool Init();

  DecompressResult Decompress(const uint8_t* payload, size_t payload_size,
                              buffer::FrameBuffer& into);

  // Total output bytes produced by the last call (diagnostics).
  size_t last_output_bytes() const { return last_output_bytes_; }
  // zlib's message for the last kMalformed result, if any.
  const std::string& last_error() const { return last_error_; }

 private:
  z_stream stream_;
  bool initialized_ = false;
  size_t last_output_bytes_ = 0;
  std::string last_error_;
};

}  // namespace monoplay::decode

#endif  // MONOPLAY_DECODE_FRAME_DECOMPRESSOR_HPP_
