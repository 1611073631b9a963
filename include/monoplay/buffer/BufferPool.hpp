// Repository: Monoplay
// Component: Buffer Pool (double buffer)
// Purpose: Owns the two frame buffers and alternates front/back roles.
// Copyright (c) 2025 Monoplay
//
// Role alternation is the only synchronization: between two Swap() calls
// the front buffer is only read (display sink) and the back buffer is only
// written (decompressor or repeat-frame copy). Single execution context,
// no locks.

#ifndef MONOPLAY_BUFFER_BUFFER_POOL_HPP_
#define MONOPLAY_BUFFER_BUFFER_POOL_HPP_

#include <cstdint>

#include "monoplay/buffer/FrameBuffer.hpp"

namespace monoplay::buffer {

class BufferPool {
 public:
  explicit BufferPool(FrameGeometry geometry);

  BufferPool(const BufferPool&) = delete;
  BufferPool& operator=(const BufferPool&) = delete;

  // Buffer currently being filled for the next display.
  FrameBuffer& BackBuffer();

  // Buffer most recently handed to (or being transferred by) the sink.
  const FrameBuffer& FrontBuffer() const;

  // Flip roles: the freshly filled back buffer becomes front.
  void Swap();

  BufferId FrontRole() const { return front_; }
  BufferId BackRole() const {
    return front_ == BufferId::kA ? BufferId::kB : BufferId::kA;
  }

  // Restore front = A, back = B and clear both buffers (pass start).
  void Reset();

  uint64_t swap_count() const { return swap_count_; }
  const FrameGeometry& geometry() const { return a_.geometry(); }

 private:
  FrameBuffer& Get(BufferId id) { return id == BufferId::kA ? a_ : b_; }
  const FrameBuffer& Get(BufferId id) const {
    return id == BufferId::kA ? a_ : b_;
  }

  FrameBuffer a_;
  FrameBuffer b_;
  BufferId front_ = BufferId::kA;
  uint64_t swap_count_ = 0;
};

}  // namespace monoplay::buffer

#endif  // MONOPLAY_BUFFER_BUFFER_POOL_HPP_
