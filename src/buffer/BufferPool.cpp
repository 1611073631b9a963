// Repository: Monoplay
// Component: Buffer Pool (double buffer)
// Purpose: Owns the two frame buffers and alternates front/back roles.
// Copyright (c) 2025 Monoplay

#include "monoplay/buffer/BufferPool.hpp"

namespace monoplay::buffer {

BufferPool::BufferPool(FrameGeometry geometry)
    : a_(BufferId::kA, geometry), b_(BufferId::kB, geometry) {}

FrameBuffer& BufferPool::BackBuffer() {
  return Get(BackRole());
}

const FrameBuffer& BufferPool::FrontBuffer() const {
  return Get(front_);
}

void BufferPool::Swap() {
  front_ = BackRole();
  ++swap_count_;
}

void BufferPool::Reset() {
  front_ = BufferId::kA;
  swap_count_ = 0;
  a_.Clear();
  b_.Clear();
}

}  // namespace monoplay::buffer
