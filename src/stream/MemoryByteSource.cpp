// Repository: Monoplay
// Component: Memory Byte Source
// Purpose: IByteSource over an owned byte vector (preloaded assets, tests).
// Copyright (c) 2025 Monoplay

#include "monoplay/stream/MemoryByteSource.hpp"

#include <algorithm>
#include <cstring>
#include <utility>

namespace monoplay::stream {

MemoryByteSource::MemoryByteSource(std::vector<uint8_t> bytes, std::string name)
    : bytes_(std::move(bytes)), name_(std::move(name)) {}

bool MemoryByteSource::Open() {
  if (open_fails_) {
    open_ = false;
    return false;
  }
  pos_ = 0;
  error_ = false;
  open_ = true;
  ++open_count_;
  return true;
}

void MemoryByteSource::Close() {
  open_ = false;
}

size_t MemoryByteSource::Available() const {
  const size_t end = std::min(bytes_.size(), error_at_offset_);
  return end > pos_ ? end - pos_ : 0;
}

size_t MemoryByteSource::Read(uint8_t* dst, size_t count) {
  if (!open_ || error_) return 0;
  const size_t n = std::min(count, Available());
  if (n > 0) {
    std::memcpy(dst, bytes_.data() + pos_, n);
    pos_ += n;
  }
  if (n < count && pos_ >= error_at_offset_ && pos_ < bytes_.size()) {
    error_ = true;
  }
  return n;
}

size_t MemoryByteSource::Skip(size_t count) {
  if (!open_ || error_) return 0;
  const size_t n = std::min(count, Available());
  pos_ += n;
  if (n < count && pos_ >= error_at_offset_ && pos_ < bytes_.size()) {
    error_ = true;
  }
  return n;
}

}  // namespace monoplay::stream
