// Repository: Monoplay
// Component: Memory Byte Source
// Purpose: IByteSource over an owned byte vector (preloaded assets, tests).
// Copyright (c) 2025 Monoplay

#ifndef MONOPLAY_STREAM_MEMORY_BYTE_SOURCE_HPP_
#define MONOPLAY_STREAM_MEMORY_BYTE_SOURCE_HPP_

#include <cstdint>
#include <string>
#include <vector>

#include "monoplay/stream/IByteSource.hpp"

namespace monoplay::stream {

class MemoryByteSource : public IByteSource {
 public:
  explicit MemoryByteSource(std::vector<uint8_t> bytes,
                            std::string name = "memory");

  bool Open() override;
  void Close() override;
  bool IsOpen() const override { return open_; }
  size_t Read(uint8_t* dst, size_t count) override;
  size_t Skip(size_t count) override;
  bool HasError() const override { return error_; }
  std::string Name() const override { return name_; }

  // Test hooks: make Open() fail, or make reads fail once the read
  // position reaches `offset` (simulates a failing storage card).
  void SetOpenFails(bool fails) { open_fails_ = fails; }
  void SetErrorAtOffset(size_t offset) { error_at_offset_ = offset; }

  // Number of successful Open() calls (one per playback pass).
  int open_count() const { return open_count_; }
  size_t position() const { return pos_; }

 private:
  size_t Available() const;

  std::vector<uint8_t> bytes_;
  std::string name_;
  size_t pos_ = 0;
  bool open_ = false;
  bool error_ = false;
  bool open_fails_ = false;
  size_t error_at_offset_ = static_cast<size_t>(-1);
  int open_count_ = 0;
};

}  // namespace monoplay::stream

#endif  // MONOPLAY_STREAM_MEMORY_BYTE_SOURCE_HPP_
