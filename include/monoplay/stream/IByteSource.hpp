// Repository: Monoplay
// Component: Byte Source Interface
// Purpose: Sequential read access to a stored asset (video or melody stream).
//          Production: FileByteSource. Tests / preloaded assets: MemoryByteSource.
// Copyright (c) 2025 Monoplay

#ifndef MONOPLAY_STREAM_IBYTE_SOURCE_HPP_
#define MONOPLAY_STREAM_IBYTE_SOURCE_HPP_

#include <cstddef>
#include <cstdint>
#include <string>

namespace monoplay::stream {

// Forward-only byte stream. Open() positions at the first byte; re-opening
// after Close() starts again from the beginning (loop restart).
class IByteSource {
 public:
  virtual ~IByteSource() = default;

  // Returns false if the underlying storage cannot be opened.
  virtual bool Open() = 0;
  virtual void Close() = 0;
  virtual bool IsOpen() const = 0;

  // Reads up to `count` bytes into `dst`. A short count means end of data,
  // or an I/O error if HasError() is true afterwards.
  virtual size_t Read(uint8_t* dst, size_t count) = 0;

  // Discards up to `count` bytes. Same short-count semantics as Read().
  virtual size_t Skip(size_t count) = 0;

  // True once a read failed for a reason other than end of data.
  virtual bool HasError() const = 0;

  // Human-readable identifier for logging.
  virtual std::string Name() const = 0;
};

}  // namespace monoplay::stream

#endif  // MONOPLAY_STREAM_IBYTE_SOURCE_HPP_
