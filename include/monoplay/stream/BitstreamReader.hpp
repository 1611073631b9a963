// Repository: Monoplay
// Component: Bitstream Reader
// Purpose: Pulls the next length-prefixed compressed frame record from a
//          byte source into a fixed scratch buffer.
// Copyright (c) 2025 Monoplay
//
// Record layout: u16 little-endian payload length, then `length` bytes of
// zlib-compressed frame data. No global header.

#ifndef MONOPLAY_STREAM_BITSTREAM_READER_HPP_
#define MONOPLAY_STREAM_BITSTREAM_READER_HPP_

#include <cstddef>
#include <cstdint>
#include <vector>

#include "monoplay/stream/IByteSource.hpp"

namespace monoplay::stream {

// ReadStatus separates end-of-stream from the fault classes.
enum class ReadStatus {
  kRecord,       // Payload available via payload()
  kEndOfStream,  // Clean end at a record boundary (not an error)
  kTruncated,    // Fewer bytes available than declared (fatal to the pass)
  kOversized,    // Declared length exceeds scratch capacity; payload skipped
  kIoError       // Source reported an I/O error (fatal to the pass)
};

const char* ReadStatusName(ReadStatus status);

struct RecordResult {
  ReadStatus status = ReadStatus::kEndOfStream;
  uint16_t declared_length = 0;  // Length prefix as read (0 if none)
  size_t bytes_read = 0;         // Payload bytes actually read or skipped
};

class BitstreamReader {
 public:
  // `source` must outlive the reader. The scratch buffer of
  // `max_record_bytes` is allocated here, once.
  BitstreamReader(IByteSource* source, size_t max_record_bytes);

  BitstreamReader(const BitstreamReader&) = delete;
  BitstreamReader& operator=(const BitstreamReader&) = delete;

  RecordResult NextRecord();

  // Payload of the last kRecord result. Valid until the next NextRecord().
  const uint8_t* payload() const { return scratch_.data(); }
  size_t payload_size() const { return payload_size_; }

  size_t capacity() const { return scratch_.size(); }
  uint64_t records_read() const { return records_read_; }

  // Forget per-pass counters (the source itself is re-opened by the owner).
  void Reset();

 private:
  IByteSource* source_;
  std::vector<uint8_t> scratch_;
  size_t payload_size_ = 0;
  uint64_t records_read_ = 0;
};

}  // namespace monoplay::stream

#endif  // MONOPLAY_STREAM_BITSTREAM_READER_HPP_
