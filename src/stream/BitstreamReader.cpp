// Repository: Monoplay
// Component: Bitstream Reader
// Purpose: Pulls the next length-prefixed compressed frame record from a
//          byte source into a fixed scratch buffer.
// Copyright (c) 2025 Monoplay

#include "monoplay/stream/BitstreamReader.hpp"

#include <sstream>

#include "monoplay/util/Logger.hpp"

namespace monoplay::stream {

using monoplay::util::Logger;

const char* ReadStatusName(ReadStatus status) {
  switch (status) {
    case ReadStatus::kRecord:
      return "RECORD";
    case ReadStatus::kEndOfStream:
      return "END_OF_STREAM";
    case ReadStatus::kTruncated:
      return "TRUNCATED";
    case ReadStatus::kOversized:
      return "OVERSIZED";
    case ReadStatus::kIoError:
      return "IO_ERROR";
  }
  return "UNKNOWN";
}

BitstreamReader::BitstreamReader(IByteSource* source, size_t max_record_bytes)
    : source_(source), scratch_(max_record_bytes, 0) {}

void BitstreamReader::Reset() {
  payload_size_ = 0;
  records_read_ = 0;
}

RecordResult BitstreamReader::NextRecord() {
  RecordResult result;
  payload_size_ = 0;

  uint8_t prefix[2] = {0, 0};
  const size_t got = source_->Read(prefix, sizeof(prefix));
  if (source_->HasError()) {
    result.status = ReadStatus::kIoError;
    return result;
  }
  if (got == 0) {
    result.status = ReadStatus::kEndOfStream;
    return result;
  }
  if (got < sizeof(prefix)) {
    std::ostringstream oss;
    oss << "[Reader] Truncated length prefix at record " << records_read_
        << " (1 of 2 bytes)";
    Logger::Warn(oss.str());
    result.status = ReadStatus::kTruncated;
    return result;
  }

  const uint16_t length =
      static_cast<uint16_t>(prefix[0] | (static_cast<uint16_t>(prefix[1]) << 8));
  result.declared_length = length;

  if (length > scratch_.size()) {
    // Skip the payload so the next record boundary stays aligned.
    result.bytes_read = source_->Skip(length);
    if (source_->HasError()) {
      result.status = ReadStatus::kIoError;
    } else if (result.bytes_read < length) {
      result.status = ReadStatus::kTruncated;
    } else {
      result.status = ReadStatus::kOversized;
      ++records_read_;
    }
    std::ostringstream oss;
    oss << "[Reader] Record " << records_read_ << " declares " << length
        << " bytes, capacity " << scratch_.size() << " -> "
        << ReadStatusName(result.status);
    Logger::Warn(oss.str());
    return result;
  }

  result.bytes_read = length > 0 ? source_->Read(scratch_.data(), length) : 0;
  if (source_->HasError()) {
    result.status = ReadStatus::kIoError;
    return result;
  }
  if (result.bytes_read < length) {
    std::ostringstream oss;
    oss << "[Reader] Truncated payload at record " << records_read_
        << ": declared=" << length << " available=" << result.bytes_read;
    Logger::Warn(oss.str());
    result.status = ReadStatus::kTruncated;
    return result;
  }

  payload_size_ = length;
  ++records_read_;
  result.status = ReadStatus::kRecord;
  return result;
}

}  // namespace monoplay::stream
