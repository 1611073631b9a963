// Repository: Monoplay
// Component: Bitstream Reader Tests
// Purpose: Verify record framing, end-of-stream versus truncation, oversized
//          record skipping, and I/O error reporting.
// Copyright (c) 2025 Monoplay

#include <gtest/gtest.h>

#include <cstdint>
#include <vector>

#include "monoplay/stream/BitstreamReader.hpp"
#include "monoplay/stream/MemoryByteSource.hpp"
#include "support/StreamFixtures.hpp"

namespace monoplay::tests {
namespace {

using stream::BitstreamReader;
using stream::MemoryByteSource;
using stream::ReadStatus;

std::vector<uint8_t> Bytes(size_t n, uint8_t seed) {
  std::vector<uint8_t> out(n);
  for (size_t i = 0; i < n; ++i) out[i] = static_cast<uint8_t>(seed + i);
  return out;
}

// =============================================================================
// Framing
// =============================================================================

TEST(BitstreamReaderTest, ReadsRecordsInOrder) {
  std::vector<uint8_t> data;
  AppendRecord(data, Bytes(5, 10));
  AppendRecord(data, Bytes(3, 50));
  MemoryByteSource source(data);
  ASSERT_TRUE(source.Open());
  BitstreamReader reader(&source, 16);

  auto r = reader.NextRecord();
  ASSERT_EQ(r.status, ReadStatus::kRecord);
  EXPECT_EQ(r.declared_length, 5);
  ASSERT_EQ(reader.payload_size(), 5u);
  EXPECT_EQ(reader.payload()[0], 10);
  EXPECT_EQ(reader.payload()[4], 14);

  r = reader.NextRecord();
  ASSERT_EQ(r.status, ReadStatus::kRecord);
  ASSERT_EQ(reader.payload_size(), 3u);
  EXPECT_EQ(reader.payload()[2], 52);

  EXPECT_EQ(reader.NextRecord().status, ReadStatus::kEndOfStream);
  EXPECT_EQ(reader.records_read(), 2u);
}

TEST(BitstreamReaderTest, LengthPrefixIsLittleEndian) {
  std::vector<uint8_t> data = {0x04, 0x01};  // 0x0104 = 260
  auto payload = Bytes(260, 0);
  data.insert(data.end(), payload.begin(), payload.end());
  MemoryByteSource source(data);
  ASSERT_TRUE(source.Open());
  BitstreamReader reader(&source, 300);

  auto r = reader.NextRecord();
  ASSERT_EQ(r.status, ReadStatus::kRecord);
  EXPECT_EQ(r.declared_length, 260);
  EXPECT_EQ(reader.payload_size(), 260u);
}

TEST(BitstreamReaderTest, EmptySourceIsEndOfStream) {
  MemoryByteSource source({});
  ASSERT_TRUE(source.Open());
  BitstreamReader reader(&source, 16);

  EXPECT_EQ(reader.NextRecord().status, ReadStatus::kEndOfStream);
  EXPECT_EQ(reader.NextRecord().status, ReadStatus::kEndOfStream);
}

TEST(BitstreamReaderTest, ZeroLengthRecordIsReturned) {
  std::vector<uint8_t> data = {0x00, 0x00};
  MemoryByteSource source(data);
  ASSERT_TRUE(source.Open());
  BitstreamReader reader(&source, 16);

  auto r = reader.NextRecord();
  EXPECT_EQ(r.status, ReadStatus::kRecord);
  EXPECT_EQ(reader.payload_size(), 0u);
}

// =============================================================================
// Truncation
// =============================================================================

TEST(BitstreamReaderTest, SingleTrailingByteIsTruncated) {
  std::vector<uint8_t> data;
  AppendRecord(data, Bytes(4, 1));
  data.push_back(0x07);
  MemoryByteSource source(data);
  ASSERT_TRUE(source.Open());
  BitstreamReader reader(&source, 16);

  ASSERT_EQ(reader.NextRecord().status, ReadStatus::kRecord);
  EXPECT_EQ(reader.NextRecord().status, ReadStatus::kTruncated);
}

TEST(BitstreamReaderTest, ShortPayloadIsTruncated) {
  std::vector<uint8_t> data;
  AppendU16Le(data, 10);
  auto partial = Bytes(6, 0);
  data.insert(data.end(), partial.begin(), partial.end());
  MemoryByteSource source(data);
  ASSERT_TRUE(source.Open());
  BitstreamReader reader(&source, 16);

  auto r = reader.NextRecord();
  EXPECT_EQ(r.status, ReadStatus::kTruncated);
  EXPECT_EQ(r.declared_length, 10);
  EXPECT_EQ(r.bytes_read, 6u);
}

// =============================================================================
// Oversized records
// =============================================================================

TEST(BitstreamReaderTest, OversizedRecordIsSkippedAndStreamStaysAligned) {
  std::vector<uint8_t> data;
  AppendRecord(data, Bytes(40, 0));
  AppendRecord(data, Bytes(4, 90));
  MemoryByteSource source(data);
  ASSERT_TRUE(source.Open());
  BitstreamReader reader(&source, 16);

  auto r = reader.NextRecord();
  EXPECT_EQ(r.status, ReadStatus::kOversized);
  EXPECT_EQ(r.declared_length, 40);
  EXPECT_EQ(r.bytes_read, 40u);
  EXPECT_EQ(reader.payload_size(), 0u);

  r = reader.NextRecord();
  ASSERT_EQ(r.status, ReadStatus::kRecord);
  EXPECT_EQ(reader.payload()[0], 90);
  EXPECT_EQ(reader.NextRecord().status, ReadStatus::kEndOfStream);
}

TEST(BitstreamReaderTest, OversizedRecordCutShortIsTruncated) {
  std::vector<uint8_t> data;
  AppendU16Le(data, 40);
  auto partial = Bytes(20, 0);
  data.insert(data.end(), partial.begin(), partial.end());
  MemoryByteSource source(data);
  ASSERT_TRUE(source.Open());
  BitstreamReader reader(&source, 16);

  EXPECT_EQ(reader.NextRecord().status, ReadStatus::kTruncated);
}

TEST(BitstreamReaderTest, ScratchCapacityIsFixed) {
  MemoryByteSource source({});
  BitstreamReader reader(&source, 2624);
  EXPECT_EQ(reader.capacity(), 2624u);
}

// =============================================================================
// I/O errors
// =============================================================================

TEST(BitstreamReaderTest, ReadErrorInPayloadIsIoError) {
  std::vector<uint8_t> data;
  AppendRecord(data, Bytes(4, 0));
  AppendRecord(data, Bytes(8, 0));
  MemoryByteSource source(data);
  source.SetErrorAtOffset(6 + 2 + 3);  // Inside the second payload
  ASSERT_TRUE(source.Open());
  BitstreamReader reader(&source, 16);

  ASSERT_EQ(reader.NextRecord().status, ReadStatus::kRecord);
  EXPECT_EQ(reader.NextRecord().status, ReadStatus::kIoError);
}

TEST(BitstreamReaderTest, ReadErrorAtPrefixIsIoError) {
  std::vector<uint8_t> data;
  AppendRecord(data, Bytes(4, 0));
  MemoryByteSource source(data);
  source.SetErrorAtOffset(0);
  ASSERT_TRUE(source.Open());
  BitstreamReader reader(&source, 16);

  EXPECT_EQ(reader.NextRecord().status, ReadStatus::kIoError);
}

TEST(BitstreamReaderTest, ResetClearsCounters) {
  std::vector<uint8_t> data;
  AppendRecord(data, Bytes(4, 0));
  MemoryByteSource source(data);
  ASSERT_TRUE(source.Open());
  BitstreamReader reader(&source, 16);
  ASSERT_EQ(reader.NextRecord().status, ReadStatus::kRecord);

  reader.Reset();
  EXPECT_EQ(reader.records_read(), 0u);
  EXPECT_EQ(reader.payload_size(), 0u);

  ASSERT_TRUE(source.Open());
  EXPECT_EQ(reader.NextRecord().status, ReadStatus::kRecord);
}

}  // namespace
}  // namespace monoplay::tests
