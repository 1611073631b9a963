// Repository: Monoplay
// Component: Display Sink Tests
// Purpose: Verify the asynchronous transfer decorator (one transfer in
//          flight, deferred fault reporting) and the PBM frame dump.
// Copyright (c) 2025 Monoplay

#include <gtest/gtest.h>

#include <cstdint>
#include <cstdio>
#include <fstream>
#include <iterator>
#include <memory>
#include <string>
#include <vector>

#include "monoplay/buffer/FrameBuffer.hpp"
#include "monoplay/output/AsyncDisplaySink.h"
#include "monoplay/output/NullDisplaySink.h"
#include "monoplay/output/PbmSequenceSink.h"
#include "support/RecordingDisplaySink.h"

namespace monoplay::tests {
namespace {

using buffer::BufferId;
using buffer::FrameBuffer;
using buffer::FrameGeometry;
using output::AsyncDisplaySink;
using output::PbmSequenceSink;

FrameGeometry SmallGeometry() {
  FrameGeometry g;
  g.width = 16;
  g.height = 2;
  return g;
}

// =============================================================================
// AsyncDisplaySink
// =============================================================================

class AsyncDisplaySinkTest : public ::testing::Test {
 protected:
  void SetUp() override {
    auto inner = std::make_unique<RecordingDisplaySink>();
    inner_ = inner.get();
    sink_ = std::make_unique<AsyncDisplaySink>(std::move(inner));
  }

  RecordingDisplaySink* inner_ = nullptr;
  std::unique_ptr<AsyncDisplaySink> sink_;
};

TEST_F(AsyncDisplaySinkTest, TransferCompletesBeforeWaitReturns) {
  FrameBuffer frame(BufferId::kA, SmallGeometry());
  frame.data()[0] = 0x42;

  ASSERT_TRUE(sink_->Blit(frame));
  ASSERT_TRUE(sink_->WaitTransferDone());

  ASSERT_EQ(inner_->FrameCount(), 1u);
  EXPECT_EQ(inner_->frames()[0].bytes[0], 0x42);
  EXPECT_EQ(sink_->transfers_completed(), 1u);
}

TEST_F(AsyncDisplaySinkTest, AlternatingBuffersAreTransferredInOrder) {
  FrameBuffer a(BufferId::kA, SmallGeometry());
  FrameBuffer b(BufferId::kB, SmallGeometry());

  for (uint8_t i = 0; i < 10; ++i) {
    FrameBuffer& back = (i % 2 == 0) ? a : b;
    // Only written after the previous transfer of this buffer was waited out.
    ASSERT_TRUE(sink_->WaitTransferDone());
    back.data()[0] = i;
    ASSERT_TRUE(sink_->Blit(back));
  }
  ASSERT_TRUE(sink_->WaitTransferDone());

  ASSERT_EQ(inner_->FrameCount(), 10u);
  for (uint8_t i = 0; i < 10; ++i) {
    EXPECT_EQ(inner_->frames()[i].bytes[0], i);
    EXPECT_EQ(inner_->frames()[i].buffer_id, i % 2 == 0 ? BufferId::kA : BufferId::kB);
  }
}

TEST_F(AsyncDisplaySinkTest, FailedTransferIsReportedOnce) {
  inner_->FailBlitAt(0);
  FrameBuffer frame(BufferId::kA, SmallGeometry());

  EXPECT_TRUE(sink_->Blit(frame));  // Queued
  EXPECT_FALSE(sink_->WaitTransferDone());
  EXPECT_TRUE(sink_->WaitTransferDone());
}

TEST_F(AsyncDisplaySinkTest, FailureSurfacesOnNextBlit) {
  inner_->FailBlitAt(0);
  FrameBuffer frame(BufferId::kA, SmallGeometry());

  EXPECT_TRUE(sink_->Blit(frame));
  EXPECT_FALSE(sink_->Blit(frame));
}

TEST_F(AsyncDisplaySinkTest, BacklightIsForwarded) {
  EXPECT_TRUE(sink_->SetBacklight(128));
  ASSERT_EQ(inner_->backlight_calls().size(), 1u);
  EXPECT_EQ(inner_->backlight_calls()[0], 128);
  EXPECT_TRUE(sink_->SupportsAsyncTransfer());
  EXPECT_EQ(sink_->GetName(), "async(recording)");
}

TEST(AsyncDisplaySinkLifetimeTest, DestroyWithTransferInFlight) {
  FrameBuffer frame(BufferId::kA, SmallGeometry());
  {
    AsyncDisplaySink sink(std::make_unique<output::NullDisplaySink>());
    ASSERT_TRUE(sink.Blit(frame));
  }
  SUCCEED();
}

// =============================================================================
// PbmSequenceSink
// =============================================================================

class PbmSequenceSinkTest : public ::testing::Test {
 protected:
  void TearDown() override {
    for (const auto& p : written_) std::remove(p.c_str());
  }

  std::vector<uint8_t> ReadFile(const std::string& path) {
    written_.push_back(path);
    std::ifstream in(path, std::ios::binary);
    return std::vector<uint8_t>(std::istreambuf_iterator<char>(in),
                                std::istreambuf_iterator<char>());
  }

  std::vector<std::string> written_;
};

TEST_F(PbmSequenceSinkTest, WritesInvertedP4Frames) {
  PbmSequenceSink sink(::testing::TempDir());
  FrameBuffer frame(BufferId::kA, SmallGeometry());
  frame.data()[0] = 0xF0;
  frame.data()[3] = 0x01;

  const std::string path = sink.NextPath();
  ASSERT_TRUE(sink.Blit(frame));
  EXPECT_EQ(sink.frames_written(), 1u);
  EXPECT_NE(sink.NextPath(), path);

  const auto bytes = ReadFile(path);
  const std::string header = "P4\n16 2\n";
  ASSERT_EQ(bytes.size(), header.size() + 4);
  EXPECT_EQ(std::string(bytes.begin(), bytes.begin() + header.size()), header);
  EXPECT_EQ(bytes[header.size() + 0], 0x0F);
  EXPECT_EQ(bytes[header.size() + 1], 0xFF);
  EXPECT_EQ(bytes[header.size() + 3], 0xFE);
}

TEST_F(PbmSequenceSinkTest, BacklightOffWritesBlackFrame) {
  PbmSequenceSink sink(::testing::TempDir());
  FrameBuffer frame(BufferId::kA, SmallGeometry());
  ASSERT_TRUE(sink.SetBacklight(0));

  const std::string path = sink.NextPath();
  ASSERT_TRUE(sink.Blit(frame));
  const auto bytes = ReadFile(path);
  ASSERT_FALSE(bytes.empty());
  EXPECT_EQ(bytes.back(), 0xFF);
}

TEST_F(PbmSequenceSinkTest, UnwritableDirectoryFailsBlit) {
  PbmSequenceSink sink("/nonexistent/monoplay/frames");
  FrameBuffer frame(BufferId::kA, SmallGeometry());
  EXPECT_FALSE(sink.Blit(frame));
  EXPECT_EQ(sink.frames_written(), 0u);
}

}  // namespace
}  // namespace monoplay::tests
