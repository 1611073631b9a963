// Repository: Monoplay
// Component: Buffer Pool Tests
// Purpose: Verify role alternation, pass reset, and packed pixel layout.
// Copyright (c) 2025 Monoplay

#include <gtest/gtest.h>

#include "monoplay/buffer/BufferPool.hpp"
#include "monoplay/buffer/FrameBuffer.hpp"

namespace monoplay::tests {
namespace {

using buffer::BufferId;
using buffer::BufferPool;
using buffer::FrameBuffer;
using buffer::FrameGeometry;

FrameGeometry Geometry(int32_t w, int32_t h) {
  FrameGeometry g;
  g.width = w;
  g.height = h;
  return g;
}

TEST(FrameGeometryTest, MonoSizePadsRowsToWholeBytes) {
  EXPECT_EQ(Geometry(128, 160).MonoSize(), 2560u);
  EXPECT_EQ(Geometry(10, 3).StrideBytes(), 2u);
  EXPECT_EQ(Geometry(10, 3).MonoSize(), 6u);
  EXPECT_EQ(Geometry(8, 1).MonoSize(), 1u);
}

TEST(FrameBufferTest, PixelAtReadsMsbFirst) {
  FrameBuffer fb(BufferId::kA, Geometry(16, 2));
  fb.data()[0] = 0x80;  // (0,0)
  fb.data()[3] = 0x01;  // (15,1)

  EXPECT_TRUE(fb.PixelAt(0, 0));
  EXPECT_FALSE(fb.PixelAt(1, 0));
  EXPECT_TRUE(fb.PixelAt(15, 1));
  EXPECT_FALSE(fb.PixelAt(8, 1));
  EXPECT_FALSE(fb.PixelAt(16, 0));
  EXPECT_FALSE(fb.PixelAt(-1, 0));
}

TEST(FrameBufferTest, ClearAndCopy) {
  FrameBuffer a(BufferId::kA, Geometry(16, 2));
  FrameBuffer b(BufferId::kB, Geometry(16, 2));
  a.data()[2] = 0x5A;

  b.CopyFrom(a);
  EXPECT_EQ(b.data()[2], 0x5A);
  b.Clear();
  EXPECT_EQ(b.data()[2], 0);
  EXPECT_EQ(a.data()[2], 0x5A);
}

TEST(BufferPoolTest, StartsWithFrontA) {
  BufferPool pool(Geometry(16, 2));
  EXPECT_EQ(pool.FrontRole(), BufferId::kA);
  EXPECT_EQ(pool.BackRole(), BufferId::kB);
  EXPECT_EQ(pool.BackBuffer().id(), BufferId::kB);
  EXPECT_EQ(pool.FrontBuffer().id(), BufferId::kA);
}

TEST(BufferPoolTest, SwapAlternatesRoles) {
  BufferPool pool(Geometry(16, 2));
  for (int i = 0; i < 10; ++i) {
    const BufferId back_before = pool.BackRole();
    pool.Swap();
    EXPECT_EQ(pool.FrontRole(), back_before);
    EXPECT_NE(pool.FrontRole(), pool.BackRole());
    EXPECT_NE(&pool.FrontBuffer(), &pool.BackBuffer());
  }
  EXPECT_EQ(pool.swap_count(), 10u);
}

TEST(BufferPoolTest, FilledBackBecomesFront) {
  BufferPool pool(Geometry(16, 2));
  pool.BackBuffer().data()[0] = 0xAB;
  pool.Swap();
  EXPECT_EQ(pool.FrontBuffer().data()[0], 0xAB);
}

TEST(BufferPoolTest, ResetRestoresInitialRolesAndClears) {
  BufferPool pool(Geometry(16, 2));
  pool.BackBuffer().data()[1] = 0xFF;
  pool.Swap();
  pool.BackBuffer().data()[1] = 0xEE;

  pool.Reset();
  EXPECT_EQ(pool.FrontRole(), BufferId::kA);
  EXPECT_EQ(pool.swap_count(), 0u);
  EXPECT_EQ(pool.FrontBuffer().data()[1], 0);
  EXPECT_EQ(pool.BackBuffer().data()[1], 0);
}

}  // namespace
}  // namespace monoplay::tests
