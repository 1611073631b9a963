// Repository: Monoplay
// Component: Frame Decompressor
// Purpose: Streaming zlib inflate of one compressed record directly into a
//          frame buffer's storage (no intermediate full-frame buffer).
// Copyright (c) 2025 Monoplay

#include "monoplay/decode/FrameDecompressor.hpp"

#include <cstring>
#include <sstream>

#include "monoplay/util/Logger.hpp"

namespace monoplay::decode {

using monoplay::util::Logger;

namespace {
// 15-bit window, +32 = accept either a zlib or a gzip header.
constexpr int kWindowBitsAutoHeader = 15 + 32;
}  // namespace

const char* DecompressResultName(DecompressResult result) {
  switch (result) {
    case DecompressResult::kOk:
      return "OK";
    case DecompressResult::kSizeMismatch:
      return "SIZE_MISMATCH";
    case DecompressResult::kMalformed:
      return "MALFORMED";
  }
  return "UNKNOWN";
}

FrameDecompressor::FrameDecompressor() {
  std::memset(&stream_, 0, sizeof(stream_));
}

FrameDecompressor::~FrameDecompressor() {
  if (initialized_) {
    inflateEnd(&stream_);
  }
}

bool FrameDecompressor::Init() {
  if (initialized_) return true;
  std::memset(&stream_, 0, sizeof(stream_));
  stream_.zalloc = Z_NULL;
  stream_.zfree = Z_NULL;
  stream_.opaque = Z_NULL;
  const int rc = inflateInit2(&stream_, kWindowBitsAutoHeader);
  if (rc != Z_OK) {
    std::ostringstream oss;
    oss << "[Decompressor] inflateInit2 failed rc=" << rc;
    Logger::Error(oss.str());
    return false;
  }
  initialized_ = true;
  return true;
}

DecompressResult FrameDecompressor::Decompress(const uint8_t* payload,
                                               size_t payload_size,
                                               buffer::FrameBuffer& into) {
  last_output_bytes_ = 0;
  last_error_.clear();

  if (!initialized_ && !Init()) {
    last_error_ = "inflate state unavailable";
    return DecompressResult::kMalformed;
  }
  if (inflateReset(&stream_) != Z_OK) {
    last_error_ = "inflateReset failed";
    return DecompressResult::kMalformed;
  }

  // zlib's API is not const-correct on next_in.
  stream_.next_in = const_cast<Bytef*>(payload);
  stream_.avail_in = static_cast<uInt>(payload_size);
  stream_.next_out = into.data();
  stream_.avail_out = static_cast<uInt>(into.size());

  const int rc = inflate(&stream_, Z_FINISH);
  last_output_bytes_ = into.size() - stream_.avail_out;

  if (rc == Z_STREAM_END) {
    if (stream_.avail_out != 0) {
      return DecompressResult::kSizeMismatch;  // Too short
    }
    return DecompressResult::kOk;
  }

  if (rc == Z_BUF_ERROR && stream_.avail_out == 0 && stream_.avail_in > 0) {
    // Buffer full but the stream wants to produce more.
    return DecompressResult::kSizeMismatch;
  }
  if (rc == Z_BUF_ERROR && stream_.avail_out == 0) {
    // Buffer exactly full and input exhausted before the end marker:
    // ambiguous between "longer frame" and "cut stream"; either way the
    // record is not a valid frame.
    return DecompressResult::kSizeMismatch;
  }

  last_error_ = stream_.msg != nullptr ? stream_.msg : "stream ended early";
  return DecompressResult::kMalformed;
}

}  // namespace monoplay::decode
