// Repository: Monoplay
// Component: File Byte Source
// Purpose: IByteSource over a file on local storage.
// Copyright (c) 2025 Monoplay

#include "monoplay/stream/FileByteSource.hpp"

#include <algorithm>
#include <sstream>
#include <utility>

#include "monoplay/util/Logger.hpp"

namespace monoplay::stream {

using monoplay::util::Logger;

namespace {
// Skip() discards through a small stack buffer; ifstream::ignore cannot
// distinguish EOF from a read error as cleanly.
constexpr size_t kSkipChunkBytes = 256;
}  // namespace

FileByteSource::FileByteSource(std::string path) : path_(std::move(path)) {}

FileByteSource::~FileByteSource() {
  Close();
}

bool FileByteSource::Open() {
  Close();
  error_ = false;
  file_.open(path_, std::ios::in | std::ios::binary);
  if (!file_.is_open()) {
    std::ostringstream oss;
    oss << "[FileByteSource] Cannot open " << path_;
    Logger::Debug(oss.str());
    return false;
  }
  return true;
}

void FileByteSource::Close() {
  if (file_.is_open()) {
    file_.close();
  }
  file_.clear();
}

bool FileByteSource::IsOpen() const {
  return file_.is_open();
}

size_t FileByteSource::Read(uint8_t* dst, size_t count) {
  if (!file_.is_open() || error_ || count == 0) return 0;

  file_.read(reinterpret_cast<char*>(dst), static_cast<std::streamsize>(count));
  const auto got = static_cast<size_t>(file_.gcount());
  if (got < count && file_.bad()) {
    error_ = true;
    std::ostringstream oss;
    oss << "[FileByteSource] Read error on " << path_
        << " after " << got << "/" << count << " bytes";
    Logger::Error(oss.str());
  }
  return got;
}

size_t FileByteSource::Skip(size_t count) {
  uint8_t scratch[kSkipChunkBytes];
  size_t skipped = 0;
  while (skipped < count) {
    const size_t want = std::min(kSkipChunkBytes, count - skipped);
    const size_t got = Read(scratch, want);
    skipped += got;
    if (got < want) break;
  }
  return skipped;
}

}  // namespace monoplay::stream
