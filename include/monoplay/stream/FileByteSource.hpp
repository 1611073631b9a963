// Repository: Monoplay
// Component: File Byte Source
// Purpose: IByteSource over a file on local storage.
// Copyright (c) 2025 Monoplay

#ifndef MONOPLAY_STREAM_FILE_BYTE_SOURCE_HPP_
#define MONOPLAY_STREAM_FILE_BYTE_SOURCE_HPP_

#include <fstream>
#include <string>

#include "monoplay/stream/IByteSource.hpp"

namespace monoplay::stream {

class FileByteSource : public IByteSource {
 public:
  explicit FileByteSource(std::string path);
  ~FileByteSource() override;

  FileByteSource(const FileByteSource&) = delete;
  FileByteSource& operator=(const FileByteSource&) = delete;

  bool Open() override;
  void Close() override;
  bool IsOpen() const override;
  size_t Read(uint8_t* dst, size_t count) override;
  size_t Skip(size_t count) override;
  bool HasError() const override { return error_; }
  std::string Name() const override { return path_; }

  const std::string& path() const { return path_; }

 private:
  std::string path_;
  std::ifstream file_;
  bool error_ = false;
};

}  // namespace monoplay::stream

#endif  // MONOPLAY_STREAM_FILE_BYTE_SOURCE_HPP_
