// Repository: Monoplay
// Component: Thread-Safe Logger
// Purpose: Mutex-protected log emission; prevents interleave between the
//          playback loop and the async transfer worker.
// Copyright (c) 2025 Monoplay

#ifndef MONOPLAY_UTIL_LOGGER_HPP_
#define MONOPLAY_UTIL_LOGGER_HPP_

#include <functional>
#include <mutex>
#include <string>

namespace monoplay::util {

// Logger provides thread-safe log emission with a single static mutex.
// Each call acquires the mutex, writes the full line, appends '\n', and
// flushes. No interleave between the playback loop and the
// AsyncDisplaySink worker.
//
// Info  → stdout (normal operational logs)
// Debug → stdout only when MONOPLAY_DEBUG env is set (per-frame tracing)
// Warn  → stderr (degraded but recoverable conditions, e.g. repeated frame)
// Error → stderr (faults that restart or halt a pass)
//
// Test-only: SetErrorSink / SetWarnSink / SetInfoSink install a callback
// invoked for every line at that level (in addition to the stream). Used by
// tests to assert that faults and degraded frames are reported.
class Logger {
 public:
  static void Info(const std::string& line);
  static void Debug(const std::string& line);
  static void Warn(const std::string& line);
  static void Error(const std::string& line);

  // Test-only. Call with nullptr to clear.
  static void SetErrorSink(std::function<void(const std::string&)> sink);
  static void SetWarnSink(std::function<void(const std::string&)> sink);
  static void SetInfoSink(std::function<void(const std::string&)> sink);

 private:
  static std::mutex mutex_;
  static std::function<void(const std::string&)> error_sink_;
  static std::function<void(const std::string&)> warn_sink_;
  static std::function<void(const std::string&)> info_sink_;
};

}  // namespace monoplay::util

#endif  // MONOPLAY_UTIL_LOGGER_HPP_
