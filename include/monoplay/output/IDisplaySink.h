// Repository: Monoplay
// Component: IDisplaySink Interface
// Purpose: Abstract consumer of finished frames (SPI panel driver, host sinks).
// Copyright (c) 2025 Monoplay

#ifndef MONOPLAY_OUTPUT_IDISPLAY_SINK_H_
#define MONOPLAY_OUTPUT_IDISPLAY_SINK_H_

#include <cstdint>
#include <string>

namespace monoplay::buffer {
class FrameBuffer;
}  // namespace monoplay::buffer

namespace monoplay::output {

// IDisplaySink is the only surface the playback loop sees of the panel.
//
// DisplaySink responsibilities:
// - Transfer one complete packed frame to the panel per Blit()
// - Report hardware faults (false return → SinkUnavailable)
// - Optionally queue the transfer and return early (asynchronous sink)
//
// DisplaySink explicitly does NOT:
// - Retain the buffer after the transfer completes
// - Know about front/back roles, frame indices, or pacing
//
// Asynchronous sinks: Blit() may return while the transfer is still
// reading the buffer. At most one transfer is in flight; the caller must
// not write that buffer until WaitTransferDone() has returned. Synchronous
// sinks complete inside Blit() and WaitTransferDone() returns immediately.
class IDisplaySink {
 public:
  virtual ~IDisplaySink() = default;

  // Transfers (or queues the transfer of) a full frame.
  // Returns false if the panel reported a fault.
  virtual bool Blit(const buffer::FrameBuffer& frame) = 0;

  // Backlight 0..255. Sinks with a hard-wired backlight return true.
  virtual bool SetBacklight(uint8_t level) = 0;

  // True if Blit() may return before the transfer completes.
  virtual bool SupportsAsyncTransfer() const { return false; }

  // Blocks until no transfer is in flight. Returns false if the completed
  // transfer failed.
  virtual bool WaitTransferDone() { return true; }

  // Human-readable name for logging/diagnostics.
  virtual std::string GetName() const = 0;
};

}  // namespace monoplay::output

#endif  // MONOPLAY_OUTPUT_IDISPLAY_SINK_H_
