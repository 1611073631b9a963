// Repository: Monoplay
// Component: AsyncDisplaySink
// Purpose: Queued-transfer decorator: runs a synchronous sink's Blit() on a
//          transfer thread so decode of the next frame overlaps the transfer
//          of the current one.
// Copyright (c) 2025 Monoplay

#ifndef MONOPLAY_OUTPUT_ASYNC_DISPLAY_SINK_H_
#define MONOPLAY_OUTPUT_ASYNC_DISPLAY_SINK_H_

#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "monoplay/output/IDisplaySink.h"

namespace monoplay::output {

// AsyncDisplaySink models a DMA-queued panel transfer on the host.
//
// Core rules:
//   - One transfer in flight. Blit() first waits for the previous transfer,
//     then hands the frame to the transfer thread and returns.
//   - The frame is borrowed, not copied: the caller must not write it until
//     WaitTransferDone() returns (the orchestrator's role alternation
//     guarantees this: only the back buffer is written).
//   - A failed transfer is reported by the next Blit() or WaitTransferDone().
//
// Without this decorator playback is fully synchronous and still correct;
// only throughput changes.
class AsyncDisplaySink : public IDisplaySink {
 public:
  // Takes ownership of the synchronous sink that performs the transfer.
  explicit AsyncDisplaySink(std::unique_ptr<IDisplaySink> inner);
  ~AsyncDisplaySink() override;

  AsyncDisplaySink(const AsyncDisplaySink&) = delete;
  AsyncDisplaySink& operator=(const AsyncDisplaySink&) = delete;

  bool Blit(const buffer::FrameBuffer& frame) override;
  bool SetBacklight(uint8_t level) override;
  bool SupportsAsyncTransfer() const override { return true; }
  bool WaitTransferDone() override;
  std::string GetName() const override;

  uint64_t transfers_completed() const;

 private:
  void TransferLoop();
  // Requires mutex_ held via `lock`.
  bool WaitIdleLocked(std::unique_lock<std::mutex>& lock);

  std::unique_ptr<IDisplaySink> inner_;

  mutable std::mutex mutex_;
  std::condition_variable work_cv_;
  std::condition_variable done_cv_;
  const buffer::FrameBuffer* pending_ = nullptr;
  bool in_flight_ = false;
  bool last_ok_ = true;
  bool stop_ = false;
  uint64_t transfers_completed_ = 0;

  std::thread transfer_thread_;
};

}  // namespace monoplay::output

#endif  // MONOPLAY_OUTPUT_ASYNC_DISPLAY_SINK_H_
