// Repository: Monoplay
// Component: AsyncDisplaySink
// Purpose: Queued-transfer decorator: runs a synchronous sink's Blit() on a
//          transfer thread so decode of the next frame overlaps the transfer
//          of the current one.
// Copyright (c) 2025 Monoplay

#include "monoplay/output/AsyncDisplaySink.h"

#include <utility>

#include "monoplay/util/Logger.hpp"

namespace monoplay::output {

using monoplay::util::Logger;

AsyncDisplaySink::AsyncDisplaySink(std::unique_ptr<IDisplaySink> inner)
    : inner_(std::move(inner)) {
  transfer_thread_ = std::thread(&AsyncDisplaySink::TransferLoop, this);
}

AsyncDisplaySink::~AsyncDisplaySink() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stop_ = true;
  }
  work_cv_.notify_all();
  done_cv_.notify_all();
  if (transfer_thread_.joinable()) {
    transfer_thread_.join();
  }
}

std::string AsyncDisplaySink::GetName() const {
  return "async(" + inner_->GetName() + ")";
}

uint64_t AsyncDisplaySink::transfers_completed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return transfers_completed_;
}

bool AsyncDisplaySink::WaitIdleLocked(std::unique_lock<std::mutex>& lock) {
  done_cv_.wait(lock, [this] { return !in_flight_ || stop_; });
  const bool ok = last_ok_;
  last_ok_ = true;
  return ok;
}

bool AsyncDisplaySink::Blit(const buffer::FrameBuffer& frame) {
  std::unique_lock<std::mutex> lock(mutex_);
  if (!WaitIdleLocked(lock)) {
    return false;
  }
  if (stop_) return false;
  pending_ = &frame;
  in_flight_ = true;
  lock.unlock();
  work_cv_.notify_one();
  return true;
}

bool AsyncDisplaySink::WaitTransferDone() {
  std::unique_lock<std::mutex> lock(mutex_);
  return WaitIdleLocked(lock);
}

bool AsyncDisplaySink::SetBacklight(uint8_t level) {
  // Backlight is a register write on the same bus: serialize with transfers.
  std::unique_lock<std::mutex> lock(mutex_);
  if (!WaitIdleLocked(lock)) {
    return false;
  }
  return inner_->SetBacklight(level);
}

void AsyncDisplaySink::TransferLoop() {
  std::unique_lock<std::mutex> lock(mutex_);
  while (true) {
    work_cv_.wait(lock, [this] { return pending_ != nullptr || stop_; });
    if (stop_) break;

    const buffer::FrameBuffer* frame = pending_;
    pending_ = nullptr;
    lock.unlock();
    const bool ok = inner_->Blit(*frame);
    lock.lock();

    if (!ok) {
      Logger::Error("[AsyncSink] Transfer failed on " + inner_->GetName());
    }
    last_ok_ = ok;
    in_flight_ = false;
    ++transfers_completed_;
    done_cv_.notify_all();
  }
  in_flight_ = false;
  done_cv_.notify_all();
}

}  // namespace monoplay::output
