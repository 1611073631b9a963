// Repository: Monoplay
// Component: PlaybackOrchestrator
// Purpose: State machine driving the per-frame cycle and end-of-stream /
//          fault / loop behaviour.
// Copyright (c) 2025 Monoplay

#include "monoplay/runtime/PlaybackOrchestrator.h"

#include <algorithm>
#include <chrono>
#include <sstream>

#include "monoplay/util/Logger.hpp"

namespace monoplay::runtime {

using monoplay::util::Logger;

PlaybackOrchestrator::PlaybackOrchestrator(const PlayerConfig& config,
                                           Dependencies deps)
    : config_(config),
      deps_(deps),
      pool_(config.Geometry()),
      reader_(deps.video, config.RecordCapacity()),
      melody_(deps.melody),
      pacing_(std::chrono::milliseconds(config.target_frame_interval_ms),
              deps.time_source, deps.wait) {
  std::ostringstream oss;
  oss << "[Orchestrator] Configured " << config_.width << "x" << config_.height
      << " mono_size=" << config_.MonoSize()
      << " record_capacity=" << reader_.capacity()
      << " interval_ms=" << config_.target_frame_interval_ms
      << " loop=" << (config_.loop_enabled ? "on" : "off")
      << " sink=" << deps_.display->GetName()
      << (deps_.display->SupportsAsyncTransfer() ? " (async)" : " (sync)");
  Logger::Info(oss.str());
}

PlaybackOrchestrator::~PlaybackOrchestrator() {
  if (state_ != State::kHalted) {
    Stop();
  }
}

const char* PlaybackOrchestrator::StateName(State state) {
  switch (state) {
    case State::kIdle:
      return "IDLE";
    case State::kStreaming:
      return "STREAMING";
    case State::kDraining:
      return "DRAINING";
    case State::kFaulted:
      return "FAULTED";
    case State::kHalted:
      return "HALTED";
  }
  return "UNKNOWN";
}

const char* PlaybackOrchestrator::FaultCauseName(FaultCause cause) {
  switch (cause) {
    case FaultCause::kNone:
      return "NONE";
    case FaultCause::kOpenFailed:
      return "OPEN_FAILED";
    case FaultCause::kTruncatedStream:
      return "TRUNCATED_STREAM";
    case FaultCause::kReadError:
      return "READ_ERROR";
    case FaultCause::kSinkUnavailable:
      return "SINK_UNAVAILABLE";
    case FaultCause::kDecoderUnavailable:
      return "DECODER_UNAVAILABLE";
  }
  return "UNKNOWN";
}

uint64_t PlaybackOrchestrator::TransitionCount(State from, State to) const {
  auto it = transitions_.find({from, to});
  return it == transitions_.end() ? 0 : it->second;
}

void PlaybackOrchestrator::Transition(State to) {
  if (to == state_) return;
  ++transitions_[{state_, to}];
  {
    std::ostringstream oss;
    oss << "[Orchestrator] " << StateName(state_) << " -> " << StateName(to);
    Logger::Debug(oss.str());
  }
  state_ = to;
}

// =============================================================================
// Idle → Streaming
// =============================================================================

bool PlaybackOrchestrator::BeginPass() {
  if (state_ != State::kIdle) {
    std::ostringstream oss;
    oss << "[Orchestrator] BeginPass ignored in state " << StateName(state_);
    Logger::Warn(oss.str());
    return false;
  }

  if (!decoder_ready_) {
    decoder_ready_ = decompressor_.Init();
    if (!decoder_ready_) {
      RaiseFault(FaultCause::kDecoderUnavailable, "inflate state allocation failed");
      return false;
    }
  }

  session_.ResetForPass();
  pool_.Reset();
  reader_.Reset();
  ++metrics_.passes_started_total;

  if (!deps_.video->Open()) {
    RaiseFault(FaultCause::kOpenFailed,
               "cannot open video stream " + deps_.video->Name());
    return false;
  }
  melody_.Reset();
  session_.melody_event_index = melody_.event_index();
  session_.frames_remaining_in_event = melody_.frames_remaining_in_event();

  if (!deps_.display->SetBacklight(
          static_cast<uint8_t>(config_.backlight_level))) {
    RaiseFault(FaultCause::kSinkUnavailable, "backlight write failed");
    return false;
  }

  session_.active_buffer_role = pool_.FrontRole();
  Transition(State::kStreaming);

  std::ostringstream oss;
  oss << "[Orchestrator] Pass " << session_.loop_count << " started: video="
      << deps_.video->Name() << " melody="
      << (melody_.has_source() ? deps_.melody->Name() : std::string("(silent)"));
  Logger::Info(oss.str());
  return true;
}

// =============================================================================
// Step / Run / Stop
// =============================================================================

PlaybackOrchestrator::State PlaybackOrchestrator::Step() {
  switch (state_) {
    case State::kIdle:
      BeginPass();
      break;
    case State::kStreaming:
      RunCycle();
      break;
    case State::kDraining:
      FinishPass();
      break;
    case State::kFaulted:
      HandleFault();
      break;
    case State::kHalted:
      break;
  }
  return state_;
}

void PlaybackOrchestrator::Run(const std::atomic<bool>* stop_signal) {
  while (state_ != State::kHalted) {
    if (stop_signal != nullptr && stop_signal->load(std::memory_order_acquire)) {
      Logger::Info("[Orchestrator] Stop requested");
      Stop();
      break;
    }
    Step();
  }
}

void PlaybackOrchestrator::Stop() {
  if (state_ == State::kHalted) return;
  if (!deps_.display->WaitTransferDone()) {
    Logger::Warn("[Orchestrator] Final transfer failed during stop");
  }
  if (!deps_.buzzer->Silence()) {
    Logger::Warn("[Orchestrator] Buzzer did not acknowledge silence during stop");
  }
  CloseStreams();
  if (state_ != State::kIdle) {
    Transition(State::kIdle);
  }
  Transition(State::kHalted);
}

// =============================================================================
// Streaming cycle
// =============================================================================

void PlaybackOrchestrator::RunCycle() {
  const auto cycle_start = pacing_.BeginCycle();

  const stream::RecordResult record = reader_.NextRecord();
  bool corrupt = false;
  const char* corrupt_reason = "";

  switch (record.status) {
    case stream::ReadStatus::kEndOfStream:
      Transition(State::kDraining);
      return;
    case stream::ReadStatus::kTruncated: {
      std::ostringstream oss;
      oss << "record " << session_.frame_index << " declared "
          << record.declared_length << " bytes, " << record.bytes_read
          << " available";
      RaiseFault(FaultCause::kTruncatedStream, oss.str());
      return;
    }
    case stream::ReadStatus::kIoError:
      RaiseFault(FaultCause::kReadError,
                 "read error at frame " + std::to_string(session_.frame_index));
      return;
    case stream::ReadStatus::kOversized:
      ++metrics_.oversized_records_total;
      corrupt = true;
      corrupt_reason = "oversized record";
      break;
    case stream::ReadStatus::kRecord: {
      // Back buffer is free: the sink only ever reads the front buffer, and
      // the previous transfer of this buffer was waited out before the last
      // Blit().
      const auto result = decompressor_.Decompress(
          reader_.payload(), reader_.payload_size(), pool_.BackBuffer());
      if (result != decode::DecompressResult::kOk) {
        corrupt = true;
        corrupt_reason = decode::DecompressResultName(result);
      }
      break;
    }
  }

  if (corrupt) {
    RepeatPreviousFrame(corrupt_reason);
  }

  pool_.Swap();
  session_.active_buffer_role = pool_.FrontRole();

  if (!deps_.display->WaitTransferDone()) {
    RaiseFault(FaultCause::kSinkUnavailable, "previous transfer failed");
    return;
  }
  if (!deps_.display->Blit(pool_.FrontBuffer())) {
    RaiseFault(FaultCause::kSinkUnavailable,
               "blit failed at frame " + std::to_string(session_.frame_index));
    return;
  }
  ++metrics_.frames_displayed_total;

  const uint16_t tone = melody_.ToneForFrame(session_.frame_index);
  session_.melody_event_index = melody_.event_index();
  session_.frames_remaining_in_event = melody_.frames_remaining_in_event();
  if (!ApplyTone(tone)) {
    RaiseFault(FaultCause::kSinkUnavailable,
               "buzzer rejected tone " + std::to_string(tone));
    return;
  }

  ++session_.frame_index;

  const timing::CycleTiming timing = pacing_.EndCycle(cycle_start);
  if (timing.overran()) {
    // Sum in ns so sub-millisecond overruns are not lost to truncation.
    session_.cumulative_drift_ns += timing.overrun.count();
    session_.cumulative_drift_ms =
        static_cast<int32_t>(session_.cumulative_drift_ns / 1'000'000);
    ++metrics_.overrun_cycles_total;
    const int64_t overrun_ms =
        std::chrono::ceil<std::chrono::milliseconds>(timing.overrun).count();
    metrics_.max_overrun_ms = std::max(metrics_.max_overrun_ms, overrun_ms);
  }
}

void PlaybackOrchestrator::RepeatPreviousFrame(const char* reason) {
  ++metrics_.corrupt_frames_total;
  buffer::FrameBuffer& back = pool_.BackBuffer();
  std::ostringstream oss;
  oss << "[Orchestrator] Corrupt frame " << session_.frame_index << " ("
      << reason << ")";
  if (session_.frame_index > 0) {
    back.CopyFrom(pool_.FrontBuffer());
    oss << ", repeating previous frame";
  } else {
    back.Clear();
    oss << ", no previous frame: showing black";
  }
  Logger::Warn(oss.str());
}

bool PlaybackOrchestrator::ApplyTone(uint16_t tone_code) {
  const uint32_t hz = audio::ToneCodeToHz(tone_code);
  if (hz == 0) {
    return deps_.buzzer->Silence();
  }
  return deps_.buzzer->SetTone(hz, static_cast<uint16_t>(config_.buzzer_duty));
}

// =============================================================================
// Draining → Idle (→ Halted)
// =============================================================================

void PlaybackOrchestrator::FinishPass() {
  if (!deps_.display->WaitTransferDone()) {
    RaiseFault(FaultCause::kSinkUnavailable, "final transfer failed");
    return;
  }
  if (!deps_.buzzer->Silence()) {
    RaiseFault(FaultCause::kSinkUnavailable, "buzzer rejected silence");
    return;
  }
  CloseStreams();

  const uint32_t frames = session_.frame_index;
  ++session_.loop_count;
  ++metrics_.passes_completed_total;
  metrics_.last_pass_drift_ms = session_.cumulative_drift_ms;
  consecutive_faults_ = 0;

  {
    std::ostringstream oss;
    oss << "[Orchestrator] Pass complete: frames=" << frames
        << " drift_ms=" << session_.cumulative_drift_ms
        << " loop_count=" << session_.loop_count << " | "
        << metrics_.ToLogLine();
    Logger::Info(oss.str());
  }

  Transition(State::kIdle);

  if (frames == 0) {
    Logger::Error("[Orchestrator] Video stream " + deps_.video->Name() +
                  " contains no frames; halting");
    Transition(State::kHalted);
    return;
  }
  if (!config_.loop_enabled) {
    Transition(State::kHalted);
    return;
  }
  deps_.wait->WaitFor(std::chrono::milliseconds(config_.loop_delay_ms));
}

// =============================================================================
// Faults
// =============================================================================

void PlaybackOrchestrator::RaiseFault(FaultCause cause,
                                      const std::string& detail) {
  last_fault_ = cause;
  ++metrics_.faults_total;
  switch (cause) {
    case FaultCause::kTruncatedStream:
      ++metrics_.truncated_stream_total;
      break;
    case FaultCause::kReadError:
      ++metrics_.read_error_total;
      break;
    case FaultCause::kOpenFailed:
      ++metrics_.open_failure_total;
      break;
    case FaultCause::kSinkUnavailable:
      ++metrics_.sink_unavailable_total;
      break;
    case FaultCause::kDecoderUnavailable:
    case FaultCause::kNone:
      break;
  }

  std::ostringstream oss;
  oss << "[Orchestrator] FAULT " << FaultCauseName(cause) << " in "
      << StateName(state_) << " at frame " << session_.frame_index
      << " (pass " << session_.loop_count << "): " << detail;
  Logger::Error(oss.str());

  Transition(State::kFaulted);
}

void PlaybackOrchestrator::HandleFault() {
  if (!deps_.display->WaitTransferDone()) {
    Logger::Warn("[Orchestrator] In-flight transfer also failed while faulted");
  }
  if (!deps_.buzzer->Silence()) {
    Logger::Warn("[Orchestrator] Buzzer did not acknowledge silence while faulted");
  }
  CloseStreams();

  ++consecutive_faults_;
  if (config_.max_consecutive_faults > 0 &&
      consecutive_faults_ >= config_.max_consecutive_faults) {
    std::ostringstream oss;
    oss << "[Orchestrator] " << consecutive_faults_
        << " consecutive faults without a completed pass; halting";
    Logger::Error(oss.str());
    Transition(State::kIdle);
    Transition(State::kHalted);
    return;
  }

  {
    std::ostringstream oss;
    oss << "[Orchestrator] Restarting playback in " << config_.fault_backoff_ms
        << "ms (fault " << consecutive_faults_ << ")";
    Logger::Info(oss.str());
  }
  deps_.wait->WaitFor(std::chrono::milliseconds(config_.fault_backoff_ms));
  Transition(State::kIdle);
}

void PlaybackOrchestrator::CloseStreams() {
  if (deps_.video->IsOpen()) {
    deps_.video->Close();
  }
  melody_.Close();
}

}  // namespace monoplay::runtime
