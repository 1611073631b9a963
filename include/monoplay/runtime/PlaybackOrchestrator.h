// Repository: Monoplay
// Component: PlaybackOrchestrator
// Purpose: State machine driving the per-frame cycle (read → inflate →
//          swap → blit → tone → pace) and end-of-stream / fault / loop
//          behaviour.
// Copyright (c) 2025 Monoplay

#ifndef MONOPLAY_RUNTIME_PLAYBACK_ORCHESTRATOR_H_
#define MONOPLAY_RUNTIME_PLAYBACK_ORCHESTRATOR_H_

#include <atomic>
#include <cstdint>
#include <map>
#include <string>
#include <utility>

#include "monoplay/audio/IBuzzer.hpp"
#include "monoplay/audio/MelodyCursor.hpp"
#include "monoplay/buffer/BufferPool.hpp"
#include "monoplay/decode/FrameDecompressor.hpp"
#include "monoplay/output/IDisplaySink.h"
#include "monoplay/runtime/PlaybackMetrics.hpp"
#include "monoplay/runtime/PlaybackSession.h"
#include "monoplay/runtime/PlayerConfig.h"
#include "monoplay/stream/BitstreamReader.hpp"
#include "monoplay/stream/IByteSource.hpp"
#include "monoplay/timing/IWaitStrategy.hpp"
#include "monoplay/timing/PacingController.hpp"
#include "time/ITimeSource.hpp"

namespace monoplay::runtime {

// PlaybackOrchestrator owns the whole pipeline and its session. It runs in
// a single execution context; nothing it owns is shared with another thread
// (an asynchronous display sink only borrows the front buffer between
// Blit() and WaitTransferDone()).
//
// States:
//   kIdle      → BeginPass() opens streams, resets session → kStreaming
//   kStreaming → one cycle per Step(); end of stream → kDraining;
//                truncated stream / read error / sink fault → kFaulted
//   kDraining  → close streams, loop_count++ → kIdle (loop) or kHalted
//   kFaulted   → report, back off → kIdle (restart) or kHalted
//   kHalted    → terminal; Run() returns
//
// A stop request is honoured between Step() calls only, never inside a
// cycle.
class PlaybackOrchestrator {
 public:
  enum class State {
    kIdle = 0,
    kStreaming = 1,
    kDraining = 2,
    kFaulted = 3,
    kHalted = 4,
  };

  enum class FaultCause {
    kNone = 0,
    kOpenFailed,
    kTruncatedStream,
    kReadError,
    kSinkUnavailable,
    kDecoderUnavailable,
  };

  // External collaborators. All pointers are borrowed and must outlive the
  // orchestrator; `melody` may be nullptr (silent playback).
  struct Dependencies {
    stream::IByteSource* video = nullptr;
    stream::IByteSource* melody = nullptr;
    output::IDisplaySink* display = nullptr;
    audio::IBuzzer* buzzer = nullptr;
    ITimeSource* time_source = nullptr;
    timing::IWaitStrategy* wait = nullptr;
  };

  // `config` must satisfy IsValid().
  PlaybackOrchestrator(const PlayerConfig& config, Dependencies deps);
  ~PlaybackOrchestrator();

  PlaybackOrchestrator(const PlaybackOrchestrator&) = delete;
  PlaybackOrchestrator& operator=(const PlaybackOrchestrator&) = delete;

  // Idle → Streaming. Returns false (and enters kFaulted) if the pass could
  // not start.
  bool BeginPass();

  // Perform one unit of work for the current state and return the new
  // state. In kStreaming this is exactly one frame cycle.
  State Step();

  // Step until kHalted or until `stop_signal` (may be nullptr) is set.
  void Run(const std::atomic<bool>* stop_signal);

  // Finish any in-flight transfer, mute, close streams, → kHalted.
  void Stop();

  [[nodiscard]] State state() const { return state_; }
  [[nodiscard]] const PlaybackSession& session() const { return session_; }
  [[nodiscard]] const PlaybackMetrics& metrics() const { return metrics_; }
  [[nodiscard]] FaultCause last_fault() const { return last_fault_; }
  [[nodiscard]] uint32_t frames_in_pass() const { return session_.frame_index; }
  [[nodiscard]] uint64_t TransitionCount(State from, State to) const;

  static const char* StateName(State state);
  static const char* FaultCauseName(FaultCause cause);

 private:
  void RunCycle();
  void FinishPass();
  void HandleFault();
  void RaiseFault(FaultCause cause, const std::string& detail);
  void RepeatPreviousFrame(const char* reason);
  bool ApplyTone(uint16_t tone_code);
  void CloseStreams();
  void Transition(State to);

  PlayerConfig config_;
  Dependencies deps_;

  buffer::BufferPool pool_;
  stream::BitstreamReader reader_;
  decode::FrameDecompressor decompressor_;
  audio::MelodyCursor melody_;
  timing::PacingController pacing_;

  PlaybackSession session_;
  PlaybackMetrics metrics_;

  State state_ = State::kIdle;
  FaultCause last_fault_ = FaultCause::kNone;
  int32_t consecutive_faults_ = 0;
  bool decoder_ready_ = false;
  std::map<std::pair<State, State>, uint64_t> transitions_;
};

}  // namespace monoplay::runtime

#endif  // MONOPLAY_RUNTIME_PLAYBACK_ORCHESTRATOR_H_
