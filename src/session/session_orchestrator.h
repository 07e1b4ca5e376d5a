// Copyright 2026 The multicap Authors
// Top-level capture session: builds writers and streams, waits for the
// first terminal or restart condition, restarts streams on recoverable
// failures and drains every writer before exit.

#ifndef MULTICAP_SESSION_SESSION_ORCHESTRATOR_H_
#define MULTICAP_SESSION_SESSION_ORCHESTRATOR_H_

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "core/audio_device_backend.h"
#include "core/capture_service.h"
#include "core/capture_types.h"
#include "core/media_sink.h"
#include "core/window_list_provider.h"
#include "device/device_change_monitor.h"
#include "mask/window_mask_detector.h"
#include "multicap/multicap.h"
#include "session/completion_race.h"
#include "session/event_output.h"
#include "session/session_config.h"
#include "session/signal_watcher.h"
#include "session/stream_output_router.h"
#include "writer/audio_track_writer.h"
#include "writer/video_track_writer.h"

namespace multicap {
namespace internal {

/// Platform services used by a session. All pointers are non-owning and
/// must outlive the orchestrator.
struct SessionDependencies {
  CaptureService* capture_service = nullptr;
  MediaSinkFactory* sink_factory = nullptr;
  WindowListProvider* window_list = nullptr;     // Null: masking disabled
  AudioDeviceBackend* device_backend = nullptr;  // Null: no device watch
  EventOutput* events = nullptr;                 // Null: no JSONL output
  bool install_signal_handlers = true;
};

enum class SessionState {
  kIdle = 0,
  kStarting,
  kRunning,
  kCompleting,
  kRestarting,
  kAborting,
  kDraining,
  kTerminated,
};

const char* SessionStateName(SessionState state);

/// What ended one capture attempt.
struct SessionOutcome {
  enum Kind {
    kCompleted = 0,   // Audio writer finished / duration timer fired
    kRestart,         // Recoverable stream error
    kDeviceChange,    // Default audio device changed
    kFatalError,      // Unrecoverable stream, setup or write error
    kInterrupted,     // SIGINT / SIGTERM
  };

  Kind kind = kCompleted;
  StreamError error;
  MultiCapError code = kMultiCapOk;
  int signo = 0;
};

/// One per process run.
///
/// Writers are session-scoped; capture streams and their routers are
/// rebuilt for every attempt, so a restart keeps appending to the same
/// files.
class SessionOrchestrator {
 public:
  SessionOrchestrator(SessionConfig config, SessionDependencies deps);
  ~SessionOrchestrator();

  // Non-copyable.
  SessionOrchestrator(const SessionOrchestrator&) = delete;
  SessionOrchestrator& operator=(const SessionOrchestrator&) = delete;

  /// Record until a terminal condition and drain all outputs.
  /// @return process exit code (MultiCapExitCode, or 128 + signal).
  int Run();

  /// Request a graceful stop as if `signo` had been received.
  void Interrupt(int signo);

  SessionState state() const { return state_; }
  int restart_count() const;
  MultiCapError last_error() const;

  /// Output file paths, video files first.
  std::vector<std::string> output_files() const;

 private:
  struct DisplayTarget {
    DisplayInfo display;
    std::string path;
    std::unique_ptr<VideoTrackWriter> writer;
  };

  bool Prepare(SessionOutcome* out_failure);
  void EmitDescriptors();
  bool StartAttempt(SessionOutcome* out_failure);
  void StopStreams();
  SessionOutcome WaitForOutcome(
      const std::shared_ptr<CompletionRace<SessionOutcome>>& race);
  void BeginAttempt(std::shared_ptr<CompletionRace<SessionOutcome>> race);
  void EndAttempt();
  void WaitRestartDelay();
  bool Drain(bool* out_write_failed, std::string* out_write_error);
  int Finish(const SessionOutcome& outcome, bool write_failed,
             const std::string& write_error);

  // Completion sources.
  void Resolve(const SessionOutcome& outcome);
  void OnAudioWriterComplete(const WriterResult& result);
  void OnStreamError(const StreamError& error, bool recoverable);
  void OnDeviceChange();

  std::string VideoPathFor(const DisplayInfo& display) const;
  std::string AudioPath() const;

  const SessionConfig config_;
  const SessionDependencies deps_;
  const ErrorPolicy error_policy_;

  std::atomic<SessionState> state_{SessionState::kIdle};

  std::vector<DisplayTarget> targets_;
  std::unique_ptr<AudioTrackWriter> audio_writer_;
  std::unique_ptr<WindowMaskDetector> mask_detector_;
  std::unique_ptr<DeviceChangeMonitor> device_monitor_;
  std::unique_ptr<SignalWatcher> signal_watcher_;
  std::chrono::steady_clock::time_point recording_start_;

  // Per attempt. Streams are destroyed before their routers.
  std::vector<std::unique_ptr<StreamOutputRouter>> routers_;
  std::vector<std::unique_ptr<CaptureStream>> streams_;

  mutable std::mutex race_mutex_;
  std::condition_variable sticky_cv_;
  std::shared_ptr<CompletionRace<SessionOutcome>> race_;
  // Terminal outcomes that arrive between attempts carry over.
  std::optional<SessionOutcome> sticky_;

  mutable std::mutex stats_mutex_;
  int restart_count_ = 0;
  MultiCapError last_error_ = kMultiCapOk;
};

}  // namespace internal
}  // namespace multicap

#endif  // MULTICAP_SESSION_SESSION_ORCHESTRATOR_H_
