// Copyright 2026 The multicap Authors

#include "session/session_orchestrator.h"

#include <unistd.h>

#include <algorithm>
#include <chrono>
#include <set>
#include <utility>

#include "core/logger.h"

namespace multicap {
namespace internal {

namespace {

constexpr char kSessionDomain[] = "session";
constexpr char kWriterDomain[] = "writer";

SessionOutcome SetupFailure(MultiCapError code, const std::string& message) {
  SessionOutcome outcome;
  outcome.kind = SessionOutcome::kFatalError;
  outcome.code = code;
  outcome.error.domain = kSessionDomain;
  outcome.error.code = static_cast<int>(code);
  outcome.error.message = message;
  return outcome;
}

bool PathExists(const std::string& path) {
  return ::access(path.c_str(), F_OK) == 0;
}

}  // namespace

const char* SessionStateName(SessionState state) {
  switch (state) {
    case SessionState::kIdle:       return "idle";
    case SessionState::kStarting:   return "starting";
    case SessionState::kRunning:    return "running";
    case SessionState::kCompleting: return "completing";
    case SessionState::kRestarting: return "restarting";
    case SessionState::kAborting:   return "aborting";
    case SessionState::kDraining:   return "draining";
    case SessionState::kTerminated: return "terminated";
  }
  return "unknown";
}

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------

SessionOrchestrator::SessionOrchestrator(SessionConfig config,
                                         SessionDependencies deps)
    : config_(std::move(config)),
      deps_(deps),
      error_policy_(config_.recoverable_errors) {}

SessionOrchestrator::~SessionOrchestrator() {
  StopStreams();
  if (device_monitor_) device_monitor_->Stop();
  if (signal_watcher_) signal_watcher_->Uninstall();
}

int SessionOrchestrator::restart_count() const {
  std::lock_guard<std::mutex> lock(stats_mutex_);
  return restart_count_;
}

MultiCapError SessionOrchestrator::last_error() const {
  std::lock_guard<std::mutex> lock(stats_mutex_);
  return last_error_;
}

std::vector<std::string> SessionOrchestrator::output_files() const {
  std::vector<std::string> files;
  for (const auto& target : targets_) files.push_back(target.path);
  if (audio_writer_) files.push_back(audio_writer_->path());
  return files;
}

std::string SessionOrchestrator::VideoPathFor(
    const DisplayInfo& display) const {
  return config_.output_base + "_" + std::to_string(display.id) + ".mp4";
}

std::string SessionOrchestrator::AudioPath() const {
  return config_.output_base + ".m4a";
}

// ---------------------------------------------------------------------------
// Run
// ---------------------------------------------------------------------------

int SessionOrchestrator::Run() {
  state_ = SessionState::kStarting;

  if (deps_.install_signal_handlers) {
    signal_watcher_ = std::make_unique<SignalWatcher>();
    if (!signal_watcher_->Install([this](int signo) { Interrupt(signo); })) {
      MULTICAP_LOG_WARN("Ctrl-C will not stop the recording gracefully");
    }
  }

  SessionOutcome outcome;
  if (!Prepare(&outcome)) {
    state_ = SessionState::kAborting;
    return Finish(outcome, false, std::string());
  }
  EmitDescriptors();
  if (device_monitor_ && !device_monitor_->Start()) device_monitor_.reset();

  bool first_attempt = true;
  for (;;) {
    state_ = SessionState::kStarting;
    {
      std::lock_guard<std::mutex> lock(race_mutex_);
      if (sticky_) {
        outcome = *sticky_;
        break;
      }
    }

    auto race = std::make_shared<CompletionRace<SessionOutcome>>();
    BeginAttempt(race);

    SessionOutcome start_failure;
    if (StartAttempt(&start_failure)) {
      if (first_attempt) {
        recording_start_ = std::chrono::steady_clock::now();
        if (config_.length_seconds > 0) {
          MULTICAP_LOG_INFO(
              "Started capture - recording {:.1f} seconds at {:.1f} Hz{}...",
              config_.length_seconds, config_.frame_rate,
              config_.audio ? " with audio" : "");
        } else {
          MULTICAP_LOG_INFO(
              "Started capture - recording indefinitely at {:.1f} Hz{} "
              "(Ctrl-C to stop)...",
              config_.frame_rate, config_.audio ? " with audio" : "");
        }
      }
      state_ = SessionState::kRunning;
      outcome = WaitForOutcome(race);
    } else if (first_attempt) {
      outcome = start_failure;
    } else {
      outcome = start_failure;
      outcome.kind = SessionOutcome::kRestart;
    }
    EndAttempt();
    first_attempt = false;

    bool restart =
        outcome.kind == SessionOutcome::kRestart ||
        (outcome.kind == SessionOutcome::kDeviceChange &&
         config_.on_device_change == DeviceChangePolicy::kRestart);
    if (!restart) break;

    state_ = SessionState::kRestarting;
    StopStreams();

    if (outcome.kind == SessionOutcome::kRestart) {
      int count;
      {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        count = ++restart_count_;
      }
      if (count > config_.max_restarts) {
        MULTICAP_LOG_ERROR("Giving up after {} restarts (last error {}:{})",
                           config_.max_restarts, outcome.error.domain,
                           outcome.error.code);
        outcome.kind = SessionOutcome::kFatalError;
        outcome.code = kMultiCapErrorRestartLimit;
        break;
      }
      MULTICAP_LOG_WARN("Restarting capture ({}/{}) after {}:{} {}", count,
                        config_.max_restarts, outcome.error.domain,
                        outcome.error.code, outcome.error.message);
    } else {
      MULTICAP_LOG_INFO("Restarting capture after audio device change");
    }

    WaitRestartDelay();
    if (device_monitor_) device_monitor_->Arm();
  }

  bool graceful = outcome.kind == SessionOutcome::kCompleted ||
                  outcome.kind == SessionOutcome::kDeviceChange;
  state_ = graceful ? SessionState::kCompleting : SessionState::kAborting;
  StopStreams();
  if (device_monitor_) device_monitor_->Stop();

  bool write_failed = false;
  std::string write_error;
  Drain(&write_failed, &write_error);
  return Finish(outcome, write_failed, write_error);
}

void SessionOrchestrator::Interrupt(int signo) {
  SessionOutcome outcome;
  outcome.kind = SessionOutcome::kInterrupted;
  outcome.signo = signo;
  Resolve(outcome);
}

// ---------------------------------------------------------------------------
// Setup
// ---------------------------------------------------------------------------

bool SessionOrchestrator::Prepare(SessionOutcome* out_failure) {
  if (!deps_.capture_service) {
    *out_failure =
        SetupFailure(kMultiCapErrorInvalidParam, "no capture service");
    return false;
  }
  if (!deps_.sink_factory) {
    *out_failure = SetupFailure(kMultiCapErrorWriterCreateFailed,
                                "no media sink factory");
    return false;
  }

  std::vector<DisplayInfo> displays = deps_.capture_service->EnumerateDisplays();
  if (displays.empty()) {
    MULTICAP_LOG_ERROR("No displays found");
    *out_failure = SetupFailure(kMultiCapErrorNoDisplays, "no displays found");
    return false;
  }

  // Output paths, checked before anything is created.
  std::vector<std::string> paths;
  for (const auto& display : displays) {
    paths.push_back(displays.size() == 1 ? config_.output_base + ".mp4"
                                         : VideoPathFor(display));
  }
  if (config_.audio) paths.push_back(AudioPath());

  std::set<std::string> unique_paths;
  for (const auto& path : paths) {
    if (!unique_paths.insert(path).second) {
      MULTICAP_LOG_ERROR("Two outputs map to {}", path);
      *out_failure = SetupFailure(kMultiCapErrorOutputExists,
                                  "duplicate output path " + path);
      return false;
    }
    if (PathExists(path)) {
      MULTICAP_LOG_ERROR("{} already exists", path);
      *out_failure = SetupFailure(kMultiCapErrorOutputExists,
                                  path + " already exists");
      return false;
    }
  }

  for (size_t i = 0; i < displays.size(); ++i) {
    const DisplayInfo& display = displays[i];
    VideoWriterConfig video;
    video.path = paths[i];
    video.width = display.width;
    video.height = display.height;
    video.frame_rate = config_.frame_rate;
    video.bitrate = config_.bitrate;
    video.hardware_encoder = config_.hardware_encoder;
    video.duration_ns = config_.duration_ns();

    DisplayTarget target;
    target.display = display;
    target.path = video.path;
    target.writer = std::make_unique<VideoTrackWriter>(deps_.sink_factory,
                                                       std::move(video));
    targets_.push_back(std::move(target));
  }

  if (config_.audio) {
    AudioWriterConfig audio;
    audio.path = AudioPath();
    audio.mode = config_.audio_mode;
    audio.duration_ns = config_.duration_ns();
    audio_writer_ =
        std::make_unique<AudioTrackWriter>(deps_.sink_factory, audio);
    audio_writer_->SetCompletionCallback(
        [this](const WriterResult& result) { OnAudioWriterComplete(result); });

    if (deps_.device_backend) {
      device_monitor_ = std::make_unique<DeviceChangeMonitor>(
          deps_.device_backend, [this] { OnDeviceChange(); });
    }
  }

  if (!config_.mask_apps.empty()) {
    if (deps_.window_list) {
      mask_detector_ = std::make_unique<WindowMaskDetector>(
          deps_.window_list, config_.mask_apps);
    } else {
      MULTICAP_LOG_WARN("Window list unavailable; masking disabled");
    }
  }
  return true;
}

void SessionOrchestrator::EmitDescriptors() {
  if (!deps_.events) return;

  for (const auto& target : targets_) {
    VideoDescriptor video;
    video.file = target.path;
    video.display_id = target.display.id;
    video.width = target.display.width;
    video.height = target.display.height;
    video.x = target.display.bounds.x;
    video.y = target.display.bounds.y;
    video.frame_rate = config_.frame_rate;
    deps_.events->EmitVideoDescriptor(video);
  }

  if (audio_writer_) {
    AudioDescriptor audio;
    audio.file = audio_writer_->path();
    audio.sample_rate = audio_writer_->config().sample_rate;
    auto tracks = audio_writer_->TrackSpecs();
    audio.channels = tracks.empty() ? 1 : tracks.front().channels;
    for (const auto& track : tracks) audio.tracks.push_back(track.name);
    if (deps_.device_backend) {
      AudioDeviceInfo info;
      if (deps_.device_backend->GetDefaultDeviceInfo(DeviceSide::kInput,
                                                     &info)) {
        audio.input_device = info.name.empty() ? info.id : info.name;
      }
      if (deps_.device_backend->GetDefaultDeviceInfo(DeviceSide::kOutput,
                                                     &info)) {
        audio.output_device = info.name.empty() ? info.id : info.name;
      }
    }
    deps_.events->EmitAudioDescriptor(audio);
  }
}

// ---------------------------------------------------------------------------
// Attempts
// ---------------------------------------------------------------------------

bool SessionOrchestrator::StartAttempt(SessionOutcome* out_failure) {
  StreamOutputRouter::Options options;
  options.mask_interval_ms = config_.mask_interval_ms;
  options.verbose = config_.log_level <= kMultiCapLogDebug;

  for (size_t i = 0; i < targets_.size(); ++i) {
    const DisplayTarget& target = targets_[i];
    // The first stream also carries the audio.
    AudioTrackWriter* audio = i == 0 ? audio_writer_.get() : nullptr;

    auto router = std::make_unique<StreamOutputRouter>(
        target.display, target.writer.get(), audio, mask_detector_.get(),
        options, [this](const StreamError& error, bool recoverable) {
          OnStreamError(error, recoverable);
        });

    StreamConfig stream_config;
    stream_config.display = target.display;
    stream_config.frame_rate = config_.frame_rate;
    stream_config.capture_audio = audio != nullptr;
    stream_config.error_policy = &error_policy_;

    auto stream =
        deps_.capture_service->CreateStream(stream_config, router.get());
    routers_.push_back(std::move(router));
    if (!stream) {
      MULTICAP_LOG_ERROR("Failed to create capture stream for display {}",
                         target.display.id);
      *out_failure = SetupFailure(kMultiCapErrorStreamCreateFailed,
                                  "cannot create capture stream");
      return false;
    }
    streams_.push_back(std::move(stream));
  }

  for (size_t i = 0; i < streams_.size(); ++i) {
    StreamError error;
    if (!streams_[i]->Start(&error)) {
      MULTICAP_LOG_ERROR("Failed to start capture of display {}: {}:{} {}",
                         targets_[i].display.id, error.domain, error.code,
                         error.message);
      out_failure->kind = SessionOutcome::kFatalError;
      out_failure->code = kMultiCapErrorStreamStartFailed;
      out_failure->error = error;
      if (out_failure->error.domain.empty()) {
        out_failure->error.domain = kSessionDomain;
        out_failure->error.code = kMultiCapErrorStreamStartFailed;
      }
      return false;
    }
  }
  return true;
}

void SessionOrchestrator::StopStreams() {
  for (auto& stream : streams_) {
    StreamError error;
    if (!stream->Stop(&error)) {
      MULTICAP_LOG_WARN("Error stopping capture stream: {}:{} {}",
                        error.domain, error.code, error.message);
    }
  }
  streams_.clear();
  routers_.clear();
}

void SessionOrchestrator::BeginAttempt(
    std::shared_ptr<CompletionRace<SessionOutcome>> race) {
  std::lock_guard<std::mutex> lock(race_mutex_);
  race_ = std::move(race);
  if (sticky_) race_->TryResolve(*sticky_);
}

void SessionOrchestrator::EndAttempt() {
  std::lock_guard<std::mutex> lock(race_mutex_);
  race_.reset();
}

SessionOutcome SessionOrchestrator::WaitForOutcome(
    const std::shared_ptr<CompletionRace<SessionOutcome>>& race) {
  // Without audio there is no writer to end the session, so a timer does.
  if (!config_.audio && config_.duration_ns() > 0) {
    auto deadline = recording_start_ +
                    std::chrono::nanoseconds(config_.duration_ns());
    auto remaining = deadline - std::chrono::steady_clock::now();
    if (remaining < std::chrono::steady_clock::duration::zero()) {
      remaining = std::chrono::steady_clock::duration::zero();
    }
    SessionOutcome outcome;
    if (!race->WaitFor(remaining, &outcome)) {
      SessionOutcome done;
      done.kind = SessionOutcome::kCompleted;
      race->TryResolve(done);
    }
  }
  return race->Wait();
}

void SessionOrchestrator::WaitRestartDelay() {
  std::unique_lock<std::mutex> lock(race_mutex_);
  sticky_cv_.wait_for(lock,
                      std::chrono::milliseconds(config_.restart_delay_ms),
                      [this] { return sticky_.has_value(); });
}

// ---------------------------------------------------------------------------
// Completion sources
// ---------------------------------------------------------------------------

void SessionOrchestrator::Resolve(const SessionOutcome& outcome) {
  std::lock_guard<std::mutex> lock(race_mutex_);
  // The audio writer completes once and interrupts are final, so both
  // outlive the attempt they arrive in.
  bool carries_over =
      outcome.kind == SessionOutcome::kCompleted ||
      outcome.kind == SessionOutcome::kInterrupted ||
      (outcome.kind == SessionOutcome::kFatalError &&
       outcome.code == kMultiCapErrorWriteFailed);
  if (carries_over) {
    if (!sticky_) sticky_ = outcome;
    sticky_cv_.notify_all();
  }
  if (race_) race_->TryResolve(outcome);
}

void SessionOrchestrator::OnAudioWriterComplete(const WriterResult& result) {
  SessionOutcome outcome;
  if (result.ok) {
    outcome.kind = SessionOutcome::kCompleted;
  } else {
    outcome.kind = SessionOutcome::kFatalError;
    outcome.code = kMultiCapErrorWriteFailed;
    outcome.error.domain = kWriterDomain;
    outcome.error.code = static_cast<int>(kMultiCapErrorWriteFailed);
    outcome.error.message = result.error;
  }
  Resolve(outcome);
}

void SessionOrchestrator::OnStreamError(const StreamError& error,
                                        bool recoverable) {
  SessionOutcome outcome;
  outcome.kind =
      recoverable ? SessionOutcome::kRestart : SessionOutcome::kFatalError;
  outcome.code = recoverable ? kMultiCapOk : kMultiCapErrorStreamFailed;
  outcome.error = error;
  Resolve(outcome);
}

void SessionOrchestrator::OnDeviceChange() {
  SessionOutcome outcome;
  outcome.kind = SessionOutcome::kDeviceChange;
  Resolve(outcome);
}

// ---------------------------------------------------------------------------
// Drain
// ---------------------------------------------------------------------------

bool SessionOrchestrator::Drain(bool* out_write_failed,
                                std::string* out_write_error) {
  state_ = SessionState::kDraining;

  for (auto& target : targets_) target.writer->FinishAllTracks();
  if (audio_writer_) audio_writer_->FinishAllTracks();

  auto note_failure = [&](const std::string& message) {
    if (!*out_write_failed) *out_write_error = message;
    *out_write_failed = true;
  };
  auto check_result = [&](const TrackWriter& writer) {
    WriterResult result = writer.result();
    if (result.ok) return;
    if (result.no_samples) {
      MULTICAP_LOG_WARN("{} was not written: no samples received",
                        writer.path());
      return;
    }
    note_failure(writer.path() + ": " + result.error);
  };

  if (audio_writer_) {
    if (audio_writer_->WaitForCompletion(
            std::chrono::milliseconds(config_.audio_drain_timeout_ms))) {
      check_result(*audio_writer_);
    } else {
      MULTICAP_LOG_ERROR("Timed out finalizing {}", audio_writer_->path());
      note_failure(audio_writer_->path() + ": finalize timed out");
    }
  }

  auto deadline = std::chrono::steady_clock::now() +
                  std::chrono::milliseconds(config_.video_drain_timeout_ms);
  for (auto& target : targets_) {
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (remaining.count() < 0) remaining = std::chrono::milliseconds(0);
    if (target.writer->WaitForCompletion(remaining)) {
      check_result(*target.writer);
    } else {
      MULTICAP_LOG_ERROR("Timed out finalizing {}", target.path);
      note_failure(target.path + ": finalize timed out");
    }
  }
  return !*out_write_failed;
}

int SessionOrchestrator::Finish(const SessionOutcome& outcome,
                                bool write_failed,
                                const std::string& write_error) {
  StopDescriptor stop;
  stop.restarts = restart_count();
  int exit_code = kMultiCapExitSuccess;
  MultiCapError code = kMultiCapOk;

  switch (outcome.kind) {
    case SessionOutcome::kInterrupted:
      stop.reason = kMultiCapStopSignal;
      stop.signal = outcome.signo;
      exit_code = kMultiCapExitSignalBase + outcome.signo;
      break;
    case SessionOutcome::kFatalError:
    case SessionOutcome::kRestart:
      stop.reason = kMultiCapStopError;
      stop.domain = outcome.error.domain;
      stop.code = outcome.error.code;
      exit_code = kMultiCapExitFailure;
      code = outcome.code != kMultiCapOk ? outcome.code
                                         : kMultiCapErrorStreamFailed;
      break;
    case SessionOutcome::kDeviceChange:
      stop.reason = kMultiCapStopDeviceChange;
      break;
    case SessionOutcome::kCompleted:
      stop.reason = kMultiCapStopCompleted;
      break;
  }

  if (write_failed) {
    MULTICAP_LOG_ERROR("Output incomplete: {}", write_error);
    if (code == kMultiCapOk) code = kMultiCapErrorWriteFailed;
    if (exit_code == kMultiCapExitSuccess) {
      stop.reason = kMultiCapStopError;
      stop.domain = kWriterDomain;
      stop.code = static_cast<int>(kMultiCapErrorWriteFailed);
      exit_code = kMultiCapExitFailure;
    }
  }

  {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    last_error_ = code;
  }
  if (deps_.events) deps_.events->EmitStop(stop);
  if (signal_watcher_) signal_watcher_->Uninstall();
  state_ = SessionState::kTerminated;

  if (exit_code == kMultiCapExitSuccess) {
    MULTICAP_LOG_INFO("Capture {} ({} restart{})",
                      multicap_stop_reason_name(stop.reason), stop.restarts,
                      stop.restarts == 1 ? "" : "s");
  }
  return exit_code;
}

}  // namespace internal
}  // namespace multicap
