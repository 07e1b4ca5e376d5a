// Copyright 2026 The multicap Authors
// Session settings: defaults, settings file and command line.

#ifndef MULTICAP_SESSION_SESSION_CONFIG_H_
#define MULTICAP_SESSION_SESSION_CONFIG_H_

#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

#include "core/capture_types.h"
#include "multicap/multicap.h"

namespace multicap {
namespace internal {

/// What to do when the default audio input or output device changes.
enum class DeviceChangePolicy {
  kRestart = 0,  // Rebuild the capture streams, keep writing the same files
  kStop = 1,     // End the session gracefully
};

struct SessionConfig {
  std::string output_base;
  double frame_rate = 1.0;     // Hz
  double length_seconds = 0;   // 0 = until interrupted
  bool audio = true;
  MultiCapAudioMode audio_mode = kMultiCapAudioSeparateTracks;
  int bitrate = 4000000;
  bool hardware_encoder = false;

  std::vector<std::string> mask_apps;
  int mask_interval_ms = 0;  // 0 = recompute on every frame

  int max_restarts = 5;
  int restart_delay_ms = 500;
  int audio_drain_timeout_ms = 5000;
  int video_drain_timeout_ms = 30000;
  std::vector<StreamErrorCode> recoverable_errors =
      ErrorPolicy::DefaultRecoverable();
  DeviceChangePolicy on_device_change = DeviceChangePolicy::kRestart;

  MultiCapLogLevel log_level = kMultiCapLogInfo;

  /// Recording length in nanoseconds, 0 if indefinite.
  int64_t duration_ns() const {
    return length_seconds > 0
               ? static_cast<int64_t>(length_seconds * 1000000000.0)
               : 0;
  }
};

/// Result of command-line parsing.
enum class ParseOutcome {
  kRun = 0,          // Config is complete; start recording
  kExitSuccess = 1,  // --help / --version handled
  kExitError = 2,    // Usage error (already reported)
};

/// Apply one `key = value` setting.
/// @return false (with a message in *out_error) on unknown keys or bad
///         values.
bool ApplySetting(const std::string& key, const std::string& value,
                  SessionConfig* config, std::string* out_error);

/// Load a settings file: one `key = value` per line, `#` starts a comment.
bool LoadSettingsFile(const std::string& path, SessionConfig* config,
                      std::string* out_error);

/// Parse argv. The settings file named by --config (if any) is applied
/// first, so command-line options override it.
ParseOutcome ParseCommandLine(int argc, char** argv, SessionConfig* config,
                              std::ostream& out, std::ostream& err);

std::string UsageText(const char* program);

/// Reject settings that cannot produce a recording.
bool ValidateConfig(const SessionConfig& config, std::string* out_error);

}  // namespace internal
}  // namespace multicap

#endif  // MULTICAP_SESSION_SESSION_CONFIG_H_
