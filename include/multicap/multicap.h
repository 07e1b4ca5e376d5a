// Copyright 2026 The multicap Authors
//
// Licensed under the MIT License. See LICENSE file in the project root for
// full license information.

#ifndef MULTICAP_MULTICAP_H_
#define MULTICAP_MULTICAP_H_

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

// ---------------------------------------------------------------------------
// Export macro
// ---------------------------------------------------------------------------
#if defined(__GNUC__) || defined(__clang__)
#define MULTICAP_API __attribute__((visibility("default")))
#else
#define MULTICAP_API
#endif

// ---------------------------------------------------------------------------
// Version (auto-generated from CMakeLists.txt via configure_file)
// ---------------------------------------------------------------------------
#include "multicap/version.h"

// ---------------------------------------------------------------------------
// Thread safety
// ---------------------------------------------------------------------------
//
//   - multicap_set_log_level() and multicap_set_log_callback() are
//     process-global and internally synchronized.
//   - multicap_version_*() and the *_name() helpers are stateless and safe
//     to call from any thread at any time.
//

// ---------------------------------------------------------------------------
// Types
// ---------------------------------------------------------------------------

/// Error codes reported by multicap.
typedef enum MultiCapError {
  kMultiCapOk = 0,
  kMultiCapErrorInvalidParam = -1,
  kMultiCapErrorOutputExists = -2,        ///< Output path already exists
  kMultiCapErrorNoDisplays = -3,          ///< No capturable display found
  kMultiCapErrorWriterCreateFailed = -4,  ///< Container writer setup failed
  kMultiCapErrorStreamCreateFailed = -5,  ///< Capture stream setup failed
  kMultiCapErrorStreamStartFailed = -6,   ///< Capture stream refused to start
  kMultiCapErrorRestartLimit = -7,        ///< Too many recoverable failures
  kMultiCapErrorWriteFailed = -8,         ///< Finalizing an output failed
  kMultiCapErrorStreamFailed = -9,        ///< Unrecoverable stream error
  kMultiCapErrorUnknown = -99,
} MultiCapError;

/// Process exit codes.
typedef enum MultiCapExitCode {
  kMultiCapExitSuccess = 0,
  kMultiCapExitFailure = 1,
  kMultiCapExitUsage = 2,
  kMultiCapExitSignalBase = 128,  ///< Interrupted: 128 + signal number
} MultiCapExitCode;

/// Why a capture session ended (reported on the terminal event line).
typedef enum MultiCapStopReason {
  kMultiCapStopCompleted = 0,
  kMultiCapStopDeviceChange = 1,
  kMultiCapStopError = 2,
  kMultiCapStopSignal = 3,
} MultiCapStopReason;

/// Audio container layout.
typedef enum MultiCapAudioMode {
  kMultiCapAudioSeparateTracks = 0,  ///< Two mono tracks (system, microphone)
  kMultiCapAudioMergedStereo = 1,    ///< One stereo track (L=system, R=mic)
} MultiCapAudioMode;

/// Log severity levels for the internal logging system.
typedef enum MultiCapLogLevel {
  kMultiCapLogTrace = 0,   ///< Very detailed diagnostic info
  kMultiCapLogDebug = 1,   ///< Debug-level messages
  kMultiCapLogInfo = 2,    ///< Informational messages (default)
  kMultiCapLogWarn = 3,    ///< Warnings
  kMultiCapLogError = 4,   ///< Errors
  kMultiCapLogFatal = 5,   ///< Fatal / critical errors
} MultiCapLogLevel;

/// User-defined log callback function type.
///
/// @param level  The severity level of the message.
/// @param message  Null-terminated UTF-8 log message.
/// @param userdata  The opaque pointer passed to multicap_set_log_callback.
typedef void (*multicap_log_callback_t)(MultiCapLogLevel level,
                                        const char* message,
                                        void* userdata);

// ---------------------------------------------------------------------------
// Names
// ---------------------------------------------------------------------------

/// Short human-readable description of an error code. Never NULL.
MULTICAP_API const char* multicap_error_string(MultiCapError error);

/// Wire name of a stop reason ("completed", "device-change", "error",
/// "signal"). Never NULL.
MULTICAP_API const char* multicap_stop_reason_name(MultiCapStopReason reason);

// ---------------------------------------------------------------------------
// Version information
// ---------------------------------------------------------------------------

/// Get the version as a string (e.g. "1.0.0").
MULTICAP_API const char* multicap_version_string(void);

/// Get the major version number.
MULTICAP_API int multicap_version_major(void);

/// Get the minor version number.
MULTICAP_API int multicap_version_minor(void);

/// Get the patch version number.
MULTICAP_API int multicap_version_patch(void);

// ---------------------------------------------------------------------------
// Logging
// ---------------------------------------------------------------------------

/// Set the minimum log level. Messages below this level are discarded.
/// Default: kMultiCapLogInfo.
MULTICAP_API void multicap_set_log_level(MultiCapLogLevel level);

/// Set a user-defined log callback.
///
/// When a callback is registered, all log messages (at or above the current
/// level) are forwarded to it in addition to stderr.
/// Pass NULL to unregister.
MULTICAP_API void multicap_set_log_callback(multicap_log_callback_t callback,
                                            void* userdata);

/// Emit a log message at the given level through the multicap logging
/// system. NULL messages are ignored.
MULTICAP_API void multicap_log(MultiCapLogLevel level, const char* message);

#ifdef __cplusplus
}  // extern "C"
#endif

#endif  // MULTICAP_MULTICAP_H_
