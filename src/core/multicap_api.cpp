// Copyright 2026 The multicap Authors
//
// This file implements the public C API functions declared in multicap.h.
// It bridges the extern "C" interface to the internal C++ implementation.

#include "multicap/multicap.h"

#include "core/callback_sink.h"
#include "core/logger.h"

// ---------------------------------------------------------------------------
// Names
// ---------------------------------------------------------------------------

const char* multicap_error_string(MultiCapError error) {
  switch (error) {
    case kMultiCapOk:                      return "ok";
    case kMultiCapErrorInvalidParam:       return "invalid parameter";
    case kMultiCapErrorOutputExists:       return "output file already exists";
    case kMultiCapErrorNoDisplays:         return "no displays found";
    case kMultiCapErrorWriterCreateFailed: return "cannot create output writer";
    case kMultiCapErrorStreamCreateFailed: return "cannot create capture stream";
    case kMultiCapErrorStreamStartFailed:  return "cannot start capture stream";
    case kMultiCapErrorRestartLimit:       return "too many capture restarts";
    case kMultiCapErrorWriteFailed:        return "writing output failed";
    case kMultiCapErrorStreamFailed:       return "capture stream failed";
    case kMultiCapErrorUnknown:            return "unknown error";
  }
  return "unknown error";
}

const char* multicap_stop_reason_name(MultiCapStopReason reason) {
  switch (reason) {
    case kMultiCapStopCompleted:    return "completed";
    case kMultiCapStopDeviceChange: return "device-change";
    case kMultiCapStopError:        return "error";
    case kMultiCapStopSignal:       return "signal";
  }
  return "error";
}

// ---------------------------------------------------------------------------
// Version information
// ---------------------------------------------------------------------------

const char* multicap_version_string(void) { return MULTICAP_VERSION_STRING; }

int multicap_version_major(void) { return MULTICAP_VERSION_MAJOR; }
int multicap_version_minor(void) { return MULTICAP_VERSION_MINOR; }
int multicap_version_patch(void) { return MULTICAP_VERSION_PATCH; }

// ---------------------------------------------------------------------------
// Logging
// ---------------------------------------------------------------------------

void multicap_set_log_level(MultiCapLogLevel level) {
  multicap::internal::SetLogLevel(level);
}

void multicap_set_log_callback(multicap_log_callback_t callback,
                               void* userdata) {
  auto sink = multicap::internal::GetCallbackSink();
  if (sink) {
    sink->SetCallback(callback, userdata);
  }
}

void multicap_log(MultiCapLogLevel level, const char* message) {
  if (!message) return;
  auto logger = multicap::internal::GetLogger();
  if (logger) {
    logger->log(multicap::internal::ToSpdlogLevel(level), "{}", message);
  }
}
