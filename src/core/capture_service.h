// Copyright 2026 The multicap Authors

#ifndef MULTICAP_CORE_CAPTURE_SERVICE_H_
#define MULTICAP_CORE_CAPTURE_SERVICE_H_

#include <memory>
#include <string>
#include <vector>

#include "core/capture_types.h"

namespace multicap {
namespace internal {

/// Receives everything a capture stream produces.
///
/// Called on the capture service's delivery threads. Events of one kind
/// from one stream arrive in order; no ordering holds across streams.
class StreamHandler {
 public:
  virtual ~StreamHandler() = default;

  virtual void OnStreamEvent(StreamEvent event) = 0;
};

/// Parameters for one capture stream (one display).
struct StreamConfig {
  DisplayInfo display;
  double frame_rate = 1.0;
  bool capture_audio = false;       // System audio + microphone
  int audio_sample_rate = 48000;
  int audio_channels = 1;
  const ErrorPolicy* error_policy = nullptr;  // Non-owning
};

/// One running capture of a display (and optionally the audio devices).
///
/// Streams are per attempt: after Stop() a stream is not restarted; the
/// session builds a new one instead.
class CaptureStream {
 public:
  virtual ~CaptureStream() = default;

  // Non-copyable.
  CaptureStream(const CaptureStream&) = delete;
  CaptureStream& operator=(const CaptureStream&) = delete;

  /// Begin delivering events to the handler.
  /// @return false if the stream could not be started.
  virtual bool Start(StreamError* out_error) = 0;

  /// Stop delivery. When this returns no further events are delivered.
  /// @return false if the backend reported a problem while stopping.
  virtual bool Stop(StreamError* out_error) = 0;

 protected:
  CaptureStream() = default;
};

/// Abstract interface for the OS screen/audio capture service.
///
/// Each platform provides a concrete implementation; only the one for the
/// build platform is compiled.
///
/// Linux: X11 frame grabs + PulseAudio record streams.
class CaptureService {
 public:
  virtual ~CaptureService() = default;

  // Non-copyable.
  CaptureService(const CaptureService&) = delete;
  CaptureService& operator=(const CaptureService&) = delete;

  /// Refresh and return the list of capturable displays.
  /// An empty list means the service is unavailable.
  virtual std::vector<DisplayInfo> EnumerateDisplays() = 0;

  /// Create (but do not start) a stream for one display.
  /// @param handler  Non-owning; must outlive the stream.
  virtual std::unique_ptr<CaptureStream> CreateStream(
      const StreamConfig& config, StreamHandler* handler) = 0;

 protected:
  CaptureService() = default;
};

/// Factory function implemented per-platform (one per build target).
/// Defined in platform/<os>/xxx_capture_service.cpp.
std::unique_ptr<CaptureService> CreatePlatformCaptureService();

}  // namespace internal
}  // namespace multicap

#endif  // MULTICAP_CORE_CAPTURE_SERVICE_H_
