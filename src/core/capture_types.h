// Copyright 2026 The multicap Authors

#ifndef MULTICAP_CORE_CAPTURE_TYPES_H_
#define MULTICAP_CORE_CAPTURE_TYPES_H_

#include <cstdint>
#include <memory>
#include <string>
#include <variant>
#include <vector>

#include "core/geometry.h"
#include "core/video_frame.h"

namespace multicap {
namespace internal {

/// Which capture channel an audio buffer came from.
enum class AudioSource {
  kSystem = 0,      // Output mix (what the speakers play)
  kMicrophone = 1,  // Default input device
};

const char* AudioSourceName(AudioSource source);

/// A chunk of PCM audio as delivered by the capture service.
/// Samples are 32-bit float, interleaved when channels > 1.
struct AudioSample {
  AudioSource source = AudioSource::kSystem;
  int sample_rate = 48000;
  int channels = 1;
  std::vector<float> data;
  int64_t pts_ns = 0;  // Presentation timestamp of the first frame

  size_t frame_count() const {
    return channels > 0 ? data.size() / static_cast<size_t>(channels) : 0;
  }
  int64_t duration_ns() const {
    if (sample_rate <= 0) return 0;
    return static_cast<int64_t>(frame_count()) * 1000000000LL / sample_rate;
  }
};

/// Out-of-band stream failure, as reported by the capture backend.
struct StreamError {
  std::string domain;  // e.g. "x11", "pulseaudio"
  int code = 0;
  std::string message;
};

/// A physical display the capture service can record.
struct DisplayInfo {
  uint32_t id = 0;
  int width = 0;   // Pixel dimensions of captured frames
  int height = 0;
  Rect bounds;     // Global screen coordinates
  std::string name;
};

// ---------------------------------------------------------------------------
// Stream events: one tagged variant routed through a single handler.
// ---------------------------------------------------------------------------

struct VideoFrameEvent {
  std::unique_ptr<VideoFrame> frame;
};

struct AudioSampleEvent {
  AudioSample sample;
};

struct FatalErrorEvent {
  StreamError error;
};

struct RecoverableErrorEvent {
  StreamError error;
};

using StreamEvent = std::variant<VideoFrameEvent, AudioSampleEvent,
                                 FatalErrorEvent, RecoverableErrorEvent>;

/// Identifies a class of stream failure.
struct StreamErrorCode {
  std::string domain;
  int code = 0;

  bool operator==(const StreamErrorCode& o) const {
    return code == o.code && domain == o.domain;
  }
};

/// Decides which stream failures are transient (worth a restart).
///
/// The table is configuration, not code: backends only report
/// {domain, code}; the session decides what is recoverable.
class ErrorPolicy {
 public:
  ErrorPolicy();
  explicit ErrorPolicy(std::vector<StreamErrorCode> recoverable);

  bool IsRecoverable(const StreamError& error) const;

  /// Wrap a backend error into the matching StreamEvent alternative.
  StreamEvent Classify(StreamError error) const;

  const std::vector<StreamErrorCode>& recoverable() const {
    return recoverable_;
  }

  /// Built-in table for the Linux backends.
  static std::vector<StreamErrorCode> DefaultRecoverable();

  /// Parse "domain:code[,domain:code...]". Whitespace around items is
  /// ignored. Returns false on malformed input.
  static bool ParseCodeList(const std::string& text,
                            std::vector<StreamErrorCode>* out);

 private:
  std::vector<StreamErrorCode> recoverable_;
};

}  // namespace internal
}  // namespace multicap

#endif  // MULTICAP_CORE_CAPTURE_TYPES_H_
