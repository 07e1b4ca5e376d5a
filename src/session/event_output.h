// Copyright 2026 The multicap Authors
// Machine-readable JSONL event stream (one JSON object per line).

#ifndef MULTICAP_SESSION_EVENT_OUTPUT_H_
#define MULTICAP_SESSION_EVENT_OUTPUT_H_

#include <cstdint>
#include <mutex>
#include <ostream>
#include <string>
#include <vector>

#include "multicap/multicap.h"

namespace multicap {
namespace internal {

/// One per-display video file.
struct VideoDescriptor {
  std::string file;
  uint32_t display_id = 0;
  int width = 0;
  int height = 0;
  int x = 0;
  int y = 0;
  double frame_rate = 1.0;
};

/// The session's audio file.
struct AudioDescriptor {
  std::string file;
  int sample_rate = 48000;
  int channels = 1;               // Per track
  std::vector<std::string> tracks;
  std::string input_device;       // Empty = unknown
  std::string output_device;
};

/// Terminal line.
struct StopDescriptor {
  MultiCapStopReason reason = kMultiCapStopCompleted;
  std::string domain;  // reason == error
  int code = 0;        // reason == error
  int signal = 0;      // reason == signal
  int restarts = 0;
};

/// Writes events to a stream (stdout in the CLI), one line each, flushed.
/// Safe to call from any thread.
class EventOutput {
 public:
  /// Does NOT take ownership of out.
  explicit EventOutput(std::ostream* out);

  void EmitVideoDescriptor(const VideoDescriptor& video);
  void EmitAudioDescriptor(const AudioDescriptor& audio);
  void EmitStop(const StopDescriptor& stop);

  /// JSON string literal (with quotes) for `value`.
  static std::string Quote(const std::string& value);

  /// Shortest decimal form ("1", "29.97").
  static std::string FormatNumber(double value);

 private:
  void WriteLine(const std::string& line);

  std::mutex mutex_;
  std::ostream* out_;  // Non-owning
};

}  // namespace internal
}  // namespace multicap

#endif  // MULTICAP_SESSION_EVENT_OUTPUT_H_
