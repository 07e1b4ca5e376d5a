// Copyright 2026 The multicap Authors

#ifndef MULTICAP_SESSION_STREAM_OUTPUT_ROUTER_H_
#define MULTICAP_SESSION_STREAM_OUTPUT_ROUTER_H_

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <vector>

#include "core/capture_service.h"
#include "core/capture_types.h"
#include "mask/window_mask_detector.h"
#include "writer/audio_track_writer.h"
#include "writer/video_track_writer.h"

namespace multicap {
namespace internal {

/// Per-display StreamHandler: frames go (masked, if configured) to the
/// display's video writer, audio to the shared audio writer, and stream
/// errors to the session.
class StreamOutputRouter : public StreamHandler {
 public:
  /// Called for every stream error, classified by the stream's ErrorPolicy.
  using ErrorDelegate =
      std::function<void(const StreamError& error, bool recoverable)>;

  struct Options {
    int mask_interval_ms = 0;  // 0 = detect windows on every frame
    bool verbose = false;      // Per-frame / per-second activity logs
  };

  /// Writers and detector are non-owning; audio_writer and mask_detector may
  /// be null.
  StreamOutputRouter(const DisplayInfo& display, VideoTrackWriter* video_writer,
                     AudioTrackWriter* audio_writer,
                     const WindowMaskDetector* mask_detector, Options options,
                     ErrorDelegate on_error);

  void OnStreamEvent(StreamEvent event) override;

  int64_t frames_received() const { return frames_received_; }
  int64_t frames_masked() const { return frames_masked_; }
  int64_t audio_buffers_received() const { return audio_buffers_; }

 private:
  void HandleVideo(VideoFrameEvent* event);
  void HandleAudio(const AudioSampleEvent& event);
  void HandleError(const StreamError& error, bool recoverable);

  const std::vector<Rect>& CurrentMaskRegions();
  void LogAudioActivity(AudioSource source);

  const DisplayInfo display_;
  VideoTrackWriter* video_writer_;           // Non-owning
  AudioTrackWriter* audio_writer_;           // Non-owning, nullable
  const WindowMaskDetector* mask_detector_;  // Non-owning, nullable
  const Options options_;
  ErrorDelegate on_error_;

  // Video delivery is serialized per stream; no lock needed.
  std::vector<Rect> mask_regions_;
  std::chrono::steady_clock::time_point mask_time_;
  bool mask_valid_ = false;

  std::atomic<int64_t> frames_received_{0};
  std::atomic<int64_t> frames_masked_{0};
  std::atomic<int64_t> audio_buffers_{0};

  std::mutex activity_mutex_;
  std::chrono::steady_clock::time_point activity_window_start_;
  int system_buffers_in_window_ = 0;
  int microphone_buffers_in_window_ = 0;
};

}  // namespace internal
}  // namespace multicap

#endif  // MULTICAP_SESSION_STREAM_OUTPUT_ROUTER_H_
