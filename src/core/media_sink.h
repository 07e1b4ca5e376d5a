// Copyright 2026 The multicap Authors

#ifndef MULTICAP_CORE_MEDIA_SINK_H_
#define MULTICAP_CORE_MEDIA_SINK_H_

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "core/capture_types.h"
#include "core/video_frame.h"

namespace multicap {
namespace internal {

enum class TrackKind {
  kVideo = 0,
  kAudio = 1,
};

/// Encoding parameters for one track of a container.
struct TrackSpec {
  TrackKind kind = TrackKind::kVideo;
  std::string name;  // e.g. "video", "system", "microphone", "mix"

  // Video.
  int width = 0;
  int height = 0;
  double frame_rate = 1.0;
  int bitrate = 4000000;  // 4 Mbps
  int max_keyframe_interval = 30000;  // frames
  bool hardware_encoder = false;

  // Audio.
  int sample_rate = 48000;
  int channels = 1;
  int audio_bitrate = 64000;
};

/// One output container file.
struct SinkSpec {
  std::string path;
  std::vector<TrackSpec> tracks;
};

/// Abstract container writer (encoder + muxer + file).
///
/// Threading: Append* and IsReadyForMoreData may be called concurrently for
/// different tracks; calls for the same track are serialized by the caller.
/// EndTrack/FinalizeAsync are called once each, after the last append of the
/// track/file.
///
/// Linux: GStreamer appsrc pipelines.
class MediaSink {
 public:
  using FinalizeCallback =
      std::function<void(bool ok, const std::string& error)>;

  virtual ~MediaSink() = default;

  // Non-copyable.
  MediaSink(const MediaSink&) = delete;
  MediaSink& operator=(const MediaSink&) = delete;

  /// Create the output file and start the encoders.
  virtual bool Open(std::string* out_error) = 0;

  /// Backpressure probe: false means the next sample should be dropped.
  virtual bool IsReadyForMoreData(int track) const = 0;

  /// Append one frame at the given (already retimed) timestamp.
  virtual bool AppendVideo(int track, const VideoFrame& frame,
                           int64_t pts_ns) = 0;

  /// Append one PCM chunk at the given (already retimed) timestamp.
  virtual bool AppendAudio(int track, const AudioSample& sample,
                           int64_t pts_ns) = 0;

  /// No more data for this track.
  virtual void EndTrack(int track) = 0;

  /// Flush and close the file. `callback` runs exactly once, possibly on
  /// another thread, possibly before this returns.
  virtual void FinalizeAsync(FinalizeCallback callback) = 0;

  virtual const std::string& path() const = 0;

 protected:
  MediaSink() = default;
};

/// Creates MediaSinks; the session owns one factory.
class MediaSinkFactory {
 public:
  virtual ~MediaSinkFactory() = default;

  /// @return nullptr if the container/encoders cannot be set up.
  virtual std::unique_ptr<MediaSink> CreateSink(const SinkSpec& spec) = 0;
};

/// Factory function implemented per-platform (one per build target).
/// Defined in platform/<os>/xxx_media_sink.cpp.
std::unique_ptr<MediaSinkFactory> CreatePlatformMediaSinkFactory();

}  // namespace internal
}  // namespace multicap

#endif  // MULTICAP_CORE_MEDIA_SINK_H_
