// Copyright 2026 The multicap Authors

#ifndef MULTICAP_WRITER_VIDEO_TRACK_WRITER_H_
#define MULTICAP_WRITER_VIDEO_TRACK_WRITER_H_

#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

#include "core/media_sink.h"
#include "core/video_frame.h"
#include "writer/track_writer.h"

namespace multicap {
namespace internal {

/// Parameters for one display's video file.
struct VideoWriterConfig {
  std::string path;
  int width = 0;
  int height = 0;
  double frame_rate = 1.0;
  int bitrate = 4000000;
  int max_keyframe_interval = 30000;
  bool hardware_encoder = false;
  int64_t duration_ns = 0;  // 0 = record until FinishAllTracks()
};

/// Writes the frames of one display into an H.264 MP4 file.
///
/// The container is created lazily on the first frame, whose timestamp
/// becomes time zero. The writer outlives capture streams: a restarted
/// stream keeps appending to the same file.
class VideoTrackWriter : public TrackWriter {
 public:
  /// Does NOT take ownership of factory.
  VideoTrackWriter(MediaSinkFactory* factory, VideoWriterConfig config);
  ~VideoTrackWriter() override;

  /// Retime and append one frame.
  /// @return true if the frame was handed to the sink.
  bool AppendFrame(const VideoFrame& frame);

  void FinishAllTracks() override;

  WriterState state() const;
  int64_t frames_written() const;
  int64_t frames_dropped() const;

  const VideoWriterConfig& config() const { return config_; }

 private:
  bool OpenSinkLocked(std::string* out_error);
  void FinishWriting();
  void OnFinalized(bool ok, const std::string& error);

  MediaSinkFactory* factory_;  // Non-owning
  const VideoWriterConfig config_;

  mutable std::mutex mutex_;
  std::condition_variable in_flight_cv_;
  WriterState state_ = WriterState::kNotStarted;
  std::unique_ptr<MediaSink> sink_;
  int64_t zero_pts_ns_ = 0;
  int64_t last_pts_ns_ = 0;  // Retimed
  int in_flight_ = 0;
  int64_t frames_written_ = 0;
  int64_t frames_dropped_ = 0;
  bool size_mismatch_logged_ = false;
  bool append_error_logged_ = false;
};

}  // namespace internal
}  // namespace multicap

#endif  // MULTICAP_WRITER_VIDEO_TRACK_WRITER_H_
