// Copyright 2026 The multicap Authors

#include "writer/video_track_writer.h"

#include <utility>

#include "core/logger.h"

namespace multicap {
namespace internal {

namespace {

constexpr int kVideoTrack = 0;

}  // namespace

VideoTrackWriter::VideoTrackWriter(MediaSinkFactory* factory,
                                   VideoWriterConfig config)
    : TrackWriter(config.path), factory_(factory), config_(std::move(config)) {}

VideoTrackWriter::~VideoTrackWriter() {
  // Joins any finalize still running in the sink; its callback touches
  // members, so this must happen before they are destroyed.
  std::unique_ptr<MediaSink> sink;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    sink = std::move(sink_);
  }
  sink.reset();
}

bool VideoTrackWriter::OpenSinkLocked(std::string* out_error) {
  if (!factory_) {
    *out_error = "no media sink factory";
    return false;
  }
  TrackSpec track;
  track.kind = TrackKind::kVideo;
  track.name = "video";
  track.width = config_.width;
  track.height = config_.height;
  track.frame_rate = config_.frame_rate;
  track.bitrate = config_.bitrate;
  track.max_keyframe_interval = config_.max_keyframe_interval;
  track.hardware_encoder = config_.hardware_encoder;

  SinkSpec spec;
  spec.path = path();
  spec.tracks.push_back(track);

  sink_ = factory_->CreateSink(spec);
  if (!sink_) {
    *out_error = "cannot create video container";
    return false;
  }
  if (!sink_->Open(out_error)) {
    if (out_error->empty()) *out_error = "cannot open video container";
    sink_.reset();
    return false;
  }
  return true;
}

bool VideoTrackWriter::AppendFrame(const VideoFrame& frame) {
  int64_t pts_ns = 0;
  bool finish = false;
  std::string open_error;
  {
    std::lock_guard<std::mutex> lock(mutex_);

    if (state_ != WriterState::kNotStarted &&
        state_ != WriterState::kWriting) {
      return false;
    }

    if (frame.width() != config_.width || frame.height() != config_.height) {
      if (!size_mismatch_logged_) {
        MULTICAP_LOG_WARN("{}: dropping {}x{} frame, track is {}x{}", path(),
                          frame.width(), frame.height(), config_.width,
                          config_.height);
        size_mismatch_logged_ = true;
      }
      ++frames_dropped_;
      return false;
    }

    if (state_ == WriterState::kNotStarted) {
      if (!OpenSinkLocked(&open_error)) {
        state_ = WriterState::kFailed;
      } else {
        zero_pts_ns_ = frame.pts_ns();
        state_ = WriterState::kWriting;
        MULTICAP_LOG_INFO("Started video recording for {}", path());
      }
    }
  }

  if (!open_error.empty()) {
    MULTICAP_LOG_ERROR("{}: {}", path(), open_error);
    WriterResult result;
    result.error = open_error;
    Complete(result);
    return false;
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != WriterState::kWriting) return false;

    pts_ns = frame.pts_ns() - zero_pts_ns_;
    if (pts_ns < 0) {
      ++frames_dropped_;
      return false;
    }

    if (config_.duration_ns > 0 && pts_ns >= config_.duration_ns) {
      state_ = WriterState::kFinishing;
      finish = true;
    } else if (!sink_->IsReadyForMoreData(kVideoTrack)) {
      ++frames_dropped_;
      MULTICAP_LOG_DEBUG("{}: encoder busy, frame dropped", path());
      return false;
    } else {
      ++in_flight_;
    }
  }

  if (finish) {
    MULTICAP_LOG_INFO("Finishing video track {} after {:.2f} seconds", path(),
                      static_cast<double>(pts_ns) / 1e9);
    FinishWriting();
    return false;
  }

  bool ok = sink_->AppendVideo(kVideoTrack, frame, pts_ns);

  {
    std::lock_guard<std::mutex> lock(mutex_);
    --in_flight_;
    if (ok) {
      ++frames_written_;
      last_pts_ns_ = pts_ns;
    } else {
      ++frames_dropped_;
      if (!append_error_logged_) {
        MULTICAP_LOG_WARN("{}: encoder rejected a frame", path());
        append_error_logged_ = true;
      }
    }
  }
  in_flight_cv_.notify_all();
  return ok;
}

void VideoTrackWriter::FinishAllTracks() {
  bool never_started = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == WriterState::kNotStarted) {
      state_ = WriterState::kFailed;
      never_started = true;
    } else if (state_ == WriterState::kWriting) {
      state_ = WriterState::kFinishing;
    } else {
      return;
    }
  }

  if (never_started) {
    MULTICAP_LOG_WARN("{}: no video frames were written", path());
    WriterResult result;
    result.no_samples = true;
    result.error = "no samples written";
    Complete(result);
    return;
  }
  FinishWriting();
}

void VideoTrackWriter::FinishWriting() {
  MediaSink* sink = nullptr;
  {
    std::unique_lock<std::mutex> lock(mutex_);
    in_flight_cv_.wait(lock, [this] { return in_flight_ == 0; });
    sink = sink_.get();
  }
  if (!sink) {
    OnFinalized(false, "video container closed");
    return;
  }
  sink->EndTrack(kVideoTrack);
  sink->FinalizeAsync([this](bool ok, const std::string& error) {
    OnFinalized(ok, error);
  });
}

void VideoTrackWriter::OnFinalized(bool ok, const std::string& error) {
  WriterResult result;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = ok ? WriterState::kFinished : WriterState::kFailed;
    result.ok = ok;
    result.error = error;
    result.samples_written = frames_written_;
    result.samples_dropped = frames_dropped_;
    result.duration_seconds = static_cast<double>(last_pts_ns_) / 1e9;
  }
  if (ok) {
    MULTICAP_LOG_INFO("wrote {} ({} frames, {:.1f} seconds)", path(),
                      result.samples_written, result.duration_seconds);
  } else {
    MULTICAP_LOG_ERROR("video writer error for {}: {}", path(), error);
  }
  Complete(result);
}

WriterState VideoTrackWriter::state() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

int64_t VideoTrackWriter::frames_written() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return frames_written_;
}

int64_t VideoTrackWriter::frames_dropped() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return frames_dropped_;
}

}  // namespace internal
}  // namespace multicap
