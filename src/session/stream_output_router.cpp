// Copyright 2026 The multicap Authors

#include "session/stream_output_router.h"

#include <utility>

#include "core/logger.h"
#include "mask/frame_masker.h"

namespace multicap {
namespace internal {

StreamOutputRouter::StreamOutputRouter(const DisplayInfo& display,
                                       VideoTrackWriter* video_writer,
                                       AudioTrackWriter* audio_writer,
                                       const WindowMaskDetector* mask_detector,
                                       Options options, ErrorDelegate on_error)
    : display_(display),
      video_writer_(video_writer),
      audio_writer_(audio_writer),
      mask_detector_(mask_detector && mask_detector->has_targets()
                         ? mask_detector
                         : nullptr),
      options_(options),
      on_error_(std::move(on_error)),
      activity_window_start_(std::chrono::steady_clock::now()) {}

void StreamOutputRouter::OnStreamEvent(StreamEvent event) {
  if (auto* video = std::get_if<VideoFrameEvent>(&event)) {
    HandleVideo(video);
  } else if (auto* audio = std::get_if<AudioSampleEvent>(&event)) {
    HandleAudio(*audio);
  } else if (auto* fatal = std::get_if<FatalErrorEvent>(&event)) {
    HandleError(fatal->error, false);
  } else if (auto* recoverable = std::get_if<RecoverableErrorEvent>(&event)) {
    HandleError(recoverable->error, true);
  }
}

void StreamOutputRouter::HandleVideo(VideoFrameEvent* event) {
  if (!event->frame) return;
  int64_t count = ++frames_received_;
  if (options_.verbose) {
    MULTICAP_LOG_DEBUG("display {}: frame {} at {:.3f}s", display_.id, count,
                       static_cast<double>(event->frame->pts_ns()) / 1e9);
  }

  if (mask_detector_) {
    const auto& regions = CurrentMaskRegions();
    if (!regions.empty()) {
      ApplyMask(event->frame.get(), regions, display_.bounds);
      ++frames_masked_;
    }
  }

  if (video_writer_) video_writer_->AppendFrame(*event->frame);
}

const std::vector<Rect>& StreamOutputRouter::CurrentMaskRegions() {
  auto now = std::chrono::steady_clock::now();
  if (mask_valid_ && options_.mask_interval_ms > 0 &&
      now - mask_time_ <
          std::chrono::milliseconds(options_.mask_interval_ms)) {
    return mask_regions_;
  }
  mask_regions_.clear();
  // Only regions on this display matter.
  for (const auto& region : mask_detector_->DetectRegions()) {
    Rect clipped = Intersect(region, display_.bounds);
    if (!clipped.IsEmpty()) mask_regions_.push_back(clipped);
  }
  mask_time_ = now;
  mask_valid_ = true;
  return mask_regions_;
}

void StreamOutputRouter::HandleAudio(const AudioSampleEvent& event) {
  ++audio_buffers_;
  if (options_.verbose) LogAudioActivity(event.sample.source);
  if (audio_writer_) audio_writer_->AppendSample(event.sample);
}

void StreamOutputRouter::LogAudioActivity(AudioSource source) {
  std::lock_guard<std::mutex> lock(activity_mutex_);
  if (source == AudioSource::kSystem) {
    ++system_buffers_in_window_;
  } else {
    ++microphone_buffers_in_window_;
  }
  auto now = std::chrono::steady_clock::now();
  if (now - activity_window_start_ >= std::chrono::seconds(1)) {
    MULTICAP_LOG_DEBUG("audio buffers/s: system={} microphone={}",
                       system_buffers_in_window_,
                       microphone_buffers_in_window_);
    system_buffers_in_window_ = 0;
    microphone_buffers_in_window_ = 0;
    activity_window_start_ = now;
  }
}

void StreamOutputRouter::HandleError(const StreamError& error,
                                     bool recoverable) {
  if (recoverable) {
    MULTICAP_LOG_WARN("display {}: stream error {}:{} ({}), will restart",
                      display_.id, error.domain, error.code, error.message);
  } else {
    MULTICAP_LOG_ERROR("display {}: stream error {}:{} ({})", display_.id,
                       error.domain, error.code, error.message);
  }
  if (on_error_) on_error_(error, recoverable);
}

}  // namespace internal
}  // namespace multicap
