// Copyright 2026 The multicap Authors

#include "writer/stereo_interleaver.h"

#include <algorithm>

namespace multicap {
namespace internal {

StereoInterleaver::StereoInterleaver(int sample_rate,
                                     size_t max_backlog_frames)
    : sample_rate_(sample_rate > 0 ? sample_rate : 48000),
      max_backlog_frames_(max_backlog_frames),
      // 10 ms of timestamp jitter is treated as contiguous.
      gap_tolerance_frames_(sample_rate_ / 100) {}

std::deque<float>& StereoInterleaver::queue(AudioSource side) {
  return side == AudioSource::kSystem ? left_ : right_;
}

const std::deque<float>& StereoInterleaver::queue(AudioSource side) const {
  return side == AudioSource::kSystem ? left_ : right_;
}

size_t StereoInterleaver::pending_frames(AudioSource side) const {
  return queue(side).size();
}

void StereoInterleaver::Push(AudioSource side, const float* samples,
                             size_t frames, int64_t pts_ns) {
  if (!samples || frames == 0) return;
  std::deque<float>& q = queue(side);

  int64_t start = pts_ns * sample_rate_ / 1000000000LL;
  int64_t end = frames_emitted_ + static_cast<int64_t>(q.size());

  size_t skip = 0;
  if (start > end + gap_tolerance_frames_) {
    q.insert(q.end(), static_cast<size_t>(start - end), 0.0f);
  } else if (start < end - gap_tolerance_frames_) {
    skip = static_cast<size_t>(
        (std::min)(end - start, static_cast<int64_t>(frames)));
  }
  q.insert(q.end(), samples + skip, samples + frames);

  // Keep the lagging side from holding the output back forever.
  std::deque<float>& other = queue(side == AudioSource::kSystem
                                       ? AudioSource::kMicrophone
                                       : AudioSource::kSystem);
  if (q.size() > other.size() + max_backlog_frames_) {
    other.insert(other.end(), q.size() - other.size() - max_backlog_frames_,
                 0.0f);
  }
}

bool StereoInterleaver::Pop(AudioSample* out) {
  return Emit((std::min)(left_.size(), right_.size()), out);
}

bool StereoInterleaver::Flush(AudioSample* out) {
  size_t frames = (std::max)(left_.size(), right_.size());
  left_.resize(frames, 0.0f);
  right_.resize(frames, 0.0f);
  return Emit(frames, out);
}

bool StereoInterleaver::Emit(size_t frames, AudioSample* out) {
  if (frames == 0 || !out) return false;

  out->source = AudioSource::kSystem;
  out->sample_rate = sample_rate_;
  out->channels = 2;
  out->pts_ns = frames_emitted_ * 1000000000LL / sample_rate_;
  out->data.resize(frames * 2);
  for (size_t i = 0; i < frames; ++i) {
    out->data[2 * i] = left_[i];
    out->data[2 * i + 1] = right_[i];
  }
  left_.erase(left_.begin(), left_.begin() + static_cast<ptrdiff_t>(frames));
  right_.erase(right_.begin(),
               right_.begin() + static_cast<ptrdiff_t>(frames));
  frames_emitted_ += static_cast<int64_t>(frames);
  return true;
}

}  // namespace internal
}  // namespace multicap
