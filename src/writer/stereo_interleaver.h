// Copyright 2026 The multicap Authors

#ifndef MULTICAP_WRITER_STEREO_INTERLEAVER_H_
#define MULTICAP_WRITER_STEREO_INTERLEAVER_H_

#include <cstddef>
#include <cstdint>
#include <deque>

#include "core/capture_types.h"

namespace multicap {
namespace internal {

/// Pairs two mono streams into one interleaved stereo stream.
///
/// System audio goes to the left channel, microphone to the right. Input
/// chunks are placed by their (retimed) timestamps: a gap before a chunk is
/// filled with silence, and samples that fall before the side's current end
/// are dropped. When one side falls more than `max_backlog_frames` behind,
/// it is padded with silence so output keeps flowing.
///
/// Not thread-safe; the owner serializes calls.
class StereoInterleaver {
 public:
  StereoInterleaver(int sample_rate, size_t max_backlog_frames);

  /// Queue mono samples for one side.
  void Push(AudioSource side, const float* samples, size_t frames,
            int64_t pts_ns);

  /// Move every frame available on both sides into `out` (stereo,
  /// interleaved, pts from the number of frames emitted so far).
  /// @return false if nothing was ready.
  bool Pop(AudioSample* out);

  /// Pad the shorter side and emit everything still queued.
  bool Flush(AudioSample* out);

  size_t pending_frames(AudioSource side) const;
  int64_t frames_emitted() const { return frames_emitted_; }

 private:
  std::deque<float>& queue(AudioSource side);
  const std::deque<float>& queue(AudioSource side) const;
  bool Emit(size_t frames, AudioSample* out);

  const int sample_rate_;
  const size_t max_backlog_frames_;
  const int64_t gap_tolerance_frames_;

  std::deque<float> left_;
  std::deque<float> right_;
  int64_t frames_emitted_ = 0;
};

}  // namespace internal
}  // namespace multicap

#endif  // MULTICAP_WRITER_STEREO_INTERLEAVER_H_
