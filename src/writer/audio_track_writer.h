// Copyright 2026 The multicap Authors

#ifndef MULTICAP_WRITER_AUDIO_TRACK_WRITER_H_
#define MULTICAP_WRITER_AUDIO_TRACK_WRITER_H_

#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "core/capture_types.h"
#include "core/media_sink.h"
#include "multicap/multicap.h"
#include "writer/stereo_interleaver.h"
#include "writer/track_writer.h"

namespace multicap {
namespace internal {

/// Parameters for the session's audio file.
struct AudioWriterConfig {
  std::string path;
  MultiCapAudioMode mode = kMultiCapAudioSeparateTracks;
  int sample_rate = 48000;
  int bitrate_per_channel = 64000;
  int64_t duration_ns = 0;  // 0 = record until FinishAllTracks()
  // Merged mode: how far one side may run ahead before the other is
  // padded with silence.
  int max_backlog_ms = 500;
};

/// Writes system audio and microphone into one M4A file.
///
/// Separate mode: two mono AAC tracks sharing one zero point. Each track
/// finishes on its own (duration reached in that track, or an explicit
/// finish); the file is finalized once, after both tracks finished.
///
/// Merged mode: one stereo AAC track, system left, microphone right.
class AudioTrackWriter : public TrackWriter {
 public:
  /// Does NOT take ownership of factory.
  AudioTrackWriter(MediaSinkFactory* factory, AudioWriterConfig config);
  ~AudioTrackWriter() override;

  /// Retime and append one mono buffer from either source.
  /// @return true if the samples were handed to the sink.
  bool AppendSample(const AudioSample& sample);

  void FinishAllTracks() override;

  /// File-level state.
  WriterState state() const;

  /// True once the given source stopped accepting samples.
  bool IsSourceFinishing(AudioSource source) const;

  int64_t buffers_written(AudioSource source) const;
  int64_t buffers_dropped(AudioSource source) const;

  /// Track layout of the container, in track order.
  std::vector<TrackSpec> TrackSpecs() const;

  const AudioWriterConfig& config() const { return config_; }

 private:
  struct SourceState {
    bool finishing = false;
    bool ended = false;
    int in_flight = 0;
    int64_t written = 0;
    int64_t dropped = 0;
    int64_t last_pts_ns = 0;
  };

  static int SourceIndex(AudioSource source) {
    return source == AudioSource::kSystem ? 0 : 1;
  }
  bool merged() const { return config_.mode == kMultiCapAudioMergedStereo; }

  bool OpenSinkLocked(std::string* out_error);
  bool AppendMerged(const AudioSample& sample, int64_t pts_ns);
  void FinishSource(int index);
  void StartFinalize();
  void OnFinalized(bool ok, const std::string& error);

  MediaSinkFactory* factory_;  // Non-owning
  const AudioWriterConfig config_;

  mutable std::mutex mutex_;
  std::condition_variable in_flight_cv_;
  WriterState state_ = WriterState::kNotStarted;
  std::unique_ptr<MediaSink> sink_;
  int64_t zero_pts_ns_ = 0;
  SourceState sources_[2];
  bool finalize_started_ = false;

  // Merged mode only; serializes interleaving and the sink append.
  std::mutex mix_mutex_;
  StereoInterleaver interleaver_;
};

}  // namespace internal
}  // namespace multicap

#endif  // MULTICAP_WRITER_AUDIO_TRACK_WRITER_H_
