// Copyright 2026 The multicap Authors

#include "writer/audio_track_writer.h"

#include <utility>

#include "core/logger.h"

namespace multicap {
namespace internal {

namespace {

constexpr int kMixTrack = 0;

size_t BacklogFrames(const AudioWriterConfig& config) {
  return static_cast<size_t>(config.sample_rate) *
         static_cast<size_t>(config.max_backlog_ms > 0 ? config.max_backlog_ms
                                                       : 0) /
         1000;
}

}  // namespace

AudioTrackWriter::AudioTrackWriter(MediaSinkFactory* factory,
                                   AudioWriterConfig config)
    : TrackWriter(config.path),
      factory_(factory),
      config_(std::move(config)),
      interleaver_(config_.sample_rate, BacklogFrames(config_)) {}

AudioTrackWriter::~AudioTrackWriter() {
  std::unique_ptr<MediaSink> sink;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    sink = std::move(sink_);
  }
  sink.reset();
}

std::vector<TrackSpec> AudioTrackWriter::TrackSpecs() const {
  std::vector<TrackSpec> tracks;
  TrackSpec track;
  track.kind = TrackKind::kAudio;
  track.sample_rate = config_.sample_rate;
  if (merged()) {
    track.name = "mix";
    track.channels = 2;
    track.audio_bitrate = config_.bitrate_per_channel * 2;
    tracks.push_back(track);
  } else {
    track.channels = 1;
    track.audio_bitrate = config_.bitrate_per_channel;
    track.name = AudioSourceName(AudioSource::kSystem);
    tracks.push_back(track);
    track.name = AudioSourceName(AudioSource::kMicrophone);
    tracks.push_back(track);
  }
  return tracks;
}

bool AudioTrackWriter::OpenSinkLocked(std::string* out_error) {
  if (!factory_) {
    *out_error = "no media sink factory";
    return false;
  }
  SinkSpec spec;
  spec.path = path();
  spec.tracks = TrackSpecs();

  sink_ = factory_->CreateSink(spec);
  if (!sink_) {
    *out_error = "cannot create audio container";
    return false;
  }
  if (!sink_->Open(out_error)) {
    if (out_error->empty()) *out_error = "cannot open audio container";
    sink_.reset();
    return false;
  }
  return true;
}

bool AudioTrackWriter::AppendSample(const AudioSample& sample) {
  const int index = SourceIndex(sample.source);
  int64_t pts_ns = 0;
  bool finish = false;
  bool finish_idle_other = false;
  std::string open_error;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != WriterState::kNotStarted &&
        state_ != WriterState::kWriting) {
      return false;
    }
    SourceState& source = sources_[index];
    if (source.finishing) return false;

    if (sample.channels != 1 || sample.data.empty()) {
      ++source.dropped;
      return false;
    }

    if (state_ == WriterState::kNotStarted) {
      if (!OpenSinkLocked(&open_error)) {
        state_ = WriterState::kFailed;
      } else {
        zero_pts_ns_ = sample.pts_ns;
        state_ = WriterState::kWriting;
        MULTICAP_LOG_INFO("Started audio recording for {}", path());
      }
    }

    if (open_error.empty()) {
      pts_ns = sample.pts_ns - zero_pts_ns_;
      if (pts_ns < 0) {
        ++source.dropped;
        return false;
      }
      if (config_.duration_ns > 0 && pts_ns >= config_.duration_ns) {
        source.finishing = true;
        finish = true;
        // A source that never delivered anything (no microphone) would
        // otherwise hold the file open forever.
        SourceState& other = sources_[1 - index];
        if (!other.finishing && other.written == 0 && other.in_flight == 0) {
          other.finishing = true;
          finish_idle_other = true;
        }
        if (other.finishing) state_ = WriterState::kFinishing;
      } else if (!merged() && !sink_->IsReadyForMoreData(index)) {
        ++source.dropped;
        return false;
      } else {
        ++source.in_flight;
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

  if (finish) {
    MULTICAP_LOG_INFO("Finishing {} audio track after {:.2f} seconds",
                      AudioSourceName(sample.source),
                      static_cast<double>(pts_ns) / 1e9);
    FinishSource(index);
    if (finish_idle_other) FinishSource(1 - index);
    return false;
  }

  bool ok = merged() ? AppendMerged(sample, pts_ns)
                     : sink_->AppendAudio(index, sample, pts_ns);

  {
    std::lock_guard<std::mutex> lock(mutex_);
    SourceState& source = sources_[index];
    --source.in_flight;
    if (ok) {
      ++source.written;
      source.last_pts_ns = pts_ns + sample.duration_ns();
    } else {
      ++source.dropped;
    }
  }
  in_flight_cv_.notify_all();
  return ok;
}

bool AudioTrackWriter::AppendMerged(const AudioSample& sample,
                                    int64_t pts_ns) {
  std::lock_guard<std::mutex> lock(mix_mutex_);
  interleaver_.Push(sample.source, sample.data.data(), sample.frame_count(),
                    pts_ns);
  AudioSample stereo;
  if (!interleaver_.Pop(&stereo)) return true;  // Waiting for the other side
  if (!sink_->IsReadyForMoreData(kMixTrack)) {
    MULTICAP_LOG_DEBUG("{}: encoder busy, audio dropped", path());
    return false;
  }
  return sink_->AppendAudio(kMixTrack, stereo, stereo.pts_ns);
}

void AudioTrackWriter::FinishAllTracks() {
  bool never_started = false;
  std::vector<int> to_finish;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == WriterState::kNotStarted) {
      state_ = WriterState::kFailed;
      never_started = true;
    } else if (state_ == WriterState::kWriting) {
      for (int i = 0; i < 2; ++i) {
        if (!sources_[i].finishing) {
          sources_[i].finishing = true;
          to_finish.push_back(i);
        }
      }
      state_ = WriterState::kFinishing;
    } else {
      return;
    }
  }

  if (never_started) {
    MULTICAP_LOG_WARN("{}: no audio samples were written", path());
    WriterResult result;
    result.no_samples = true;
    result.error = "no samples written";
    Complete(result);
    return;
  }
  for (int index : to_finish) FinishSource(index);
}

void AudioTrackWriter::FinishSource(int index) {
  {
    std::unique_lock<std::mutex> lock(mutex_);
    in_flight_cv_.wait(lock,
                       [this, index] { return sources_[index].in_flight == 0; });
  }

  if (!merged() && sink_) sink_->EndTrack(index);

  bool finalize = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    sources_[index].ended = true;
    if (sources_[0].ended && sources_[1].ended && !finalize_started_) {
      finalize_started_ = true;
      finalize = true;
    }
  }
  if (finalize) StartFinalize();
}

void AudioTrackWriter::StartFinalize() {
  if (!sink_) {
    OnFinalized(false, "audio container closed");
    return;
  }
  if (merged()) {
    std::lock_guard<std::mutex> lock(mix_mutex_);
    AudioSample rest;
    if (interleaver_.Flush(&rest)) {
      if (!sink_->AppendAudio(kMixTrack, rest, rest.pts_ns)) {
        MULTICAP_LOG_WARN("{}: could not write final audio chunk", path());
      }
    }
    sink_->EndTrack(kMixTrack);
  }
  sink_->FinalizeAsync([this](bool ok, const std::string& error) {
    OnFinalized(ok, error);
  });
}

void AudioTrackWriter::OnFinalized(bool ok, const std::string& error) {
  WriterResult result;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = ok ? WriterState::kFinished : WriterState::kFailed;
    result.ok = ok;
    result.error = error;
    for (const auto& source : sources_) {
      result.samples_written += source.written;
      result.samples_dropped += source.dropped;
      double seconds = static_cast<double>(source.last_pts_ns) / 1e9;
      if (seconds > result.duration_seconds) result.duration_seconds = seconds;
    }
  }
  if (ok) {
    MULTICAP_LOG_INFO("wrote {} ({:.1f} seconds, {} {})", path(),
                      result.duration_seconds, merged() ? 1 : 2,
                      merged() ? "stereo track" : "tracks");
  } else {
    MULTICAP_LOG_ERROR("audio writer error for {}: {}", path(), error);
  }
  Complete(result);
}

WriterState AudioTrackWriter::state() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

bool AudioTrackWriter::IsSourceFinishing(AudioSource source) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return sources_[SourceIndex(source)].finishing;
}

int64_t AudioTrackWriter::buffers_written(AudioSource source) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return sources_[SourceIndex(source)].written;
}

int64_t AudioTrackWriter::buffers_dropped(AudioSource source) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return sources_[SourceIndex(source)].dropped;
}

}  // namespace internal
}  // namespace multicap
