// Copyright 2026 The multicap Authors
// Tests for: AudioTrackWriter (separate tracks and merged stereo)

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "gtest/gtest.h"
#include "core/capture_types.h"
#include "fakes/fake_media_sink.h"
#include "writer/audio_track_writer.h"

namespace multicap {
namespace internal {
namespace {

using ::multicap::testing::FakeMediaSinkFactory;

constexpr int64_t kMs = 1000000LL;
constexpr int64_t kBase = 3000 * kMs;
constexpr size_t kChunkFrames = 4800;  // 100 ms at 48 kHz

AudioSample Chunk(AudioSource source, int64_t pts_ns,
                  size_t frames = kChunkFrames) {
  AudioSample sample;
  sample.source = source;
  sample.sample_rate = 48000;
  sample.channels = 1;
  sample.pts_ns = pts_ns;
  sample.data.assign(frames, source == AudioSource::kSystem ? 0.5f : -0.5f);
  return sample;
}

class AudioTrackWriterTest : public ::testing::Test {
 protected:
  std::unique_ptr<AudioTrackWriter> MakeWriter(MultiCapAudioMode mode,
                                               int64_t duration_ns = 0) {
    AudioWriterConfig config;
    config.path = "/tmp/multicap_audio_test.m4a";
    config.mode = mode;
    config.duration_ns = duration_ns;
    return std::make_unique<AudioTrackWriter>(&factory_, config);
  }

  FakeMediaSinkFactory factory_;
};

// ---------------------------------------------------------------------------
// Track layout
// ---------------------------------------------------------------------------

TEST_F(AudioTrackWriterTest, SeparateModeHasTwoMonoTracks) {
  auto writer = MakeWriter(kMultiCapAudioSeparateTracks);
  auto tracks = writer->TrackSpecs();
  ASSERT_EQ(tracks.size(), 2u);
  EXPECT_EQ(tracks[0].name, "system");
  EXPECT_EQ(tracks[1].name, "microphone");
  for (const auto& track : tracks) {
    EXPECT_EQ(track.kind, TrackKind::kAudio);
    EXPECT_EQ(track.channels, 1);
    EXPECT_EQ(track.sample_rate, 48000);
    EXPECT_EQ(track.audio_bitrate, 64000);
  }
}

TEST_F(AudioTrackWriterTest, MergedModeHasOneStereoTrack) {
  auto writer = MakeWriter(kMultiCapAudioMergedStereo);
  auto tracks = writer->TrackSpecs();
  ASSERT_EQ(tracks.size(), 1u);
  EXPECT_EQ(tracks[0].name, "mix");
  EXPECT_EQ(tracks[0].channels, 2);
  EXPECT_EQ(tracks[0].audio_bitrate, 128000);
}

// ---------------------------------------------------------------------------
// Separate tracks
// ---------------------------------------------------------------------------

TEST_F(AudioTrackWriterTest, SourcesShareOneZeroPoint) {
  auto writer = MakeWriter(kMultiCapAudioSeparateTracks);
  EXPECT_TRUE(writer->AppendSample(Chunk(AudioSource::kSystem, kBase)));
  EXPECT_TRUE(
      writer->AppendSample(Chunk(AudioSource::kMicrophone, kBase + 50 * kMs)));
  EXPECT_TRUE(
      writer->AppendSample(Chunk(AudioSource::kSystem, kBase + 100 * kMs)));

  auto record = factory_.Find(writer->path());
  ASSERT_NE(record, nullptr);
  EXPECT_EQ(record->pts(0), (std::vector<int64_t>{0, 100 * kMs}));
  EXPECT_EQ(record->pts(1), (std::vector<int64_t>{50 * kMs}));
  EXPECT_EQ(writer->buffers_written(AudioSource::kSystem), 2);
  EXPECT_EQ(writer->buffers_written(AudioSource::kMicrophone), 1);
}

TEST_F(AudioTrackWriterTest, EarlierThanZeroIsDropped) {
  auto writer = MakeWriter(kMultiCapAudioSeparateTracks);
  writer->AppendSample(Chunk(AudioSource::kSystem, kBase));
  EXPECT_FALSE(
      writer->AppendSample(Chunk(AudioSource::kMicrophone, kBase - kMs)));
  EXPECT_EQ(writer->buffers_dropped(AudioSource::kMicrophone), 1);
}

TEST_F(AudioTrackWriterTest, NonMonoInputIsDropped) {
  auto writer = MakeWriter(kMultiCapAudioSeparateTracks);
  AudioSample stereo = Chunk(AudioSource::kSystem, kBase);
  stereo.channels = 2;
  EXPECT_FALSE(writer->AppendSample(stereo));
  EXPECT_EQ(writer->state(), WriterState::kNotStarted);
}

TEST_F(AudioTrackWriterTest, EachTrackFinishesAtDuration) {
  auto writer = MakeWriter(kMultiCapAudioSeparateTracks, 300 * kMs);
  for (int i = 0; i < 3; ++i) {
    writer->AppendSample(Chunk(AudioSource::kSystem, kBase + i * 100 * kMs));
    writer->AppendSample(
        Chunk(AudioSource::kMicrophone, kBase + i * 100 * kMs));
  }

  // System reaches the duration first; the file stays open for the mic.
  writer->AppendSample(Chunk(AudioSource::kSystem, kBase + 300 * kMs));
  EXPECT_TRUE(writer->IsSourceFinishing(AudioSource::kSystem));
  EXPECT_FALSE(writer->IsSourceFinishing(AudioSource::kMicrophone));
  EXPECT_FALSE(writer->IsComplete());
  auto record = factory_.Find(writer->path());
  EXPECT_TRUE(record->ended(0));
  EXPECT_FALSE(record->ended(1));

  EXPECT_FALSE(
      writer->AppendSample(Chunk(AudioSource::kSystem, kBase + 400 * kMs)));

  writer->AppendSample(Chunk(AudioSource::kMicrophone, kBase + 300 * kMs));
  ASSERT_TRUE(writer->IsComplete());
  EXPECT_EQ(writer->state(), WriterState::kFinished);
  EXPECT_TRUE(writer->result().ok);
  EXPECT_EQ(writer->result().samples_written, 6);
  EXPECT_NEAR(writer->result().duration_seconds, 0.3, 1e-9);
  EXPECT_TRUE(record->ended(1));
  EXPECT_EQ(record->finalizes(), 1);
}

TEST_F(AudioTrackWriterTest, IdleMicrophoneDoesNotBlockFinalize) {
  auto writer = MakeWriter(kMultiCapAudioSeparateTracks, 200 * kMs);
  writer->AppendSample(Chunk(AudioSource::kSystem, kBase));
  writer->AppendSample(Chunk(AudioSource::kSystem, kBase + 100 * kMs));
  writer->AppendSample(Chunk(AudioSource::kSystem, kBase + 200 * kMs));

  ASSERT_TRUE(writer->IsComplete());
  EXPECT_TRUE(writer->result().ok);
  EXPECT_TRUE(writer->IsSourceFinishing(AudioSource::kMicrophone));
}

TEST_F(AudioTrackWriterTest, BusyTrackDropsBuffers) {
  auto writer = MakeWriter(kMultiCapAudioSeparateTracks);
  writer->AppendSample(Chunk(AudioSource::kSystem, kBase));
  factory_.behavior().ready = false;
  EXPECT_FALSE(
      writer->AppendSample(Chunk(AudioSource::kSystem, kBase + 100 * kMs)));
  EXPECT_EQ(writer->buffers_dropped(AudioSource::kSystem), 1);
}

TEST_F(AudioTrackWriterTest, FinishAllTracksFinalizesOnce) {
  auto writer = MakeWriter(kMultiCapAudioSeparateTracks);
  int callbacks = 0;
  writer->SetCompletionCallback([&](const WriterResult&) { ++callbacks; });
  writer->AppendSample(Chunk(AudioSource::kSystem, kBase));
  writer->AppendSample(Chunk(AudioSource::kMicrophone, kBase));
  writer->FinishAllTracks();
  writer->FinishAllTracks();

  ASSERT_TRUE(writer->WaitForCompletion(std::chrono::seconds(1)));
  auto record = factory_.Find(writer->path());
  EXPECT_TRUE(record->ended(0));
  EXPECT_TRUE(record->ended(1));
  EXPECT_EQ(record->finalizes(), 1);
  EXPECT_EQ(callbacks, 1);
}

TEST_F(AudioTrackWriterTest, FinishWithoutSamplesReportsNoSamples) {
  auto writer = MakeWriter(kMultiCapAudioSeparateTracks);
  writer->FinishAllTracks();
  ASSERT_TRUE(writer->IsComplete());
  EXPECT_TRUE(writer->result().no_samples);
  EXPECT_FALSE(writer->result().ok);
}

TEST_F(AudioTrackWriterTest, OpenFailureCompletesWithError) {
  factory_.behavior().fail_open = true;
  auto writer = MakeWriter(kMultiCapAudioSeparateTracks);
  EXPECT_FALSE(writer->AppendSample(Chunk(AudioSource::kSystem, kBase)));
  ASSERT_TRUE(writer->IsComplete());
  EXPECT_FALSE(writer->result().ok);
  EXPECT_EQ(writer->state(), WriterState::kFailed);
}

// ---------------------------------------------------------------------------
// Merged stereo
// ---------------------------------------------------------------------------

TEST_F(AudioTrackWriterTest, MergedWaitsForBothSides) {
  auto writer = MakeWriter(kMultiCapAudioMergedStereo);
  EXPECT_TRUE(writer->AppendSample(Chunk(AudioSource::kSystem, kBase)));
  auto record = factory_.Find(writer->path());
  ASSERT_NE(record, nullptr);
  EXPECT_EQ(record->appends(0), 0u);

  EXPECT_TRUE(writer->AppendSample(Chunk(AudioSource::kMicrophone, kBase)));
  ASSERT_EQ(record->appends(0), 1u);
  std::lock_guard<std::mutex> lock(record->mutex);
  EXPECT_EQ(record->tracks[0].channels[0], 2);
  EXPECT_EQ(record->tracks[0].pts_ns[0], 0);
  EXPECT_EQ(record->tracks[0].audio_frames,
            static_cast<int64_t>(kChunkFrames));
}

TEST_F(AudioTrackWriterTest, MergedPadsMissingMicrophone) {
  auto writer = MakeWriter(kMultiCapAudioMergedStereo);
  // 1 s of system audio, no microphone: backlog (500 ms) forces output.
  for (int i = 0; i < 10; ++i) {
    writer->AppendSample(Chunk(AudioSource::kSystem, kBase + i * 100 * kMs));
  }
  auto record = factory_.Find(writer->path());
  EXPECT_GT(record->appends(0), 0u);
}

TEST_F(AudioTrackWriterTest, MergedFlushesOnFinish) {
  auto writer = MakeWriter(kMultiCapAudioMergedStereo);
  writer->AppendSample(Chunk(AudioSource::kSystem, kBase));
  writer->AppendSample(Chunk(AudioSource::kMicrophone, kBase));
  writer->AppendSample(Chunk(AudioSource::kSystem, kBase + 100 * kMs));
  writer->FinishAllTracks();

  ASSERT_TRUE(writer->WaitForCompletion(std::chrono::seconds(1)));
  EXPECT_TRUE(writer->result().ok);
  auto record = factory_.Find(writer->path());
  EXPECT_TRUE(record->ended(0));
  std::lock_guard<std::mutex> lock(record->mutex);
  EXPECT_EQ(record->tracks[0].audio_frames,
            static_cast<int64_t>(2 * kChunkFrames));
}

// ---------------------------------------------------------------------------
// Concurrency
// ---------------------------------------------------------------------------

class AudioWriterRaceTest
    : public AudioTrackWriterTest,
      public ::testing::WithParamInterface<MultiCapAudioMode> {};

TEST_P(AudioWriterRaceTest, FinishRacingAppendsCompletesOnce) {
  constexpr int kRounds = 50;
  for (int round = 0; round < kRounds; ++round) {
    AudioWriterConfig config;
    config.path = "/tmp/multicap_audio_race_" + std::to_string(round) + ".m4a";
    config.mode = GetParam();
    AudioTrackWriter writer(&factory_, config);
    std::atomic<int> callbacks{0};
    writer.SetCompletionCallback(
        [&](const WriterResult&) { callbacks.fetch_add(1); });
    ASSERT_TRUE(writer.AppendSample(Chunk(AudioSource::kSystem, kBase)));

    std::atomic<bool> go{false};
    std::vector<std::thread> threads;
    for (AudioSource source :
         {AudioSource::kSystem, AudioSource::kMicrophone}) {
      threads.emplace_back([&, source] {
        while (!go) std::this_thread::yield();
        for (int i = 1; i <= 100; ++i) {
          writer.AppendSample(Chunk(source, kBase + i * 100 * kMs, 480));
        }
      });
    }
    for (int i = 0; i < 2; ++i) {
      threads.emplace_back([&] {
        while (!go) std::this_thread::yield();
        writer.FinishAllTracks();
      });
    }
    go = true;
    for (auto& t : threads) t.join();

    ASSERT_TRUE(writer.WaitForCompletion(std::chrono::seconds(1)));
    EXPECT_EQ(callbacks.load(), 1) << "round " << round;
    auto record = factory_.Find(config.path);
    ASSERT_NE(record, nullptr);
    EXPECT_EQ(record->finalizes(), 1);
    for (size_t track = 0; track < record->spec.tracks.size(); ++track) {
      int index = static_cast<int>(track);
      EXPECT_TRUE(record->ended(index));
      EXPECT_EQ(record->late_appends(index), 0)
          << "round " << round << " track " << track;
    }
  }
}

INSTANTIATE_TEST_SUITE_P(Modes, AudioWriterRaceTest,
                         ::testing::Values(kMultiCapAudioSeparateTracks,
                                           kMultiCapAudioMergedStereo));

}  // namespace
}  // namespace internal
}  // namespace multicap
