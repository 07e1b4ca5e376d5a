// Copyright 2026 The multicap Authors
// Tests for: VideoTrackWriter, TrackWriter completion

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "gtest/gtest.h"
#include "core/video_frame.h"
#include "fakes/fake_media_sink.h"
#include "writer/video_track_writer.h"

namespace multicap {
namespace internal {
namespace {

using ::multicap::testing::FakeMediaSinkFactory;

constexpr int64_t kSecond = 1000000000LL;
constexpr int64_t kBase = 7 * kSecond;  // Arbitrary capture clock origin

class VideoTrackWriterTest : public ::testing::Test {
 protected:
  std::unique_ptr<VideoTrackWriter> MakeWriter(int64_t duration_ns = 0) {
    VideoWriterConfig config;
    config.path = "/tmp/multicap_video_test.mp4";
    config.width = 64;
    config.height = 48;
    config.frame_rate = 1.0;
    config.duration_ns = duration_ns;
    return std::make_unique<VideoTrackWriter>(&factory_, config);
  }

  static std::unique_ptr<VideoFrame> Frame(int64_t pts_ns, int width = 64,
                                           int height = 48) {
    return VideoFrame::Create(width, height, pts_ns);
  }

  FakeMediaSinkFactory factory_;
};

// ---------------------------------------------------------------------------
// Lifecycle
// ---------------------------------------------------------------------------

TEST_F(VideoTrackWriterTest, SinkCreatedLazilyOnFirstFrame) {
  auto writer = MakeWriter();
  EXPECT_EQ(writer->state(), WriterState::kNotStarted);
  EXPECT_EQ(factory_.sink_count(), 0u);

  EXPECT_TRUE(writer->AppendFrame(*Frame(kBase)));
  EXPECT_EQ(writer->state(), WriterState::kWriting);
  ASSERT_EQ(factory_.sink_count(), 1u);

  auto record = factory_.Find("/tmp/multicap_video_test.mp4");
  ASSERT_NE(record, nullptr);
  ASSERT_EQ(record->spec.tracks.size(), 1u);
  EXPECT_EQ(record->spec.tracks[0].kind, TrackKind::kVideo);
  EXPECT_EQ(record->spec.tracks[0].width, 64);
  EXPECT_EQ(record->spec.tracks[0].bitrate, 4000000);
  EXPECT_EQ(record->spec.tracks[0].max_keyframe_interval, 30000);
}

TEST_F(VideoTrackWriterTest, TimestampsRelativeToFirstFrame) {
  auto writer = MakeWriter();
  writer->AppendFrame(*Frame(kBase));
  writer->AppendFrame(*Frame(kBase + kSecond));
  writer->AppendFrame(*Frame(kBase + 2 * kSecond));

  auto pts = factory_.Find(writer->path())->pts(0);
  ASSERT_EQ(pts.size(), 3u);
  EXPECT_EQ(pts[0], 0);
  EXPECT_EQ(pts[1], kSecond);
  EXPECT_EQ(pts[2], 2 * kSecond);
}

TEST_F(VideoTrackWriterTest, FramesBeforeZeroAreDropped) {
  auto writer = MakeWriter();
  writer->AppendFrame(*Frame(kBase));
  EXPECT_FALSE(writer->AppendFrame(*Frame(kBase - 1)));
  EXPECT_EQ(writer->frames_written(), 1);
  EXPECT_EQ(writer->frames_dropped(), 1);
}

TEST_F(VideoTrackWriterTest, WrongSizeFramesAreDropped) {
  auto writer = MakeWriter();
  EXPECT_FALSE(writer->AppendFrame(*Frame(kBase, 32, 32)));
  EXPECT_EQ(writer->state(), WriterState::kNotStarted);
  EXPECT_EQ(writer->frames_dropped(), 1);
}

TEST_F(VideoTrackWriterTest, BusyEncoderDropsFrames) {
  auto writer = MakeWriter();
  writer->AppendFrame(*Frame(kBase));
  factory_.behavior().ready = false;
  EXPECT_FALSE(writer->AppendFrame(*Frame(kBase + kSecond)));
  factory_.behavior().ready = true;
  EXPECT_TRUE(writer->AppendFrame(*Frame(kBase + 2 * kSecond)));
  EXPECT_EQ(writer->frames_written(), 2);
  EXPECT_EQ(writer->frames_dropped(), 1);
}

TEST_F(VideoTrackWriterTest, DurationReachedFinishesFile) {
  auto writer = MakeWriter(3 * kSecond);
  for (int i = 0; i < 5; ++i) {
    writer->AppendFrame(*Frame(kBase + i * kSecond));
  }
  ASSERT_TRUE(writer->IsComplete());
  EXPECT_EQ(writer->state(), WriterState::kFinished);

  WriterResult result = writer->result();
  EXPECT_TRUE(result.ok);
  EXPECT_EQ(result.samples_written, 3);
  EXPECT_DOUBLE_EQ(result.duration_seconds, 2.0);
  EXPECT_EQ(result.path, writer->path());

  auto record = factory_.Find(writer->path());
  EXPECT_TRUE(record->ended(0));
  EXPECT_EQ(record->finalizes(), 1);
  EXPECT_EQ(record->appends(0), 3u);
}

TEST_F(VideoTrackWriterTest, FinishAllTracksIsIdempotent) {
  auto writer = MakeWriter();
  writer->AppendFrame(*Frame(kBase));
  writer->FinishAllTracks();
  writer->FinishAllTracks();
  EXPECT_TRUE(writer->WaitForCompletion(std::chrono::seconds(1)));
  EXPECT_EQ(factory_.Find(writer->path())->finalizes(), 1);
  EXPECT_FALSE(writer->AppendFrame(*Frame(kBase + kSecond)));
}

TEST_F(VideoTrackWriterTest, FinishWithoutFramesReportsNoSamples) {
  auto writer = MakeWriter();
  writer->FinishAllTracks();
  ASSERT_TRUE(writer->IsComplete());
  EXPECT_EQ(writer->state(), WriterState::kFailed);
  WriterResult result = writer->result();
  EXPECT_FALSE(result.ok);
  EXPECT_TRUE(result.no_samples);
  EXPECT_EQ(factory_.sink_count(), 0u);
}

// ---------------------------------------------------------------------------
// Failures
// ---------------------------------------------------------------------------

TEST_F(VideoTrackWriterTest, OpenFailureCompletesWithError) {
  factory_.behavior().fail_open = true;
  auto writer = MakeWriter();
  EXPECT_FALSE(writer->AppendFrame(*Frame(kBase)));
  ASSERT_TRUE(writer->IsComplete());
  EXPECT_EQ(writer->state(), WriterState::kFailed);
  EXPECT_FALSE(writer->result().ok);
  EXPECT_FALSE(writer->result().no_samples);
  EXPECT_EQ(writer->result().error, "fake open failure");
}

TEST_F(VideoTrackWriterTest, CreateFailureCompletesWithError) {
  factory_.behavior().fail_create = true;
  auto writer = MakeWriter();
  EXPECT_FALSE(writer->AppendFrame(*Frame(kBase)));
  ASSERT_TRUE(writer->IsComplete());
  EXPECT_FALSE(writer->result().error.empty());
}

TEST_F(VideoTrackWriterTest, FinalizeFailureReported) {
  factory_.behavior().finalize_ok = false;
  auto writer = MakeWriter();
  writer->AppendFrame(*Frame(kBase));
  writer->FinishAllTracks();
  ASSERT_TRUE(writer->IsComplete());
  EXPECT_EQ(writer->state(), WriterState::kFailed);
  EXPECT_FALSE(writer->result().ok);
  EXPECT_FALSE(writer->result().no_samples);
}

TEST_F(VideoTrackWriterTest, AsyncFinalizeCompletesLater) {
  factory_.behavior().async_finalize = true;
  auto writer = MakeWriter();
  writer->AppendFrame(*Frame(kBase));
  writer->FinishAllTracks();
  EXPECT_TRUE(writer->WaitForCompletion(std::chrono::seconds(5)));
  EXPECT_TRUE(writer->result().ok);
}

TEST_F(VideoTrackWriterTest, CompletionTimesOutWhenSinkHangs) {
  factory_.behavior().never_finalize = true;
  auto writer = MakeWriter();
  writer->AppendFrame(*Frame(kBase));
  writer->FinishAllTracks();
  EXPECT_FALSE(writer->WaitForCompletion(std::chrono::milliseconds(20)));
  EXPECT_EQ(writer->state(), WriterState::kFinishing);
}

// ---------------------------------------------------------------------------
// Completion callback
// ---------------------------------------------------------------------------

TEST_F(VideoTrackWriterTest, CallbackRunsOnce) {
  auto writer = MakeWriter();
  int calls = 0;
  writer->SetCompletionCallback([&](const WriterResult&) { ++calls; });
  writer->AppendFrame(*Frame(kBase));
  writer->FinishAllTracks();
  writer->FinishAllTracks();
  EXPECT_EQ(calls, 1);
}

TEST_F(VideoTrackWriterTest, LateCallbackRunsImmediately) {
  auto writer = MakeWriter();
  writer->FinishAllTracks();
  bool called = false;
  writer->SetCompletionCallback([&](const WriterResult& result) {
    called = true;
    EXPECT_TRUE(result.no_samples);
  });
  EXPECT_TRUE(called);
}

// ---------------------------------------------------------------------------
// Concurrency
// ---------------------------------------------------------------------------

TEST_F(VideoTrackWriterTest, FinishRacingAppendsCompletesOnce) {
  constexpr int kRounds = 50;
  for (int round = 0; round < kRounds; ++round) {
    VideoWriterConfig config;
    config.path = "/tmp/multicap_video_race_" + std::to_string(round) + ".mp4";
    config.width = 64;
    config.height = 48;
    VideoTrackWriter writer(&factory_, config);
    std::atomic<int> callbacks{0};
    writer.SetCompletionCallback(
        [&](const WriterResult&) { callbacks.fetch_add(1); });
    ASSERT_TRUE(writer.AppendFrame(*Frame(kBase)));

    std::atomic<bool> go{false};
    std::thread appender([&] {
      while (!go) std::this_thread::yield();
      for (int i = 1; i <= 200; ++i) {
        writer.AppendFrame(*Frame(kBase + i * kSecond / 30));
      }
    });
    std::vector<std::thread> finishers;
    for (int i = 0; i < 2; ++i) {
      finishers.emplace_back([&] {
        while (!go) std::this_thread::yield();
        writer.FinishAllTracks();
      });
    }
    go = true;
    appender.join();
    for (auto& t : finishers) t.join();

    ASSERT_TRUE(writer.WaitForCompletion(std::chrono::seconds(1)));
    EXPECT_EQ(callbacks.load(), 1) << "round " << round;
    auto record = factory_.Find(config.path);
    ASSERT_NE(record, nullptr);
    EXPECT_TRUE(record->ended(0));
    EXPECT_EQ(record->late_appends(0), 0) << "round " << round;
    EXPECT_EQ(record->finalizes(), 1);
    EXPECT_EQ(static_cast<int64_t>(record->appends(0)),
              writer.frames_written());
  }
}

TEST(WriterStateTest, Names) {
  EXPECT_STREQ(WriterStateName(WriterState::kNotStarted), "not-started");
  EXPECT_STREQ(WriterStateName(WriterState::kFinished), "finished");
  EXPECT_STREQ(WriterStateName(WriterState::kFailed), "failed");
}

}  // namespace
}  // namespace internal
}  // namespace multicap
