// Copyright 2026 The multicap Authors
// Tests for: StereoInterleaver

#include <vector>

#include "gtest/gtest.h"
#include "writer/stereo_interleaver.h"

namespace multicap {
namespace internal {
namespace {

constexpr int kRate = 48000;
constexpr int64_t kMs = 1000000LL;

class StereoInterleaverTest : public ::testing::Test {
 protected:
  StereoInterleaverTest() : interleaver_(kRate, kRate / 2) {}

  void Push(AudioSource side, size_t frames, int64_t pts_ns, float value) {
    std::vector<float> data(frames, value);
    interleaver_.Push(side, data.data(), data.size(), pts_ns);
  }

  StereoInterleaver interleaver_;
};

TEST_F(StereoInterleaverTest, NothingUntilBothSidesHaveData) {
  Push(AudioSource::kSystem, 480, 0, 1.0f);
  AudioSample out;
  EXPECT_FALSE(interleaver_.Pop(&out));
  EXPECT_EQ(interleaver_.pending_frames(AudioSource::kSystem), 480u);
}

TEST_F(StereoInterleaverTest, SystemLeftMicrophoneRight) {
  Push(AudioSource::kSystem, 480, 0, 1.0f);
  Push(AudioSource::kMicrophone, 480, 0, -1.0f);

  AudioSample out;
  ASSERT_TRUE(interleaver_.Pop(&out));
  EXPECT_EQ(out.channels, 2);
  EXPECT_EQ(out.sample_rate, kRate);
  EXPECT_EQ(out.pts_ns, 0);
  ASSERT_EQ(out.data.size(), 960u);
  EXPECT_FLOAT_EQ(out.data[0], 1.0f);
  EXPECT_FLOAT_EQ(out.data[1], -1.0f);
  EXPECT_FLOAT_EQ(out.data[958], 1.0f);
  EXPECT_FLOAT_EQ(out.data[959], -1.0f);
  EXPECT_EQ(interleaver_.frames_emitted(), 480);
}

TEST_F(StereoInterleaverTest, PopEmitsOnlyCommonFrames) {
  Push(AudioSource::kSystem, 960, 0, 1.0f);
  Push(AudioSource::kMicrophone, 480, 0, -1.0f);

  AudioSample out;
  ASSERT_TRUE(interleaver_.Pop(&out));
  EXPECT_EQ(out.frame_count(), 480u);
  EXPECT_EQ(interleaver_.pending_frames(AudioSource::kSystem), 480u);
  EXPECT_EQ(interleaver_.pending_frames(AudioSource::kMicrophone), 0u);
}

TEST_F(StereoInterleaverTest, OutputTimestampsFollowEmittedFrames) {
  Push(AudioSource::kSystem, 4800, 0, 0.1f);
  Push(AudioSource::kMicrophone, 4800, 0, 0.2f);
  AudioSample first;
  ASSERT_TRUE(interleaver_.Pop(&first));

  Push(AudioSource::kSystem, 4800, 100 * kMs, 0.1f);
  Push(AudioSource::kMicrophone, 4800, 100 * kMs, 0.2f);
  AudioSample second;
  ASSERT_TRUE(interleaver_.Pop(&second));
  EXPECT_EQ(second.pts_ns, 100 * kMs);
}

TEST_F(StereoInterleaverTest, GapIsFilledWithSilence) {
  Push(AudioSource::kSystem, 4800, 0, 1.0f);
  // Microphone starts 50 ms late.
  Push(AudioSource::kMicrophone, 2400, 50 * kMs, -1.0f);

  AudioSample out;
  ASSERT_TRUE(interleaver_.Pop(&out));
  ASSERT_EQ(out.frame_count(), 4800u);
  EXPECT_FLOAT_EQ(out.data[1], 0.0f);             // silence
  EXPECT_FLOAT_EQ(out.data[2 * 2399 + 1], 0.0f);  // last silent frame
  EXPECT_FLOAT_EQ(out.data[2 * 2400 + 1], -1.0f);
}

TEST_F(StereoInterleaverTest, SmallJitterIsContiguous) {
  Push(AudioSource::kSystem, 4800, 0, 1.0f);
  // 5 ms late: within the 10 ms tolerance.
  Push(AudioSource::kSystem, 4800, 105 * kMs, 1.0f);
  EXPECT_EQ(interleaver_.pending_frames(AudioSource::kSystem), 9600u);
}

TEST_F(StereoInterleaverTest, OverlapIsDropped) {
  Push(AudioSource::kSystem, 4800, 0, 1.0f);
  // Starts 50 ms before the queued data ends.
  Push(AudioSource::kSystem, 4800, 50 * kMs, 2.0f);
  EXPECT_EQ(interleaver_.pending_frames(AudioSource::kSystem), 4800u + 2400u);
}

TEST_F(StereoInterleaverTest, BacklogPadsLaggingSide) {
  // 600 ms of system audio with a 500 ms backlog limit.
  Push(AudioSource::kSystem, 28800, 0, 1.0f);
  EXPECT_EQ(interleaver_.pending_frames(AudioSource::kMicrophone), 4800u);

  AudioSample out;
  ASSERT_TRUE(interleaver_.Pop(&out));
  EXPECT_EQ(out.frame_count(), 4800u);
  EXPECT_FLOAT_EQ(out.data[1], 0.0f);
}

TEST_F(StereoInterleaverTest, FlushPadsShorterSide) {
  Push(AudioSource::kSystem, 960, 0, 1.0f);
  Push(AudioSource::kMicrophone, 480, 0, -1.0f);

  AudioSample out;
  ASSERT_TRUE(interleaver_.Flush(&out));
  EXPECT_EQ(out.frame_count(), 960u);
  EXPECT_FLOAT_EQ(out.data[2 * 959 + 1], 0.0f);
  EXPECT_FALSE(interleaver_.Flush(&out));
}

TEST_F(StereoInterleaverTest, EmptyPushIgnored) {
  interleaver_.Push(AudioSource::kSystem, nullptr, 10, 0);
  EXPECT_EQ(interleaver_.pending_frames(AudioSource::kSystem), 0u);
}

}  // namespace
}  // namespace internal
}  // namespace multicap
