// Repository: Reelforge
// Component: Encoder Session Contract Tests
// Purpose: State machine, chunk ordering across encoder delay, hard-failure
//          stop and input validation for the video and audio sessions.
// Copyright (c) 2025 Reelforge

#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

#include "reelforge/codec/EncoderConfig.hpp"
#include "reelforge/encode/AudioEncoderSession.hpp"
#include "reelforge/encode/VideoEncoderSession.hpp"
#include "reelforge/media/RationalFps.hpp"

#include "../../support/FakeCodecRuntime.hpp"
#include "../../support/FakeEncoderBackends.hpp"

namespace reelforge::encode {
namespace {

using tests::FakeCodecRuntime;
using tests::FakeEncoderFactory;

codec::EncoderConfig SmallConfig() {
  return codec::MakeVideoConfig(codec::H264Profile::kBaseline, {540, 960}, media::FPS_30,
                                1000000);
}

class VideoEncoderSessionContract : public ::testing::Test {
 protected:
  std::unique_ptr<VideoEncoderSession> MakeSession() {
    return std::make_unique<VideoEncoderSession>(runtime_, factory_.CreateVideoBackend());
  }

  bool EncodeN(VideoEncoderSession& session, int n, std::string* error) {
    for (int i = 0; i < n; ++i) {
      if (!session.EncodeFrame(buffer::Frame(540, 960),
                               media::FPS_30.FrameTimestampUs(i), error)) {
        return false;
      }
    }
    return true;
  }

  FakeCodecRuntime runtime_;
  FakeEncoderFactory factory_;
};

TEST_F(VideoEncoderSessionContract, WalksTheStateMachine) {
  auto session = MakeSession();
  std::string err;
  EXPECT_EQ(session->state(), SessionState::kUninitialized);
  EXPECT_FALSE(session->Start(&err));

  ASSERT_TRUE(session->Configure(SmallConfig(), &err)) << err;
  EXPECT_EQ(session->state(), SessionState::kConfigured);
  EXPECT_FALSE(session->Configure(SmallConfig(), &err));
  EXPECT_NE(err.find("cannot configure"), std::string::npos);

  ASSERT_TRUE(session->Start(&err)) << err;
  EXPECT_EQ(session->state(), SessionState::kEncoding);
  ASSERT_TRUE(EncodeN(*session, 3, &err)) << err;

  std::vector<EncodedChunk> chunks;
  ASSERT_TRUE(session->Stop(chunks, &err)) << err;
  EXPECT_EQ(session->state(), SessionState::kStopped);
  EXPECT_EQ(chunks.size(), 3u);
  EXPECT_FALSE(session->EncodeFrame(buffer::Frame(540, 960), 999999, &err));
}

TEST_F(VideoEncoderSessionContract, RejectsUnsupportedConfig) {
  auto session = MakeSession();
  std::string err;
  codec::EncoderConfig config = SmallConfig();
  config.width = 1080;
  config.height = 1920;
  EXPECT_FALSE(session->Configure(config, &err));
  EXPECT_NE(err.find("not supported"), std::string::npos);
  EXPECT_EQ(session->state(), SessionState::kUninitialized);
}

TEST_F(VideoEncoderSessionContract, BackendOpenFailureLeavesSessionUnconfigured) {
  factory_.control->fail_video_open = true;
  auto session = MakeSession();
  std::string err;
  EXPECT_FALSE(session->Configure(SmallConfig(), &err));
  EXPECT_EQ(err, "fake video encoder refused to open");
  EXPECT_EQ(session->state(), SessionState::kUninitialized);
}

TEST_F(VideoEncoderSessionContract, IdleConfiguredSessionStopsEmpty) {
  auto session = MakeSession();
  std::string err;
  ASSERT_TRUE(session->Configure(SmallConfig(), &err));
  std::vector<EncodedChunk> chunks(3);
  ASSERT_TRUE(session->Stop(chunks, &err));
  EXPECT_TRUE(chunks.empty());
}

TEST_F(VideoEncoderSessionContract, DelayedChunksArriveInOrderAfterStop) {
  factory_.control->video_delay_frames = 4;
  auto session = MakeSession();
  std::string err;
  ASSERT_TRUE(session->Configure(SmallConfig(), &err));

  std::vector<int64_t> callback_ts;
  session->SetChunkCallback(
      [&callback_ts](const EncodedChunk& c) { callback_ts.push_back(c.timestamp_us); });
  ASSERT_TRUE(session->Start(&err));
  ASSERT_TRUE(EncodeN(*session, 10, &err)) << err;

  std::vector<EncodedChunk> chunks;
  ASSERT_TRUE(session->Stop(chunks, &err)) << err;
  ASSERT_EQ(chunks.size(), 10u);
  ASSERT_EQ(callback_ts.size(), 10u);
  EXPECT_TRUE(chunks.front().IsKey());
  for (size_t i = 0; i < chunks.size(); ++i) {
    EXPECT_EQ(chunks[i].timestamp_us, media::FPS_30.FrameTimestampUs(static_cast<int64_t>(i)));
    EXPECT_EQ(callback_ts[i], chunks[i].timestamp_us);
    if (i > 0) {
      EXPECT_FALSE(chunks[i].IsKey());
      EXPECT_GT(chunks[i].timestamp_us, chunks[i - 1].timestamp_us);
    }
  }
}

TEST_F(VideoEncoderSessionContract, KeyframeEveryGop) {
  auto session = MakeSession();
  std::string err;
  codec::EncoderConfig config = SmallConfig();
  config.gop_size = 5;
  ASSERT_TRUE(session->Configure(config, &err));
  ASSERT_TRUE(session->Start(&err));
  ASSERT_TRUE(EncodeN(*session, 12, &err));
  std::vector<EncodedChunk> chunks;
  ASSERT_TRUE(session->Stop(chunks, &err));
  ASSERT_EQ(chunks.size(), 12u);
  for (size_t i = 0; i < chunks.size(); ++i) {
    EXPECT_EQ(chunks[i].IsKey(), i % 5 == 0) << "chunk " << i;
  }
}

TEST_F(VideoEncoderSessionContract, RejectsTimestampRegressionAndWrongSize) {
  auto session = MakeSession();
  std::string err;
  ASSERT_TRUE(session->Configure(SmallConfig(), &err));
  ASSERT_TRUE(session->Start(&err));

  ASSERT_TRUE(session->EncodeFrame(buffer::Frame(540, 960), 66666, &err));
  EXPECT_FALSE(session->EncodeFrame(buffer::Frame(540, 960), 66666, &err));
  EXPECT_NE(err.find("not after"), std::string::npos);
  EXPECT_FALSE(session->EncodeFrame(buffer::Frame(540, 960), 33333, &err));

  EXPECT_FALSE(session->EncodeFrame(buffer::Frame(720, 1280), 100000, &err));
  EXPECT_NE(err.find("does not match"), std::string::npos);

  // Rejected inputs do not poison the session.
  ASSERT_TRUE(session->EncodeFrame(buffer::Frame(540, 960), 100000, &err)) << err;
  std::vector<EncodedChunk> chunks;
  ASSERT_TRUE(session->Stop(chunks, &err));
  EXPECT_EQ(chunks.size(), 2u);
}

TEST_F(VideoEncoderSessionContract, HardEncoderErrorStopsTheSession) {
  factory_.control->fail_video_at_frame = 3;
  factory_.control->video_failures_remaining = 1;
  auto session = MakeSession();
  std::string err;
  ASSERT_TRUE(session->Configure(SmallConfig(), &err));

  std::string reported;
  session->SetErrorCallback([&reported](const std::string& e) { reported = e; });
  ASSERT_TRUE(session->Start(&err));
  // Inputs queued before the worker hits the failure may still be accepted.
  EncodeN(*session, 10, &err);

  std::vector<EncodedChunk> chunks;
  EXPECT_FALSE(session->Stop(chunks, &err));
  EXPECT_EQ(err, "fake encoder failure at frame 3");
  EXPECT_EQ(reported, "fake encoder failure at frame 3");
  EXPECT_TRUE(session->failed());
  EXPECT_EQ(session->state(), SessionState::kStopped);
  EXPECT_FALSE(session->EncodeFrame(buffer::Frame(540, 960), 10000000, &err));
}

TEST_F(VideoEncoderSessionContract, FlushFailureIsAHardError) {
  factory_.control->fail_video_flush = true;
  auto session = MakeSession();
  std::string err;
  ASSERT_TRUE(session->Configure(SmallConfig(), &err));
  ASSERT_TRUE(session->Start(&err));
  ASSERT_TRUE(EncodeN(*session, 2, &err));
  std::vector<EncodedChunk> chunks;
  EXPECT_FALSE(session->Stop(chunks, &err));
  EXPECT_EQ(err, "fake encoder flush failure");
}

TEST_F(VideoEncoderSessionContract, DestroyIsIdempotentFromAnyState) {
  auto idle = MakeSession();
  idle->Destroy();
  idle->Destroy();
  EXPECT_EQ(idle->state(), SessionState::kStopped);

  auto running = MakeSession();
  std::string err;
  ASSERT_TRUE(running->Configure(SmallConfig(), &err));
  ASSERT_TRUE(running->Start(&err));
  ASSERT_TRUE(EncodeN(*running, 5, &err));
  running->Destroy();
  running->Destroy();
  EXPECT_EQ(running->state(), SessionState::kStopped);
  EXPECT_EQ(running->chunks().Size(), 0u);

  std::vector<EncodedChunk> chunks;
  EXPECT_FALSE(running->Stop(chunks, &err));
}

TEST_F(VideoEncoderSessionContract, ExposesCodecDescription) {
  auto session = MakeSession();
  std::string err;
  ASSERT_TRUE(session->Configure(SmallConfig(), &err));
  const std::vector<uint8_t> desc = session->CodecDescription();
  ASSERT_FALSE(desc.empty());
  EXPECT_EQ(desc[0], 0x01);
}

buffer::AudioBlock Block(int channels, int samples, int sample_rate, int64_t ts) {
  buffer::AudioBlock block;
  block.sample_rate = sample_rate;
  block.timestamp_us = ts;
  block.planes.assign(static_cast<size_t>(channels), std::vector<float>(samples, 0.25f));
  return block;
}

TEST(AudioEncoderSessionContract, EncodesValidBlocksInOrder) {
  FakeCodecRuntime runtime;
  FakeEncoderFactory factory;
  AudioEncoderSession session(runtime, factory.CreateAudioBackend());
  std::string err;
  ASSERT_TRUE(session.Configure(codec::AudioConfig(), &err)) << err;
  ASSERT_TRUE(session.Start(&err));
  for (int i = 0; i < 3; ++i) {
    ASSERT_TRUE(session.EncodeAudio(Block(2, 4096, 44100, i * 92879), &err)) << err;
  }
  std::vector<EncodedChunk> chunks;
  ASSERT_TRUE(session.Stop(chunks, &err)) << err;
  ASSERT_EQ(chunks.size(), 3u);
  EXPECT_EQ(chunks[1].timestamp_us, 92879);
  EXPECT_EQ(chunks[0].duration_us, 92879);
}

TEST(AudioEncoderSessionContract, RejectsMisshapenBlocks) {
  FakeCodecRuntime runtime;
  FakeEncoderFactory factory;
  AudioEncoderSession session(runtime, factory.CreateAudioBackend());
  std::string err;
  ASSERT_TRUE(session.Configure(codec::AudioConfig(), &err));
  ASSERT_TRUE(session.Start(&err));

  EXPECT_FALSE(session.EncodeAudio(Block(1, 4096, 44100, 0), &err));
  EXPECT_NE(err.find("planes"), std::string::npos);

  buffer::AudioBlock ragged = Block(2, 4096, 44100, 0);
  ragged.planes[1].resize(100);
  EXPECT_FALSE(session.EncodeAudio(ragged, &err));
  EXPECT_EQ(err, "audio planes have mismatched sample counts");

  EXPECT_FALSE(session.EncodeAudio(Block(2, 0, 44100, 0), &err));
  EXPECT_EQ(err, "empty audio block");

  EXPECT_FALSE(session.EncodeAudio(Block(2, 4096, 48000, 0), &err));
  EXPECT_NE(err.find("48000"), std::string::npos);

  std::vector<EncodedChunk> chunks;
  ASSERT_TRUE(session.Stop(chunks, &err));
  EXPECT_TRUE(chunks.empty());
}

TEST(AudioEncoderSessionContract, UnsupportedConfigIsRejected) {
  FakeCodecRuntime runtime;
  runtime.audio_config_ok = false;
  FakeEncoderFactory factory;
  AudioEncoderSession session(runtime, factory.CreateAudioBackend());
  std::string err;
  EXPECT_FALSE(session.Configure(codec::AudioConfig(), &err));
  EXPECT_NE(err.find("audio config not supported"), std::string::npos);
}

TEST(AudioEncoderSessionContract, InterleavesPlanes) {
  const std::vector<float> out = InterleavePlanes({{1, 2, 3}, {10, 20, 30}});
  EXPECT_EQ(out, (std::vector<float>{1, 10, 2, 20, 3, 30}));
  EXPECT_TRUE(InterleavePlanes({}).empty());
}

}  // namespace
}  // namespace reelforge::encode
