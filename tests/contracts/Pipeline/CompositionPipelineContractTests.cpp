// Repository: Reelforge
// Component: Composition Pipeline Contract Tests
// Purpose: End-to-end orchestration against fake encoders and muxer: frame
//          count, audio handling, capability fallbacks, failure taxonomy,
//          cancellation and progress.
// Copyright (c) 2025 Reelforge

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "reelforge/media/RationalFps.hpp"
#include "reelforge/pipeline/CompositionPipeline.hpp"
#include "reelforge/recovery/ErrorPolicy.hpp"

#include "../../support/DeterministicTimeSource.hpp"
#include "../../support/DeterministicWaitStrategy.hpp"
#include "../../support/FakeCodecRuntime.hpp"
#include "../../support/FakeEncoderBackends.hpp"
#include "../../support/FakeMuxer.hpp"
#include "../../support/SyntheticFrameSource.hpp"

namespace reelforge::pipeline {
namespace {

using recovery::ErrorKind;

class CompositionPipelineContract : public ::testing::Test {
 protected:
  CompositionPipelineContract() : waiter_(&clock_), errors_(clock_, waiter_) {}

  PipelineOutcome RunOnce(tests::SyntheticFrameSource& source,
                          PipelineOptions options = PipelineOptions()) {
    CompositionPipeline pipeline(source, runtime_, factory_, muxer_, errors_, options);
    return pipeline.Run(TotalFramesFor(source.DurationUs(), options.fps));
  }

  tests::DeterministicTimeSource clock_;
  tests::DeterministicWaitStrategy waiter_;
  recovery::ErrorPolicy errors_;
  tests::FakeCodecRuntime runtime_;
  tests::FakeEncoderFactory factory_;
  tests::FakeMuxer muxer_;
};

TEST_F(CompositionPipelineContract, EncodesEveryFrameVideoOnly) {
  tests::SyntheticFrameSource source(1280, 720, 1000000);
  CompositionPipeline pipeline(source, runtime_, factory_, muxer_, errors_);
  const PipelineOutcome outcome = pipeline.Run(30);

  ASSERT_TRUE(outcome.success) << (outcome.error ? outcome.error->message : "");
  EXPECT_FALSE(outcome.cancelled);
  EXPECT_EQ(outcome.frames_processed, 30);
  EXPECT_EQ(outcome.video_config.width, 540);
  EXPECT_EQ(outcome.video_config.height, 960);
  EXPECT_FALSE(outcome.audio_included);
  EXPECT_EQ(outcome.output.video_samples, 30);
  EXPECT_EQ(pipeline.state(), PipelineState::kCompleted);

  ASSERT_EQ(outcome.warnings.size(), 1u);
  EXPECT_EQ(outcome.warnings[0], "Source has no audio track; output is video-only");

  ASSERT_EQ(source.positions().size(), 30u);
  for (size_t i = 0; i < source.positions().size(); ++i) {
    EXPECT_EQ(source.positions()[i], media::FPS_30.FrameTimestampUs(static_cast<int64_t>(i)));
  }

  const auto video = muxer_.last_video();
  ASSERT_EQ(video.size(), 30u);
  EXPECT_TRUE(video.front().IsKey());
  EXPECT_TRUE(muxer_.last_audio().empty());
  EXPECT_DOUBLE_EQ(muxer_.last_config().duration_seconds, 1.0);
  EXPECT_FALSE(muxer_.last_config().video_codec_description.empty());
}

TEST_F(CompositionPipelineContract, IncludesAudioTrimmedToVideo) {
  tests::SyntheticFrameSource source(1280, 720, 1000000, /*has_audio=*/true);
  const PipelineOutcome outcome = RunOnce(source);

  ASSERT_TRUE(outcome.success);
  EXPECT_TRUE(outcome.audio_included);
  EXPECT_TRUE(outcome.warnings.empty());
  const auto audio = muxer_.last_audio();
  // 44100 samples in 4096-sample blocks.
  ASSERT_EQ(audio.size(), 11u);
  for (const auto& chunk : audio) {
    EXPECT_LT(chunk.timestamp_us, 1000000);
  }
  EXPECT_EQ(factory_.control->audio_blocks_encoded.load(), 11);
}

TEST_F(CompositionPipelineContract, VideoOnlyRequestSkipsAudio) {
  tests::SyntheticFrameSource source(1280, 720, 500000, true);
  PipelineOptions options;
  options.include_audio = false;
  const PipelineOutcome outcome = RunOnce(source, options);
  ASSERT_TRUE(outcome.success);
  EXPECT_FALSE(outcome.audio_included);
  EXPECT_TRUE(outcome.warnings.empty());
  EXPECT_EQ(factory_.control->audio_backends_created.load(), 0);
}

TEST_F(CompositionPipelineContract, MissingAacDegradesToVideoOnly) {
  runtime_.has_audio = false;
  tests::SyntheticFrameSource source(1280, 720, 500000, true);
  const PipelineOutcome outcome = RunOnce(source);
  ASSERT_TRUE(outcome.success);
  EXPECT_FALSE(outcome.audio_included);
  ASSERT_EQ(outcome.warnings.size(), 1u);
  EXPECT_EQ(outcome.warnings[0], "AAC encoding unavailable; output is video-only");
}

TEST_F(CompositionPipelineContract, AudioExtractionFailureDropsAudio) {
  tests::SyntheticFrameSource source(1280, 720, 500000, true);
  source.fail_audio = true;
  const PipelineOutcome outcome = RunOnce(source);
  ASSERT_TRUE(outcome.success);
  EXPECT_FALSE(outcome.audio_included);
  ASSERT_EQ(outcome.warnings.size(), 1u);
  EXPECT_EQ(outcome.warnings[0].rfind("Audio omitted: extraction failed", 0), 0u);
}

TEST_F(CompositionPipelineContract, RefusedAudioConfigurationDropsAudio) {
  factory_.control->fail_audio_open = true;
  tests::SyntheticFrameSource source(1280, 720, 500000, true);
  const PipelineOutcome outcome = RunOnce(source);
  ASSERT_TRUE(outcome.success);
  EXPECT_FALSE(outcome.audio_included);
  ASSERT_EQ(outcome.warnings.size(), 1u);
  EXPECT_EQ(outcome.warnings[0].rfind("Audio omitted: audio encoder rejected", 0), 0u);
  EXPECT_TRUE(muxer_.last_audio().empty());
}

TEST_F(CompositionPipelineContract, AudioEncoderFailureFailsTheJob) {
  factory_.control->fail_audio_at_block = 2;
  tests::SyntheticFrameSource source(1280, 720, 500000, true);
  CompositionPipeline pipeline(source, runtime_, factory_, muxer_, errors_);
  const PipelineOutcome outcome = pipeline.Run(TotalFramesFor(source.DurationUs(), media::FPS_30));

  EXPECT_FALSE(outcome.success);
  ASSERT_TRUE(outcome.error.has_value());
  EXPECT_EQ(outcome.error->kind, ErrorKind::kEncodingFailed);
  EXPECT_NE(outcome.error->details.find("fake audio failure at block 2"), std::string::npos);
  EXPECT_EQ(pipeline.state(), PipelineState::kFailed);
  EXPECT_EQ(muxer_.calls(), 0);
  for (const auto& warning : outcome.warnings) {
    EXPECT_EQ(warning.find("Audio omitted"), std::string::npos) << warning;
  }
}

TEST_F(CompositionPipelineContract, NoH264IsEncoderUnavailable) {
  runtime_.has_video = false;
  tests::SyntheticFrameSource source(1280, 720, 1000000);
  CompositionPipeline pipeline(source, runtime_, factory_, muxer_, errors_);
  const PipelineOutcome outcome = pipeline.Run(30);

  EXPECT_FALSE(outcome.success);
  ASSERT_TRUE(outcome.error.has_value());
  EXPECT_EQ(outcome.error->kind, ErrorKind::kEncoderUnavailable);
  EXPECT_FALSE(outcome.error->recoverable);
  EXPECT_EQ(pipeline.state(), PipelineState::kFailed);
  EXPECT_EQ(muxer_.calls(), 0);
  EXPECT_TRUE(source.positions().empty());
}

TEST_F(CompositionPipelineContract, EmptyPictureIsInvalidFormat) {
  tests::SyntheticFrameSource source(0, 0, 1000000);
  CompositionPipeline pipeline(source, runtime_, factory_, muxer_, errors_);
  EXPECT_FALSE(pipeline.Initialize());
  ASSERT_TRUE(pipeline.last_error().has_value());
  EXPECT_EQ(pipeline.last_error()->kind, ErrorKind::kInvalidVideoFormat);
}

TEST_F(CompositionPipelineContract, ZeroFramesIsInvalidFormat) {
  tests::SyntheticFrameSource source(1280, 720, 0);
  CompositionPipeline pipeline(source, runtime_, factory_, muxer_, errors_);
  const PipelineOutcome outcome = pipeline.Run(0);
  ASSERT_TRUE(outcome.error.has_value());
  EXPECT_EQ(outcome.error->kind, ErrorKind::kInvalidVideoFormat);
  EXPECT_FALSE(outcome.error->recoverable);
}

TEST_F(CompositionPipelineContract, CaptureFailureIsFrameExtractionFailed) {
  tests::SyntheticFrameSource source(1280, 720, 1000000);
  source.fail_capture_at_call = 5;
  const PipelineOutcome outcome = RunOnce(source);

  EXPECT_FALSE(outcome.success);
  ASSERT_TRUE(outcome.error.has_value());
  EXPECT_EQ(outcome.error->kind, ErrorKind::kFrameExtractionFailed);
  EXPECT_EQ(outcome.error->message, "Failed to extract frame 5");
  EXPECT_EQ(outcome.error->details, "synthetic capture failure");
  EXPECT_TRUE(outcome.error->recoverable);
  EXPECT_EQ(outcome.frames_processed, 5);
  EXPECT_EQ(muxer_.calls(), 0);
}

TEST_F(CompositionPipelineContract, EncoderFailureIsEncodingFailed) {
  factory_.control->fail_video_at_frame = 3;
  factory_.control->video_failures_remaining = 1;
  tests::SyntheticFrameSource source(1280, 720, 1000000);
  const PipelineOutcome outcome = RunOnce(source);

  EXPECT_FALSE(outcome.success);
  ASSERT_TRUE(outcome.error.has_value());
  EXPECT_EQ(outcome.error->kind, ErrorKind::kEncodingFailed);
  EXPECT_TRUE(outcome.error->recoverable);
  EXPECT_EQ(outcome.error->details, "fake encoder failure at frame 3");
  EXPECT_EQ(muxer_.calls(), 0);
}

TEST_F(CompositionPipelineContract, MuxFailureIsNotRecoverable) {
  muxer_.fail = true;
  tests::SyntheticFrameSource source(1280, 720, 500000);
  const PipelineOutcome outcome = RunOnce(source);

  ASSERT_TRUE(outcome.error.has_value());
  EXPECT_EQ(outcome.error->kind, ErrorKind::kEncodingFailed);
  EXPECT_EQ(outcome.error->message, "Failed to write MP4 container");
  EXPECT_EQ(outcome.error->details, "fake muxer failure");
  EXPECT_FALSE(outcome.error->recoverable);
  EXPECT_EQ(errors_.GetErrorStats().unrecoverable_errors, 1u);
}

TEST_F(CompositionPipelineContract, CancelStopsAtNextFrame) {
  tests::SyntheticFrameSource source(1280, 720, 1000000);
  CompositionPipeline pipeline(source, runtime_, factory_, muxer_, errors_);
  const int64_t cancel_at = media::FPS_30.FrameTimestampUs(10);
  source.on_capture = [&pipeline, cancel_at](int64_t position_us) {
    if (position_us == cancel_at) pipeline.Cancel();
  };

  const PipelineOutcome outcome = pipeline.Run(30);
  EXPECT_TRUE(outcome.cancelled);
  EXPECT_FALSE(outcome.success);
  EXPECT_FALSE(outcome.error.has_value());
  EXPECT_EQ(outcome.frames_processed, 11);
  EXPECT_EQ(pipeline.state(), PipelineState::kCancelled);
  EXPECT_EQ(muxer_.calls(), 0);
  EXPECT_EQ(errors_.GetErrorStats().total_errors, 0u);
}

TEST_F(CompositionPipelineContract, ReportsProgressPerFrame) {
  tests::SyntheticFrameSource source(1280, 720, 1000000);
  CompositionPipeline pipeline(source, runtime_, factory_, muxer_, errors_);
  std::vector<PipelineProgress> seen;
  pipeline.SetProgressCallback([&seen](const PipelineProgress& p) { seen.push_back(p); });

  ASSERT_TRUE(pipeline.Run(30).success);
  ASSERT_EQ(seen.size(), 30u);
  for (size_t i = 0; i < seen.size(); ++i) {
    EXPECT_EQ(seen[i].current_frame, static_cast<int64_t>(i + 1));
    EXPECT_EQ(seen[i].total_frames, 30);
  }
  EXPECT_DOUBLE_EQ(seen.back().percentage, 100.0);
  EXPECT_EQ(seen.back().status, "Processing frame 30/30");
  EXPECT_EQ(seen[14].status, "Processing frame 15/30");
}

TEST_F(CompositionPipelineContract, PicksLargestSupportedRungUnlessReduced) {
  runtime_.supported_heights = {1920, 1280, 960};
  tests::SyntheticFrameSource source(640, 360, 100000);

  PipelineOutcome full = RunOnce(source);
  ASSERT_TRUE(full.success);
  EXPECT_EQ(full.video_config.width, 1080);
  EXPECT_EQ(full.video_config.height, 1920);

  PipelineOptions reduced;
  reduced.prefer_reduced_resolution = true;
  PipelineOutcome small = RunOnce(source, reduced);
  ASSERT_TRUE(small.success);
  EXPECT_EQ(small.video_config.width, 720);
  EXPECT_EQ(small.video_config.height, 1280);

  const auto opened = factory_.control->OpenedVideoConfigs();
  ASSERT_EQ(opened.size(), 2u);
  EXPECT_EQ(opened[1].height, 1280);
}

TEST_F(CompositionPipelineContract, RunIsNotReentrantAfterCompletion) {
  tests::SyntheticFrameSource source(1280, 720, 200000);
  CompositionPipeline pipeline(source, runtime_, factory_, muxer_, errors_);
  ASSERT_TRUE(pipeline.Run(6).success);
  const PipelineOutcome again = pipeline.Run(6);
  EXPECT_FALSE(again.success);
  ASSERT_TRUE(again.error.has_value());
  EXPECT_NE(again.error->message.find("cannot start"), std::string::npos);
}

}  // namespace
}  // namespace reelforge::pipeline
