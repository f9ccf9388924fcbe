// Repository: Reelforge
// Component: Composition Pipeline
// Purpose: Drives one job's frame loop: capture, composite, encode both
//          tracks, then mux into a single MP4 buffer.
// Copyright (c) 2025 Reelforge

#ifndef REELFORGE_PIPELINE_COMPOSITION_PIPELINE_HPP_
#define REELFORGE_PIPELINE_COMPOSITION_PIPELINE_HPP_

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "reelforge/codec/EncoderConfig.hpp"
#include "reelforge/codec/ICodecRuntime.hpp"
#include "reelforge/compose/FrameCompositor.hpp"
#include "reelforge/compose/StyleConfig.hpp"
#include "reelforge/encode/AudioEncoderSession.hpp"
#include "reelforge/encode/IEncoderBackend.hpp"
#include "reelforge/encode/VideoEncoderSession.hpp"
#include "reelforge/media/RationalFps.hpp"
#include "reelforge/mux/IMuxer.hpp"
#include "reelforge/recovery/ErrorPolicy.hpp"
#include "reelforge/source/IFrameSource.hpp"

namespace reelforge::pipeline {

// idle -> initializing -> encoding -> finalizing -> completed
// Any stage may end in failed; the frame loop may end in cancelled.
enum class PipelineState {
  kIdle,
  kInitializing,
  kEncoding,
  kFinalizing,
  kCompleted,
  kFailed,
  kCancelled,
};

const char* PipelineStateName(PipelineState state);

struct PipelineOptions {
  compose::StyleConfig style;
  media::RationalFps fps{30, 1};
  int64_t video_bitrate_bps = 6000000;
  codec::AudioConfig audio;
  bool include_audio = true;
  // Cap the resolution ladder at kReducedResolution (reduce_quality fallback).
  bool prefer_reduced_resolution = false;
  size_t encoder_queue_depth = encode::kDefaultSessionQueueDepth;
};

struct PipelineProgress {
  int64_t current_frame = 0;
  int64_t total_frames = 0;
  double percentage = 0.0;
  std::string status;
};

struct PipelineOutcome {
  bool success = false;
  bool cancelled = false;
  mux::MuxedOutput output;
  codec::EncoderConfig video_config;
  bool audio_included = false;
  int64_t frames_processed = 0;
  std::vector<std::string> warnings;
  std::optional<recovery::ProcessingError> error;
};

// Frames needed to cover duration_us at fps (ceil).
int64_t TotalFramesFor(int64_t duration_us, media::RationalFps fps);

// CompositionPipeline runs on the caller's thread, one frame in flight at a
// time; only Cancel() and state() may be called from other threads. Each
// instance runs at most once. Retries construct a new pipeline.
//
// Failures are created through the ErrorPolicy (so they land in its log)
// but never retried here.
class CompositionPipeline {
 public:
  using ProgressCallback = std::function<void(const PipelineProgress&)>;

  CompositionPipeline(source::IFrameSource& source,
                      const codec::ICodecRuntime& runtime,
                      encode::IEncoderBackendFactory& backends,
                      mux::IMuxer& muxer,
                      recovery::ErrorPolicy& errors,
                      PipelineOptions options = PipelineOptions());
  ~CompositionPipeline();

  CompositionPipeline(const CompositionPipeline&) = delete;
  CompositionPipeline& operator=(const CompositionPipeline&) = delete;

  // Invoked on the Run() thread after every frame.
  void SetProgressCallback(ProgressCallback cb) { progress_callback_ = std::move(cb); }

  // Probes capabilities and picks the encoder configs. Fails when no H.264
  // configuration is supported; missing AAC degrades to video-only.
  bool Initialize();

  // Encodes total_frames frames and muxes them. Calls Initialize() first if
  // needed. Rejected while another Run() is in progress.
  PipelineOutcome Run(int64_t total_frames);

  // Cooperative; checked once per frame iteration.
  void Cancel();

  PipelineState state() const;
  const codec::EncoderConfig& video_config() const { return video_config_; }
  bool audio_enabled() const { return audio_enabled_; }
  const std::vector<std::string>& warnings() const { return warnings_; }
  const std::optional<recovery::ProcessingError>& last_error() const { return last_error_; }

 private:
  void SetState(PipelineState state);
  PipelineOutcome Fail(recovery::ErrorKind kind, const std::string& message,
                       const std::string& details, bool recoverable);
  PipelineOutcome Cancelled();
  void AddWarning(const std::string& warning);
  void DestroySessions();
  bool StartVideoSession(std::string* error);
  bool StartAudioSession(std::string* error);
  bool RunAudioPass(int64_t video_duration_us, std::string* error);
  void DropAudio(const std::string& reason);
  void ReportProgress(int64_t total_frames);

  source::IFrameSource& source_;
  const codec::ICodecRuntime& runtime_;
  encode::IEncoderBackendFactory& backends_;
  mux::IMuxer& muxer_;
  recovery::ErrorPolicy& errors_;
  const PipelineOptions options_;

  mutable std::mutex state_mutex_;
  PipelineState state_;
  bool initialized_;
  std::atomic<bool> cancel_requested_;

  codec::EncoderConfig video_config_;
  bool audio_enabled_;
  std::vector<std::string> warnings_;
  std::optional<recovery::ProcessingError> last_error_;

  std::unique_ptr<compose::FrameCompositor> compositor_;
  std::unique_ptr<encode::VideoEncoderSession> video_session_;
  std::unique_ptr<encode::AudioEncoderSession> audio_session_;

  int64_t frames_processed_;
  ProgressCallback progress_callback_;
};

}  // namespace reelforge::pipeline

#endif  // REELFORGE_PIPELINE_COMPOSITION_PIPELINE_HPP_
