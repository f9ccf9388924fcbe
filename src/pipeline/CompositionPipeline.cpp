// Repository: Reelforge
// Component: Composition Pipeline
// Purpose: Drives one job's frame loop: capture, composite, encode both
//          tracks, then mux into a single MP4 buffer.
// Copyright (c) 2025 Reelforge

#include "reelforge/pipeline/CompositionPipeline.hpp"

#include <new>
#include <sstream>
#include <utility>

#include "reelforge/buffer/FrameFingerprint.hpp"
#include "reelforge/codec/CapabilityProber.hpp"
#include "reelforge/util/Logger.hpp"

namespace reelforge::pipeline {

using recovery::ErrorKind;

const char* PipelineStateName(PipelineState state) {
  switch (state) {
    case PipelineState::kIdle:         return "idle";
    case PipelineState::kInitializing: return "initializing";
    case PipelineState::kEncoding:     return "encoding";
    case PipelineState::kFinalizing:   return "finalizing";
    case PipelineState::kCompleted:    return "completed";
    case PipelineState::kFailed:       return "failed";
    case PipelineState::kCancelled:    return "cancelled";
  }
  return "unknown";
}

int64_t TotalFramesFor(int64_t duration_us, media::RationalFps fps) {
  return fps.FramesToCoverUs(duration_us);
}

CompositionPipeline::CompositionPipeline(source::IFrameSource& source,
                                         const codec::ICodecRuntime& runtime,
                                         encode::IEncoderBackendFactory& backends,
                                         mux::IMuxer& muxer,
                                         recovery::ErrorPolicy& errors,
                                         PipelineOptions options)
    : source_(source),
      runtime_(runtime),
      backends_(backends),
      muxer_(muxer),
      errors_(errors),
      options_(std::move(options)),
      state_(PipelineState::kIdle),
      initialized_(false),
      cancel_requested_(false),
      audio_enabled_(false),
      frames_processed_(0) {}

CompositionPipeline::~CompositionPipeline() {
  DestroySessions();
}

PipelineState CompositionPipeline::state() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return state_;
}

void CompositionPipeline::SetState(PipelineState state) {
  std::lock_guard<std::mutex> lock(state_mutex_);
  state_ = state;
}

void CompositionPipeline::Cancel() {
  cancel_requested_.store(true, std::memory_order_release);
}

void CompositionPipeline::AddWarning(const std::string& warning) {
  warnings_.push_back(warning);
  util::Logger::Warn("[CompositionPipeline] " + warning);
}

bool CompositionPipeline::Initialize() {
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (state_ != PipelineState::kIdle) {
      return initialized_ && state_ == PipelineState::kInitializing;
    }
    state_ = PipelineState::kInitializing;
  }

  if (source_.Width() <= 0 || source_.Height() <= 0) {
    Fail(ErrorKind::kInvalidVideoFormat, "Source video has no usable picture",
         std::to_string(source_.Width()) + "x" + std::to_string(source_.Height()), false);
    return false;
  }

  codec::ProbeRequest request;
  request.fps = options_.fps;
  request.video_bitrate_bps = options_.video_bitrate_bps;
  request.audio = options_.audio;
  codec::CapabilityProber prober(runtime_, request);
  const codec::CandidateList candidates = prober.Probe();

  if (!candidates.HasSupportedVideo()) {
    Fail(ErrorKind::kEncoderUnavailable, "No supported H.264 encoder configuration",
         "runtime=" + runtime_.Name(), false);
    return false;
  }
  video_config_ = options_.prefer_reduced_resolution
                      ? prober.BestVideoConfigAtMost(candidates, codec::kReducedResolution.height)
                      : prober.BestVideoConfig(candidates);

  audio_enabled_ = false;
  if (options_.include_audio) {
    if (!candidates.audio_supported) {
      AddWarning("AAC encoding unavailable; output is video-only");
    } else if (!source_.HasAudio()) {
      AddWarning("Source has no audio track; output is video-only");
    } else {
      audio_enabled_ = true;
    }
  }

  std::string err;
  compositor_ = compose::FrameCompositor::Create(options_.style, video_config_.width,
                                                 video_config_.height, &err);
  if (!compositor_) {
    Fail(ErrorKind::kEncodingFailed, "Failed to set up frame compositor", err, false);
    return false;
  }

  initialized_ = true;
  std::ostringstream oss;
  oss << "[CompositionPipeline] Initialized video=" << video_config_.Describe()
      << " audio=" << (audio_enabled_ ? options_.audio.Describe() : std::string("none"))
      << " mode=" << compose::CompositionModeName(options_.style.mode);
  util::Logger::Info(oss.str());
  return true;
}

bool CompositionPipeline::StartVideoSession(std::string* error) {
  video_session_ = std::make_unique<encode::VideoEncoderSession>(
      runtime_, backends_.CreateVideoBackend(), options_.encoder_queue_depth);
  return video_session_->Configure(video_config_, error) && video_session_->Start(error);
}

// A configuration the backend refuses degrades to video-only. Once the
// encoder has accepted its configuration, any later failure is fatal.
bool CompositionPipeline::StartAudioSession(std::string* error) {
  audio_session_ = std::make_unique<encode::AudioEncoderSession>(
      runtime_, backends_.CreateAudioBackend(), options_.encoder_queue_depth);
  std::string configure_err;
  if (!audio_session_->Configure(options_.audio, &configure_err)) {
    DropAudio("audio encoder rejected " + options_.audio.Describe() + ": " + configure_err);
    return true;
  }
  return audio_session_->Start(error);
}

void CompositionPipeline::DropAudio(const std::string& reason) {
  if (audio_session_) {
    audio_session_->Destroy();
    audio_session_.reset();
  }
  if (audio_enabled_) {
    audio_enabled_ = false;
    AddWarning("Audio omitted: " + reason);
  }
}

void CompositionPipeline::DestroySessions() {
  if (video_session_) {
    video_session_->Destroy();
    video_session_.reset();
  }
  if (audio_session_) {
    audio_session_->Destroy();
    audio_session_.reset();
  }
}

bool CompositionPipeline::RunAudioPass(int64_t video_duration_us, std::string* error) {
  std::vector<buffer::AudioBlock> blocks;
  std::string err;
  if (!source_.ExtractAudio(options_.audio.sample_rate, options_.audio.channel_count, blocks, &err)) {
    DropAudio("extraction failed: " + err);
    return true;
  }

  size_t submitted = 0;
  for (auto& block : blocks) {
    if (cancel_requested_.load(std::memory_order_acquire)) {
      return true;
    }
    if (block.timestamp_us >= video_duration_us) {
      break;
    }
    // Trim the block that straddles the end of the video.
    const int64_t remaining_us = video_duration_us - block.timestamp_us;
    const int64_t keep = (remaining_us * block.sample_rate + 999999) / 1000000;
    if (keep < block.SamplesPerChannel()) {
      for (auto& plane : block.planes) {
        plane.resize(static_cast<size_t>(keep));
      }
    }
    if (block.SamplesPerChannel() == 0) {
      break;
    }
    if (!audio_session_->EncodeAudio(block, error)) {
      return false;
    }
    ++submitted;
  }
  util::Logger::Debug("[CompositionPipeline] Submitted " + std::to_string(submitted) +
                      " audio blocks");
  return true;
}

void CompositionPipeline::ReportProgress(int64_t total_frames) {
  if (!progress_callback_) return;
  PipelineProgress progress;
  progress.current_frame = frames_processed_;
  progress.total_frames = total_frames;
  progress.percentage = total_frames > 0
                            ? (static_cast<double>(frames_processed_) / static_cast<double>(total_frames)) * 100.0
                            : 0.0;
  progress.status = "Processing frame " + std::to_string(frames_processed_) + "/" +
                    std::to_string(total_frames);
  progress_callback_(progress);
}

PipelineOutcome CompositionPipeline::Fail(ErrorKind kind, const std::string& message,
                                          const std::string& details, bool recoverable) {
  DestroySessions();
  SetState(PipelineState::kFailed);
  last_error_ = errors_.CreateError(kind, message, details, recoverable);
  util::Logger::Error("[CompositionPipeline] Failed after " + std::to_string(frames_processed_) +
                      " frames: " + message + (details.empty() ? "" : " (" + details + ")"));

  PipelineOutcome outcome;
  outcome.video_config = video_config_;
  outcome.frames_processed = frames_processed_;
  outcome.warnings = warnings_;
  outcome.error = last_error_;
  return outcome;
}

PipelineOutcome CompositionPipeline::Cancelled() {
  DestroySessions();
  SetState(PipelineState::kCancelled);
  util::Logger::Info("[CompositionPipeline] Cancelled after " + std::to_string(frames_processed_) +
                     " frames");
  PipelineOutcome outcome;
  outcome.cancelled = true;
  outcome.video_config = video_config_;
  outcome.frames_processed = frames_processed_;
  outcome.warnings = warnings_;
  return outcome;
}

PipelineOutcome CompositionPipeline::Run(int64_t total_frames) {
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (state_ == PipelineState::kEncoding || state_ == PipelineState::kFinalizing) {
      PipelineOutcome rejected;
      rejected.error = errors_.CreateError(ErrorKind::kUnknown, "Pipeline is already processing",
                                           "", false);
      return rejected;
    }
  }
  if (state() == PipelineState::kIdle && !Initialize()) {
    PipelineOutcome outcome;
    outcome.error = last_error_;
    outcome.warnings = warnings_;
    return outcome;
  }
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (!initialized_ || state_ != PipelineState::kInitializing) {
      PipelineOutcome rejected;
      rejected.error = errors_.CreateError(
          ErrorKind::kUnknown,
          std::string("Pipeline cannot start in state ") + PipelineStateName(state_), "", false);
      return rejected;
    }
    state_ = PipelineState::kEncoding;
  }

  if (total_frames <= 0) {
    return Fail(ErrorKind::kInvalidVideoFormat, "Source video has no frames to encode",
                "total_frames=" + std::to_string(total_frames), false);
  }

  frames_processed_ = 0;
  std::string err;
  if (!StartVideoSession(&err)) {
    return Fail(ErrorKind::kEncoderUnavailable, "Failed to start video encoder", err, true);
  }
  if (audio_enabled_ && !StartAudioSession(&err)) {
    return Fail(ErrorKind::kEncodingFailed, "Failed to start audio encoder", err, true);
  }

  const int64_t video_duration_us = options_.fps.FrameTimestampUs(total_frames);
  if (audio_session_ && !RunAudioPass(video_duration_us, &err)) {
    return Fail(ErrorKind::kEncodingFailed, "Failed to encode audio", err, true);
  }

  buffer::Frame captured;
  for (int64_t i = 0; i < total_frames; ++i) {
    if (cancel_requested_.load(std::memory_order_acquire)) {
      return Cancelled();
    }

    const int64_t position_us = options_.fps.FrameTimestampUs(i);
    buffer::Frame composed;
    try {
      if (!source_.CaptureAt(position_us, captured, &err)) {
        return Fail(ErrorKind::kFrameExtractionFailed,
                    "Failed to extract frame " + std::to_string(i), err, true);
      }
      if (!compositor_->Compose(captured, composed, &err)) {
        return Fail(ErrorKind::kEncodingFailed, "Failed to composite frame " + std::to_string(i),
                    err, true);
      }
    } catch (const std::bad_alloc&) {
      return Fail(ErrorKind::kMemoryOverflow, "Out of memory on frame " + std::to_string(i),
                  std::to_string(video_config_.width) + "x" + std::to_string(video_config_.height),
                  true);
    }

    if (i == 0 && util::Logger::DebugEnabled()) {
      util::Logger::Debug("[CompositionPipeline] frame 0 crc32=" +
                          buffer::FormatFingerprint(buffer::CRC32Frame(composed)));
    }

    if (!video_session_->EncodeFrame(std::move(composed), position_us, &err)) {
      return Fail(ErrorKind::kEncodingFailed, "Failed to encode frame " + std::to_string(i), err,
                  true);
    }

    ++frames_processed_;
    ReportProgress(total_frames);
  }

  if (cancel_requested_.load(std::memory_order_acquire)) {
    return Cancelled();
  }

  SetState(PipelineState::kFinalizing);

  std::vector<encode::EncodedChunk> video_chunks;
  if (!video_session_->Stop(video_chunks, &err)) {
    return Fail(ErrorKind::kEncodingFailed, "Video encoder failed while flushing", err, true);
  }

  std::vector<encode::EncodedChunk> audio_chunks;
  if (audio_session_) {
    if (!audio_session_->Stop(audio_chunks, &err)) {
      return Fail(ErrorKind::kEncodingFailed, "Audio encoder failed while flushing", err, true);
    }
  }

  mux::MuxConfig mux_config;
  mux_config.video = video_config_;
  mux_config.audio = options_.audio;
  mux_config.duration_seconds = options_.fps.SecondsForFrames(total_frames);
  mux_config.video_codec_description = video_session_->CodecDescription();
  if (audio_session_) {
    mux_config.audio_codec_description = audio_session_->CodecDescription();
  }

  PipelineOutcome outcome;
  if (!muxer_.Mux(video_chunks, audio_chunks, mux_config, outcome.output, &err)) {
    return Fail(ErrorKind::kEncodingFailed, "Failed to write MP4 container", err, false);
  }

  DestroySessions();
  SetState(PipelineState::kCompleted);

  outcome.success = true;
  outcome.video_config = video_config_;
  outcome.audio_included = outcome.output.audio_samples > 0;
  outcome.frames_processed = frames_processed_;
  outcome.warnings = warnings_;

  const mux::OutputSummary summary = mux::SummarizeOutput(outcome.output, mux_config);
  std::ostringstream oss;
  oss << "[CompositionPipeline] Completed " << frames_processed_ << " frames: "
      << summary.resolution << " " << summary.duration_label << " " << summary.size_mb << " MB "
      << summary.bitrate_mbps << " Mbps";
  util::Logger::Info(oss.str());
  return outcome;
}

}  // namespace reelforge::pipeline
