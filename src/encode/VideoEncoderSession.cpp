// Repository: Reelforge
// Component: Video Encoder Session
// Purpose: Asynchronous H.264 encode session over an IVideoEncoderBackend.
// Copyright (c) 2025 Reelforge

#include "reelforge/encode/VideoEncoderSession.hpp"

#include <utility>

namespace reelforge::encode {

VideoEncoderSession::VideoEncoderSession(const codec::ICodecRuntime& runtime,
                                         std::unique_ptr<IVideoEncoderBackend> backend,
                                         size_t max_queue_depth)
    : EncoderSession<VideoInput>("VideoEncoderSession", max_queue_depth),
      runtime_(runtime),
      backend_(std::move(backend)),
      has_last_timestamp_(false),
      last_timestamp_us_(0) {}

VideoEncoderSession::~VideoEncoderSession() {
  Destroy();
}

bool VideoEncoderSession::Configure(const codec::EncoderConfig& config, std::string* error) {
  if (!CanConfigure(error)) {
    return false;
  }
  if (!backend_) {
    if (error) *error = "no video encoder backend";
    return false;
  }
  if (!runtime_.IsVideoConfigSupported(config)) {
    if (error) *error = "video config not supported: " + config.Describe();
    return false;
  }
  if (!backend_->Open(config, error)) {
    return false;
  }
  config_ = config;
  codec_description_ = backend_->CodecDescription();
  return MarkConfigured(error);
}

bool VideoEncoderSession::EncodeFrame(buffer::Frame frame, int64_t timestamp_us,
                                      std::string* error) {
  if (frame.width != config_.width || frame.height != config_.height || !frame.IsValid()) {
    if (error) {
      *error = "frame " + std::to_string(frame.width) + "x" + std::to_string(frame.height) +
               " does not match encoder " + std::to_string(config_.width) + "x" +
               std::to_string(config_.height);
    }
    return false;
  }
  if (has_last_timestamp_ && timestamp_us <= last_timestamp_us_) {
    if (error) {
      *error = "video timestamp " + std::to_string(timestamp_us) + " not after " +
               std::to_string(last_timestamp_us_);
    }
    return false;
  }

  VideoInput input;
  input.frame = std::move(frame);
  input.timestamp_us = timestamp_us;
  if (!Submit(std::move(input), error)) {
    return false;
  }
  has_last_timestamp_ = true;
  last_timestamp_us_ = timestamp_us;
  return true;
}

std::vector<uint8_t> VideoEncoderSession::CodecDescription() const {
  return codec_description_;
}

bool VideoEncoderSession::EncodeInput(const VideoInput& input, std::vector<EncodedChunk>& out,
                                      std::string* error) {
  return backend_->Encode(input.frame, input.timestamp_us, out, error);
}

bool VideoEncoderSession::DrainEncoder(std::vector<EncodedChunk>& out, std::string* error) {
  if (!backend_->Flush(out, error)) {
    return false;
  }
  // Some encoders only finalize parameter sets at flush.
  auto description = backend_->CodecDescription();
  if (!description.empty()) {
    codec_description_ = std::move(description);
  }
  return true;
}

void VideoEncoderSession::ReleaseEncoder() {
  if (backend_) {
    backend_->Close();
  }
}

}  // namespace reelforge::encode
