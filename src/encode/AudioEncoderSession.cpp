// Repository: Reelforge
// Component: Audio Encoder Session
// Purpose: Asynchronous AAC encode session. Planar float blocks are validated
//          and interleaved before submission.
// Copyright (c) 2025 Reelforge

#include "reelforge/encode/AudioEncoderSession.hpp"

#include <utility>

namespace reelforge::encode {

std::vector<float> InterleavePlanes(const std::vector<std::vector<float>>& planes) {
  std::vector<float> out;
  if (planes.empty()) return out;
  const size_t channels = planes.size();
  const size_t samples = planes.front().size();
  out.resize(channels * samples);
  for (size_t s = 0; s < samples; ++s) {
    for (size_t c = 0; c < channels; ++c) {
      out[s * channels + c] = planes[c][s];
    }
  }
  return out;
}

AudioEncoderSession::AudioEncoderSession(const codec::ICodecRuntime& runtime,
                                         std::unique_ptr<IAudioEncoderBackend> backend,
                                         size_t max_queue_depth)
    : EncoderSession<AudioInput>("AudioEncoderSession", max_queue_depth),
      runtime_(runtime),
      backend_(std::move(backend)) {}

AudioEncoderSession::~AudioEncoderSession() {
  Destroy();
}

bool AudioEncoderSession::Configure(const codec::AudioConfig& config, std::string* error) {
  if (!CanConfigure(error)) {
    return false;
  }
  if (!backend_) {
    if (error) *error = "no audio encoder backend";
    return false;
  }
  if (!runtime_.IsAudioConfigSupported(config)) {
    if (error) *error = "audio config not supported: " + config.Describe();
    return false;
  }
  if (!backend_->Open(config, error)) {
    return false;
  }
  config_ = config;
  codec_description_ = backend_->CodecDescription();
  return MarkConfigured(error);
}

bool AudioEncoderSession::EncodeAudio(const buffer::AudioBlock& block, std::string* error) {
  if (block.ChannelCount() != config_.channel_count) {
    if (error) {
      *error = "audio block has " + std::to_string(block.ChannelCount()) +
               " planes, encoder expects " + std::to_string(config_.channel_count);
    }
    return false;
  }
  const int samples = block.SamplesPerChannel();
  for (const auto& plane : block.planes) {
    if (static_cast<int>(plane.size()) != samples) {
      if (error) *error = "audio planes have mismatched sample counts";
      return false;
    }
  }
  if (samples == 0) {
    if (error) *error = "empty audio block";
    return false;
  }
  if (block.sample_rate != config_.sample_rate) {
    if (error) {
      *error = "audio block at " + std::to_string(block.sample_rate) +
               " Hz, encoder expects " + std::to_string(config_.sample_rate);
    }
    return false;
  }

  AudioInput input;
  input.interleaved = InterleavePlanes(block.planes);
  input.samples_per_channel = samples;
  input.timestamp_us = block.timestamp_us;
  return Submit(std::move(input), error);
}

std::vector<uint8_t> AudioEncoderSession::CodecDescription() const {
  return codec_description_;
}

bool AudioEncoderSession::EncodeInput(const AudioInput& input, std::vector<EncodedChunk>& out,
                                      std::string* error) {
  return backend_->Encode(input.interleaved, input.samples_per_channel, input.timestamp_us, out,
                          error);
}

bool AudioEncoderSession::DrainEncoder(std::vector<EncodedChunk>& out, std::string* error) {
  return backend_->Flush(out, error);
}

void AudioEncoderSession::ReleaseEncoder() {
  if (backend_) {
    backend_->Close();
  }
}

}  // namespace reelforge::encode
