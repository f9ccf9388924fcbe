// Repository: Reelforge
// Component: Audio Encoder Session
// Purpose: Asynchronous AAC encode session. Planar float blocks are validated
//          and interleaved before submission.
// Copyright (c) 2025 Reelforge

#ifndef REELFORGE_ENCODE_AUDIO_ENCODER_SESSION_HPP_
#define REELFORGE_ENCODE_AUDIO_ENCODER_SESSION_HPP_

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "reelforge/buffer/Frame.hpp"
#include "reelforge/codec/EncoderConfig.hpp"
#include "reelforge/codec/ICodecRuntime.hpp"
#include "reelforge/encode/EncoderSession.hpp"
#include "reelforge/encode/IEncoderBackend.hpp"

namespace reelforge::encode {

struct AudioInput {
  std::vector<float> interleaved;
  int samples_per_channel = 0;
  int64_t timestamp_us = 0;
};

// Interleaves planes as L0 R0 L1 R1 ... Caller guarantees equal plane sizes.
std::vector<float> InterleavePlanes(const std::vector<std::vector<float>>& planes);

class AudioEncoderSession : public EncoderSession<AudioInput> {
 public:
  AudioEncoderSession(const codec::ICodecRuntime& runtime,
                      std::unique_ptr<IAudioEncoderBackend> backend,
                      size_t max_queue_depth = kDefaultSessionQueueDepth);
  ~AudioEncoderSession() override;

  bool Configure(const codec::AudioConfig& config, std::string* error);

  // Fails when the plane count differs from the configured channel count,
  // planes differ in length, the block is empty, or the sample rate differs.
  bool EncodeAudio(const buffer::AudioBlock& block, std::string* error);

  std::vector<uint8_t> CodecDescription() const;
  const codec::AudioConfig& config() const { return config_; }

 protected:
  bool EncodeInput(const AudioInput& input, std::vector<EncodedChunk>& out,
                   std::string* error) override;
  bool DrainEncoder(std::vector<EncodedChunk>& out, std::string* error) override;
  void ReleaseEncoder() override;

 private:
  const codec::ICodecRuntime& runtime_;
  std::unique_ptr<IAudioEncoderBackend> backend_;
  codec::AudioConfig config_;
  std::vector<uint8_t> codec_description_;
};

}  // namespace reelforge::encode

#endif  // REELFORGE_ENCODE_AUDIO_ENCODER_SESSION_HPP_
