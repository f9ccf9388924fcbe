// Repository: Reelforge
// Component: Video Encoder Session
// Purpose: Asynchronous H.264 encode session over an IVideoEncoderBackend.
// Copyright (c) 2025 Reelforge

#ifndef REELFORGE_ENCODE_VIDEO_ENCODER_SESSION_HPP_
#define REELFORGE_ENCODE_VIDEO_ENCODER_SESSION_HPP_

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

struct VideoInput {
  buffer::Frame frame;
  int64_t timestamp_us = 0;
};

// Single producer: EncodeFrame() must be called from one thread.
class VideoEncoderSession : public EncoderSession<VideoInput> {
 public:
  VideoEncoderSession(const codec::ICodecRuntime& runtime,
                      std::unique_ptr<IVideoEncoderBackend> backend,
                      size_t max_queue_depth = kDefaultSessionQueueDepth);
  ~VideoEncoderSession() override;

  // Fails if the runtime rejects this exact config or the backend cannot open.
  bool Configure(const codec::EncoderConfig& config, std::string* error);

  // Frame must match the configured size; timestamps must strictly increase.
  // Blocks while the input queue is full.
  bool EncodeFrame(buffer::Frame frame, int64_t timestamp_us, std::string* error);

  std::vector<uint8_t> CodecDescription() const;
  const codec::EncoderConfig& config() const { return config_; }

 protected:
  bool EncodeInput(const VideoInput& input, std::vector<EncodedChunk>& out,
                   std::string* error) override;
  bool DrainEncoder(std::vector<EncodedChunk>& out, std::string* error) override;
  void ReleaseEncoder() override;

 private:
  const codec::ICodecRuntime& runtime_;
  std::unique_ptr<IVideoEncoderBackend> backend_;
  codec::EncoderConfig config_;
  std::vector<uint8_t> codec_description_;
  bool has_last_timestamp_;
  int64_t last_timestamp_us_;
};

}  // namespace reelforge::encode

#endif  // REELFORGE_ENCODE_VIDEO_ENCODER_SESSION_HPP_
