// Repository: Reelforge
// Component: FFmpeg Encoder Factory
// Purpose: Production IEncoderBackendFactory handing out libavcodec backends.
// Copyright (c) 2025 Reelforge

#ifndef REELFORGE_ENCODE_FFMPEG_ENCODER_FACTORY_HPP_
#define REELFORGE_ENCODE_FFMPEG_ENCODER_FACTORY_HPP_

#include <memory>

#include "reelforge/encode/FFmpegAudioEncoder.hpp"
#include "reelforge/encode/FFmpegVideoEncoder.hpp"
#include "reelforge/encode/IEncoderBackend.hpp"

namespace reelforge::encode {

class FFmpegEncoderFactory : public IEncoderBackendFactory {
 public:
  std::unique_ptr<IVideoEncoderBackend> CreateVideoBackend() override {
    return std::make_unique<FFmpegVideoEncoder>();
  }
  std::unique_ptr<IAudioEncoderBackend> CreateAudioBackend() override {
    return std::make_unique<FFmpegAudioEncoder>();
  }
};

}  // namespace reelforge::encode

#endif  // REELFORGE_ENCODE_FFMPEG_ENCODER_FACTORY_HPP_
