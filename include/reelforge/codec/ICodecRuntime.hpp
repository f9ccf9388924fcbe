// Repository: Reelforge
// Component: Codec Runtime Interface
// Purpose: Query surface over the platform's encoders. Production uses
//          FFmpegCodecRuntime; contract tests substitute a scripted fake.
// Copyright (c) 2025 Reelforge

#ifndef REELFORGE_CODEC_ICODEC_RUNTIME_HPP_
#define REELFORGE_CODEC_ICODEC_RUNTIME_HPP_

#include <string>

#include "reelforge/codec/EncoderConfig.hpp"

namespace reelforge::codec {

class ICodecRuntime {
 public:
  virtual ~ICodecRuntime() = default;

  // True when some H.264 / AAC encoder exists at all.
  virtual bool HasVideoEncoder() const = 0;
  virtual bool HasAudioEncoder() const = 0;

  // True only when an encoder can actually be opened with this exact config.
  virtual bool IsVideoConfigSupported(const EncoderConfig& config) const = 0;
  virtual bool IsAudioConfigSupported(const AudioConfig& config) const = 0;

  // Human-readable name of the backing implementation (for logs).
  virtual std::string Name() const = 0;
};

}  // namespace reelforge::codec

#endif  // REELFORGE_CODEC_ICODEC_RUNTIME_HPP_
