// Repository: Reelforge
// Component: Encoder Backend Interfaces
// Purpose: Synchronous codec seams driven by encoder session worker threads.
//          Production: FFmpegVideoEncoder / FFmpegAudioEncoder.
//          Tests: scripted fakes.
// Copyright (c) 2025 Reelforge

#ifndef REELFORGE_ENCODE_IENCODER_BACKEND_HPP_
#define REELFORGE_ENCODE_IENCODER_BACKEND_HPP_

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "reelforge/buffer/Frame.hpp"
#include "reelforge/codec/EncoderConfig.hpp"
#include "reelforge/encode/EncodedChunk.hpp"

namespace reelforge::encode {

// Backends are not thread-safe; a session calls them from one worker thread.
// Encode() may emit zero or more chunks (encoder delay); Flush() emits the rest.
class IVideoEncoderBackend {
 public:
  virtual ~IVideoEncoderBackend() = default;
  virtual bool Open(const codec::EncoderConfig& config, std::string* error) = 0;
  virtual bool Encode(const buffer::Frame& frame, int64_t timestamp_us,
                      std::vector<EncodedChunk>& out, std::string* error) = 0;
  virtual bool Flush(std::vector<EncodedChunk>& out, std::string* error) = 0;
  // Decoder configuration record source (H.264 SPS/PPS extradata).
  virtual std::vector<uint8_t> CodecDescription() const = 0;
  virtual void Close() = 0;
};

class IAudioEncoderBackend {
 public:
  virtual ~IAudioEncoderBackend() = default;
  virtual bool Open(const codec::AudioConfig& config, std::string* error) = 0;
  // interleaved holds samples_per_channel * channel_count floats.
  virtual bool Encode(const std::vector<float>& interleaved, int samples_per_channel,
                      int64_t timestamp_us, std::vector<EncodedChunk>& out,
                      std::string* error) = 0;
  virtual bool Flush(std::vector<EncodedChunk>& out, std::string* error) = 0;
  // AudioSpecificConfig extradata.
  virtual std::vector<uint8_t> CodecDescription() const = 0;
  virtual void Close() = 0;
};

class IEncoderBackendFactory {
 public:
  virtual ~IEncoderBackendFactory() = default;
  virtual std::unique_ptr<IVideoEncoderBackend> CreateVideoBackend() = 0;
  virtual std::unique_ptr<IAudioEncoderBackend> CreateAudioBackend() = 0;
};

}  // namespace reelforge::encode

#endif  // REELFORGE_ENCODE_IENCODER_BACKEND_HPP_
