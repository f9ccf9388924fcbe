// Repository: Reelforge
// Component: Muxer Interface
// Purpose: Combine ordered video/audio chunk sets into one container buffer.
// Copyright (c) 2025 Reelforge

#ifndef REELFORGE_MUX_IMUXER_HPP_
#define REELFORGE_MUX_IMUXER_HPP_

#include <cstdint>
#include <string>
#include <vector>

#include "reelforge/codec/EncoderConfig.hpp"
#include "reelforge/encode/EncodedChunk.hpp"

namespace reelforge::mux {

inline constexpr int kVideoTimescale = 90000;
inline constexpr int kAacSamplesPerFrame = 1024;

struct MuxConfig {
  codec::EncoderConfig video;
  codec::AudioConfig audio;
  double duration_seconds = 0.0;
  std::vector<uint8_t> video_codec_description;  // H.264 extradata
  std::vector<uint8_t> audio_codec_description;  // AudioSpecificConfig
};

struct MuxedOutput {
  std::vector<uint8_t> buffer;
  size_t size = 0;
  double duration_seconds = 0.0;
  int video_tracks = 0;
  int audio_tracks = 0;
  int64_t video_samples = 0;
  int64_t audio_samples = 0;
};

// Human-readable summary of a finished file.
struct OutputSummary {
  double size_mb = 0.0;
  std::string duration_label;  // m:ss
  double bitrate_mbps = 0.0;
  std::string resolution;      // WxH
};

OutputSummary SummarizeOutput(const MuxedOutput& output, const MuxConfig& config);

class IMuxer {
 public:
  virtual ~IMuxer() = default;

  // Fails on zero video chunks, timestamps that do not strictly increase
  // within a track, or when the container writer is unavailable. Audio may
  // be empty: the audio track is still declared and holds zero samples.
  virtual bool Mux(const std::vector<encode::EncodedChunk>& video,
                   const std::vector<encode::EncodedChunk>& audio,
                   const MuxConfig& config,
                   MuxedOutput& output,
                   std::string* error) = 0;
};

}  // namespace reelforge::mux

#endif  // REELFORGE_MUX_IMUXER_HPP_
