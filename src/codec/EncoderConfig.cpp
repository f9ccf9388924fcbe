// Repository: Reelforge
// Component: Encoder Configuration
// Purpose: Video/audio encoder configuration structs and the fixed H.264
//          profile and resolution ladders probed at job start.
// Copyright (c) 2025 Reelforge

#include "reelforge/codec/EncoderConfig.hpp"

#include <sstream>

namespace reelforge::codec {

const char* ProfileName(H264Profile profile) {
  switch (profile) {
    case H264Profile::kBaseline: return "baseline";
    case H264Profile::kMain:     return "main";
    case H264Profile::kHigh:     return "high";
  }
  return "baseline";
}

const char* ProfileCodecString(H264Profile profile) {
  switch (profile) {
    case H264Profile::kBaseline: return "avc1.42E01E";
    case H264Profile::kMain:     return "avc1.4D401E";
    case H264Profile::kHigh:     return "avc1.64001E";
  }
  return "avc1.42E01E";
}

std::string EncoderConfig::Describe() const {
  std::ostringstream oss;
  oss << video_codec_id << " (" << ProfileName(profile) << ") "
      << width << "x" << height << " @" << fps.num << "/" << fps.den
      << " " << bitrate_bps << "bps gop=" << gop_size;
  return oss.str();
}

std::string AudioConfig::Describe() const {
  std::ostringstream oss;
  oss << audio_codec_id << " " << sample_rate << "Hz " << channel_count
      << "ch " << bitrate_bps << "bps";
  return oss.str();
}

EncoderConfig MakeVideoConfig(H264Profile profile, Resolution resolution,
                              media::RationalFps fps, int64_t bitrate_bps) {
  EncoderConfig config;
  config.width = resolution.width;
  config.height = resolution.height;
  config.fps = fps;
  config.bitrate_bps = bitrate_bps;
  config.profile = profile;
  config.video_codec_id = ProfileCodecString(profile);
  // Two seconds between keyframes, at least one.
  const int64_t gop = fps.IsValid() ? (2 * fps.num) / fps.den : 60;
  config.gop_size = gop > 0 ? static_cast<int>(gop) : 1;
  return config;
}

}  // namespace reelforge::codec
