// Repository: Reelforge
// Component: Encoder Configuration
// Purpose: Video/audio encoder configuration structs and the fixed H.264
//          profile and resolution ladders probed at job start.
// Copyright (c) 2025 Reelforge

#ifndef REELFORGE_CODEC_ENCODER_CONFIG_HPP_
#define REELFORGE_CODEC_ENCODER_CONFIG_HPP_

#include <array>
#include <cstdint>
#include <string>

#include "reelforge/media/RationalFps.hpp"

namespace reelforge::codec {

enum class H264Profile {
  kBaseline,
  kMain,
  kHigh,
};

// x264-style profile name ("baseline", "main", "high").
const char* ProfileName(H264Profile profile);

// RFC 6381 codec string, level 3.0 ("avc1.42E01E", "avc1.4D401E", "avc1.64001E").
const char* ProfileCodecString(H264Profile profile);

struct Resolution {
  int width;
  int height;
};

// Portrait 9:16 ladder, most preferred first.
inline constexpr std::array<Resolution, 3> kResolutionLadder = {{
    {1080, 1920},
    {720, 1280},
    {540, 960},
}};

// Fallback when no candidate could be confirmed.
inline constexpr Resolution kReducedResolution = {720, 1280};

// Profiles in ascending preference order.
inline constexpr std::array<H264Profile, 3> kProfilePreference = {{
    H264Profile::kBaseline,
    H264Profile::kMain,
    H264Profile::kHigh,
}};

// EncoderConfig is immutable once an encoder session starts.
struct EncoderConfig {
  int width = 1080;
  int height = 1920;
  media::RationalFps fps{30, 1};
  int64_t bitrate_bps = 6000000;             // 6 Mbps
  H264Profile profile = H264Profile::kBaseline;
  std::string video_codec_id = "avc1.42E01E";
  int gop_size = 60;                          // keyframe every 2 s at 30 fps

  bool IsValid() const {
    return width > 0 && height > 0 && (width % 2) == 0 && (height % 2) == 0 &&
           fps.IsValid() && bitrate_bps > 0 && gop_size > 0;
  }

  std::string Describe() const;
};

struct AudioConfig {
  int sample_rate = 44100;
  int channel_count = 2;
  int64_t bitrate_bps = 128000;               // 128 kbps
  std::string audio_codec_id = "mp4a.40.2";   // AAC-LC

  bool IsValid() const {
    return sample_rate > 0 && channel_count > 0 && bitrate_bps > 0;
  }

  std::string Describe() const;
};

EncoderConfig MakeVideoConfig(H264Profile profile, Resolution resolution,
                              media::RationalFps fps, int64_t bitrate_bps);

}  // namespace reelforge::codec

#endif  // REELFORGE_CODEC_ENCODER_CONFIG_HPP_
