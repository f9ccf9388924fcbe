// Repository: Reelforge
// Component: Codec Capability Prober
// Purpose: Enumerate H.264 profile x resolution candidates plus the AAC-LC
//          target, verify each against the runtime and rank by preference.
// Copyright (c) 2025 Reelforge

#ifndef REELFORGE_CODEC_CAPABILITY_PROBER_HPP_
#define REELFORGE_CODEC_CAPABILITY_PROBER_HPP_

#include <string>
#include <vector>

#include "reelforge/codec/EncoderConfig.hpp"
#include "reelforge/codec/ICodecRuntime.hpp"

namespace reelforge::codec {

struct VideoCandidate {
  EncoderConfig config;
  bool supported = false;
};

struct CandidateList {
  // Probe order: profile ascending by preference, then resolution ladder.
  std::vector<VideoCandidate> video;
  AudioConfig audio;
  bool audio_supported = false;

  bool HasSupportedVideo() const;
};

struct ProbeRequest {
  media::RationalFps fps{30, 1};
  int64_t video_bitrate_bps = 6000000;
  AudioConfig audio;
};

// CapabilityProber fails closed: a candidate is only "supported" when the
// runtime confirms the exact configuration. It holds no state between calls
// beyond the runtime reference.
class CapabilityProber {
 public:
  explicit CapabilityProber(const ICodecRuntime& runtime, ProbeRequest request = ProbeRequest());

  CandidateList Probe() const;

  // Highest-preference supported profile at the highest supported resolution
  // for that profile. Baseline at kReducedResolution when nothing is confirmed.
  EncoderConfig BestVideoConfig() const;
  EncoderConfig BestVideoConfig(const CandidateList& candidates) const;

  // Same ranking, restricted to resolutions no larger than max_height.
  EncoderConfig BestVideoConfigAtMost(const CandidateList& candidates, int max_height) const;

  // True when both an H.264 and an AAC encoder are present.
  bool IsEncodingSupported() const;
  std::string GetSupportDescription() const;

  const ProbeRequest& request() const { return request_; }

 private:
  const ICodecRuntime& runtime_;
  ProbeRequest request_;
};

}  // namespace reelforge::codec

#endif  // REELFORGE_CODEC_CAPABILITY_PROBER_HPP_
