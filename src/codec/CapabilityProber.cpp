// Repository: Reelforge
// Component: Codec Capability Prober
// Purpose: Enumerate H.264 profile x resolution candidates plus the AAC-LC
//          target, verify each against the runtime and rank by preference.
// Copyright (c) 2025 Reelforge

#include "reelforge/codec/CapabilityProber.hpp"

#include <sstream>

#include "reelforge/util/Logger.hpp"

namespace reelforge::codec {

bool CandidateList::HasSupportedVideo() const {
  for (const auto& c : video) {
    if (c.supported) return true;
  }
  return false;
}

CapabilityProber::CapabilityProber(const ICodecRuntime& runtime, ProbeRequest request)
    : runtime_(runtime), request_(std::move(request)) {}

CandidateList CapabilityProber::Probe() const {
  CandidateList list;
  const bool has_video = runtime_.HasVideoEncoder();
  for (H264Profile profile : kProfilePreference) {
    for (const Resolution& res : kResolutionLadder) {
      VideoCandidate candidate;
      candidate.config = MakeVideoConfig(profile, res, request_.fps, request_.video_bitrate_bps);
      candidate.supported = has_video && runtime_.IsVideoConfigSupported(candidate.config);
      list.video.push_back(candidate);
    }
  }

  list.audio = request_.audio;
  list.audio_supported = runtime_.HasAudioEncoder() && runtime_.IsAudioConfigSupported(list.audio);

  int supported = 0;
  for (const auto& c : list.video) {
    if (c.supported) ++supported;
  }
  std::ostringstream oss;
  oss << "[CapabilityProber] runtime=" << runtime_.Name()
      << " video_candidates=" << supported << "/" << list.video.size()
      << " aac=" << (list.audio_supported ? "yes" : "no");
  util::Logger::Info(oss.str());
  return list;
}

EncoderConfig CapabilityProber::BestVideoConfig() const {
  return BestVideoConfig(Probe());
}

EncoderConfig CapabilityProber::BestVideoConfig(const CandidateList& candidates) const {
  return BestVideoConfigAtMost(candidates, kResolutionLadder.front().height);
}

EncoderConfig CapabilityProber::BestVideoConfigAtMost(const CandidateList& candidates,
                                                      int max_height) const {
  // Walk profiles from most to least preferred; within a profile take the
  // first (largest) supported ladder entry.
  for (auto p = kProfilePreference.rbegin(); p != kProfilePreference.rend(); ++p) {
    for (const auto& c : candidates.video) {
      if (c.config.profile == *p && c.supported && c.config.height <= max_height) {
        return c.config;
      }
    }
  }
  return MakeVideoConfig(H264Profile::kBaseline, kReducedResolution, request_.fps,
                         request_.video_bitrate_bps);
}

bool CapabilityProber::IsEncodingSupported() const {
  return runtime_.HasVideoEncoder() && runtime_.HasAudioEncoder();
}

std::string CapabilityProber::GetSupportDescription() const {
  const bool video = runtime_.HasVideoEncoder();
  const bool audio = runtime_.HasAudioEncoder();
  if (video && audio) {
    return "H.264/AAC encoding fully supported - Fast encoding available";
  }
  if (video || audio) {
    return "Encoding partially supported - Some features may be limited";
  }
  return "Encoding not supported - No H.264 or AAC encoder available";
}

}  // namespace reelforge::codec
