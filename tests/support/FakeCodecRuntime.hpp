// Repository: Reelforge
// Component: Fake Codec Runtime (test only)
// Purpose: Capability answers controlled by the test.
// Copyright (c) 2025 Reelforge

#ifndef REELFORGE_TESTS_SUPPORT_FAKE_CODEC_RUNTIME_HPP_
#define REELFORGE_TESTS_SUPPORT_FAKE_CODEC_RUNTIME_HPP_

#include <set>
#include <string>
#include <utility>

#include "reelforge/codec/ICodecRuntime.hpp"

namespace reelforge::tests {

// By default only the smallest ladder rung is supported (keeps composited
// frames small) and AAC is available.
class FakeCodecRuntime : public codec::ICodecRuntime {
 public:
  bool has_video = true;
  bool has_audio = true;
  std::set<int> supported_heights = {960};
  std::set<codec::H264Profile> supported_profiles = {
      codec::H264Profile::kBaseline, codec::H264Profile::kMain, codec::H264Profile::kHigh};
  bool audio_config_ok = true;

  bool HasVideoEncoder() const override { return has_video; }
  bool HasAudioEncoder() const override { return has_audio; }

  bool IsVideoConfigSupported(const codec::EncoderConfig& config) const override {
    return has_video && config.IsValid() && supported_heights.count(config.height) > 0 &&
           supported_profiles.count(config.profile) > 0;
  }

  bool IsAudioConfigSupported(const codec::AudioConfig& config) const override {
    return has_audio && audio_config_ok && config.IsValid();
  }

  std::string Name() const override { return "fake"; }
};

}  // namespace reelforge::tests

#endif  // REELFORGE_TESTS_SUPPORT_FAKE_CODEC_RUNTIME_HPP_
