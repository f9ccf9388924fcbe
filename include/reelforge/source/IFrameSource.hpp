// Repository: Reelforge
// Component: Frame Source Interface
// Purpose: Position-addressed RGBA frame capture and one-shot audio
//          extraction from a source video.
// Copyright (c) 2025 Reelforge

#ifndef REELFORGE_SOURCE_IFRAME_SOURCE_HPP_
#define REELFORGE_SOURCE_IFRAME_SOURCE_HPP_

#include <cstdint>
#include <string>
#include <vector>

#include "reelforge/buffer/Frame.hpp"

namespace reelforge::source {

// Samples per channel in each AudioBlock returned by ExtractAudio (the last
// block may be shorter).
inline constexpr int kAudioBlockSamples = 4096;

// IFrameSource is used from a single pipeline thread.
class IFrameSource {
 public:
  virtual ~IFrameSource() = default;

  virtual int Width() const = 0;
  virtual int Height() const = 0;
  virtual int64_t DurationUs() const = 0;
  virtual bool HasAudio() const = 0;

  // Fills `frame` with the source picture shown at position_us. Positions
  // may move backwards (the source seeks). Past the last decodable frame the
  // last picture is held.
  virtual bool CaptureAt(int64_t position_us, buffer::Frame& frame, std::string* error) = 0;

  // Decodes the whole audio track once, resampled to planar float at
  // sample_rate with `channels` channels. Returns false when there is no
  // audio stream or it cannot be decoded.
  virtual bool ExtractAudio(int sample_rate, int channels,
                            std::vector<buffer::AudioBlock>& blocks,
                            std::string* error) = 0;
};

}  // namespace reelforge::source

#endif  // REELFORGE_SOURCE_IFRAME_SOURCE_HPP_
