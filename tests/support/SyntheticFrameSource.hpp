// Repository: Reelforge
// Component: Synthetic Frame Source (test only)
// Purpose: In-memory IFrameSource producing position-coded gradients and a
//          sine audio track.
// Copyright (c) 2025 Reelforge

#ifndef REELFORGE_TESTS_SUPPORT_SYNTHETIC_FRAME_SOURCE_HPP_
#define REELFORGE_TESTS_SUPPORT_SYNTHETIC_FRAME_SOURCE_HPP_

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "reelforge/source/IFrameSource.hpp"

namespace reelforge::tests {

inline constexpr double kTwoPi = 6.283185307179586;

class SyntheticFrameSource : public source::IFrameSource {
 public:
  SyntheticFrameSource(int width, int height, int64_t duration_us, bool has_audio = false)
      : width_(width), height_(height), duration_us_(duration_us), has_audio_(has_audio) {}

  // Called at the start of every CaptureAt (e.g. to block or count).
  std::function<void(int64_t position_us)> on_capture;
  // CaptureAt fails on this call index (0-based) when >= 0.
  int fail_capture_at_call = -1;
  bool fail_audio = false;

  int Width() const override { return width_; }
  int Height() const override { return height_; }
  int64_t DurationUs() const override { return duration_us_; }
  bool HasAudio() const override { return has_audio_; }

  bool CaptureAt(int64_t position_us, buffer::Frame& frame, std::string* error) override {
    if (on_capture) on_capture(position_us);
    const int call = static_cast<int>(positions_.size());
    positions_.push_back(position_us);
    if (call == fail_capture_at_call) {
      if (error) *error = "synthetic capture failure";
      return false;
    }
    const int64_t clamped = std::min(position_us, duration_us_);
    const uint8_t shade = static_cast<uint8_t>((clamped / 1000) & 0xFF);
    frame = buffer::Frame(width_, height_);
    frame.pts_us = clamped;
    for (int y = 0; y < height_; ++y) {
      for (int x = 0; x < width_; ++x) {
        uint8_t* px = frame.PixelAt(x, y);
        px[0] = static_cast<uint8_t>((x * 255) / std::max(1, width_ - 1));
        px[1] = static_cast<uint8_t>((y * 255) / std::max(1, height_ - 1));
        px[2] = shade;
        px[3] = 255;
      }
    }
    return true;
  }

  bool ExtractAudio(int sample_rate, int channels, std::vector<buffer::AudioBlock>& blocks,
                    std::string* error) override {
    if (!has_audio_) {
      if (error) *error = "no audio stream";
      return false;
    }
    if (fail_audio) {
      if (error) *error = "synthetic audio decode failure";
      return false;
    }
    blocks.clear();
    const int64_t total = (duration_us_ * sample_rate) / 1000000;
    for (int64_t start = 0; start < total; start += source::kAudioBlockSamples) {
      const int n = static_cast<int>(std::min<int64_t>(source::kAudioBlockSamples, total - start));
      buffer::AudioBlock block;
      block.sample_rate = sample_rate;
      block.timestamp_us = (start * 1000000) / sample_rate;
      block.planes.assign(static_cast<size_t>(channels), std::vector<float>(static_cast<size_t>(n)));
      for (int c = 0; c < channels; ++c) {
        for (int i = 0; i < n; ++i) {
          block.planes[c][i] =
              0.25f * static_cast<float>(std::sin(kTwoPi * 440.0 * (start + i) / sample_rate));
        }
      }
      blocks.push_back(std::move(block));
    }
    return true;
  }

  const std::vector<int64_t>& positions() const { return positions_; }

 private:
  int width_;
  int height_;
  int64_t duration_us_;
  bool has_audio_;
  std::vector<int64_t> positions_;
};

}  // namespace reelforge::tests

#endif  // REELFORGE_TESTS_SUPPORT_SYNTHETIC_FRAME_SOURCE_HPP_
