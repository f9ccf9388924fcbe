// Repository: Reelforge
// Component: Frame Types
// Purpose: Raw RGBA video frames and planar float audio blocks passed between
//          the frame source, compositor and encoder sessions.
// Copyright (c) 2025 Reelforge

#ifndef REELFORGE_BUFFER_FRAME_HPP_
#define REELFORGE_BUFFER_FRAME_HPP_

#include <cstddef>
#include <cstdint>
#include <vector>

namespace reelforge::buffer {

inline constexpr int kRgbaBytesPerPixel = 4;

// Tightly packed RGBA8888 frame (stride == width * 4).
struct Frame {
  int width = 0;
  int height = 0;
  int64_t pts_us = 0;
  std::vector<uint8_t> data;

  Frame() = default;
  Frame(int w, int h) : width(w), height(h), data(ByteSize(w, h), 0) {}

  static size_t ByteSize(int w, int h) {
    if (w <= 0 || h <= 0) return 0;
    return static_cast<size_t>(w) * static_cast<size_t>(h) * kRgbaBytesPerPixel;
  }

  int Stride() const { return width * kRgbaBytesPerPixel; }

  bool IsValid() const {
    return width > 0 && height > 0 && data.size() == ByteSize(width, height);
  }

  uint8_t* PixelAt(int x, int y) {
    return data.data() + (static_cast<size_t>(y) * Stride()) + static_cast<size_t>(x) * kRgbaBytesPerPixel;
  }
  const uint8_t* PixelAt(int x, int y) const {
    return data.data() + (static_cast<size_t>(y) * Stride()) + static_cast<size_t>(x) * kRgbaBytesPerPixel;
  }
};

// Planar float audio. planes[c] holds samples_per_channel samples for
// channel c, nominally in [-1, 1].
struct AudioBlock {
  int sample_rate = 0;
  int64_t timestamp_us = 0;
  std::vector<std::vector<float>> planes;

  int ChannelCount() const { return static_cast<int>(planes.size()); }
  int SamplesPerChannel() const {
    return planes.empty() ? 0 : static_cast<int>(planes.front().size());
  }
};

}  // namespace reelforge::buffer

#endif  // REELFORGE_BUFFER_FRAME_HPP_
