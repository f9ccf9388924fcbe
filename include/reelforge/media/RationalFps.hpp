// Repository: Reelforge
// Component: Rational Frame Rate
// Purpose: Output frame rate as an exact fraction. Frame timestamps, frame
//          counts and per-frame durations are integer math on num/den so a
//          29.97 clip never drifts from its frame index.
// Copyright (c) 2025 Reelforge

#ifndef REELFORGE_MEDIA_RATIONAL_FPS_HPP_
#define REELFORGE_MEDIA_RATIONAL_FPS_HPP_

#include <cstdint>
#include <optional>
#include <string>

namespace reelforge::media {

namespace detail {
constexpr int64_t Gcd(int64_t a, int64_t b) {
  if (a < 0) a = -a;
  if (b < 0) b = -b;
  while (b != 0) {
    const int64_t r = a % b;
    a = b;
    b = r;
  }
  return a == 0 ? 1 : a;
}
}  // namespace detail

// Always stored reduced with den > 0. Any non-positive rate (including a zero
// denominator) collapses to the invalid value 0/1.
struct RationalFps {
  int64_t num;
  int64_t den;

  constexpr RationalFps(int64_t n = 0, int64_t d = 1) : num(n), den(d) {
    if (den < 0) {
      den = -den;
      num = -num;
    }
    if (num <= 0 || den == 0) {
      num = 0;
      den = 1;
      return;
    }
    const int64_t g = detail::Gcd(num, den);
    num /= g;
    den /= g;
  }

  constexpr bool IsValid() const { return num > 0; }

  // Presentation time of frame `index` on the output timeline (floor), in us.
  // Frame 0 is at 0; strictly increasing in index.
  constexpr int64_t FrameTimestampUs(int64_t index) const {
    return IsValid() ? (index * 1000000LL * den) / num : 0;
  }

  // Nominal single-frame duration in us (floor). Used when an encoder leaves
  // a chunk's duration unset.
  constexpr int64_t FrameDurationUs() const { return FrameTimestampUs(1); }

  // Frames needed so the output covers duration_us (ceil). A 10 s source at
  // 30 fps is 300 frames; 10.01 s is 301.
  constexpr int64_t FramesToCoverUs(int64_t duration_us) const {
    if (!IsValid() || duration_us <= 0) return 0;
    const int64_t scaled = duration_us * num;
    const int64_t per_frame = den * 1000000LL;
    return (scaled + per_frame - 1) / per_frame;
  }

  // Length of `frames` frames in seconds, as reported for finished output.
  constexpr double SecondsForFrames(int64_t frames) const {
    return IsValid() ? static_cast<double>(frames) * static_cast<double>(den) /
                           static_cast<double>(num)
                     : 0.0;
  }

  constexpr bool operator==(const RationalFps& other) const {
    return num == other.num && den == other.den;
  }
  constexpr bool operator!=(const RationalFps& other) const { return !(*this == other); }
};

constexpr RationalFps FPS_2997{30000, 1001};
constexpr RationalFps FPS_30{30, 1};
constexpr RationalFps FPS_25{25, 1};
constexpr RationalFps FPS_24{24, 1};

// Accepts "30" or "30000/1001". Rejects anything that does not reduce to a
// positive rate.
std::optional<RationalFps> ParseRationalFps(const std::string& text);

// "30" for integral rates, otherwise "num/den". ParseRationalFps round-trips it.
std::string FormatRationalFps(const RationalFps& fps);

}  // namespace reelforge::media

#endif  // REELFORGE_MEDIA_RATIONAL_FPS_HPP_
