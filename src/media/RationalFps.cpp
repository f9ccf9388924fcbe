// Repository: Reelforge
// Component: Rational Frame Rate
// Purpose: Text form of output frame rates for configuration.
// Copyright (c) 2025 Reelforge

#include "reelforge/media/RationalFps.hpp"

#include <regex>
#include <stdexcept>

namespace reelforge::media {

std::optional<RationalFps> ParseRationalFps(const std::string& text) {
  static const std::regex kPattern(R"((\d+)(?:/(\d+))?)");
  std::smatch match;
  if (!std::regex_match(text, match, kPattern)) {
    return std::nullopt;
  }
  try {
    const int64_t num = std::stoll(match[1].str());
    const int64_t den = match[2].matched ? std::stoll(match[2].str()) : 1;
    const RationalFps fps(num, den);
    if (!fps.IsValid()) return std::nullopt;
    return fps;
  } catch (const std::out_of_range&) {
    return std::nullopt;
  }
}

std::string FormatRationalFps(const RationalFps& fps) {
  if (fps.den == 1) {
    return std::to_string(fps.num);
  }
  return std::to_string(fps.num) + "/" + std::to_string(fps.den);
}

}  // namespace reelforge::media
