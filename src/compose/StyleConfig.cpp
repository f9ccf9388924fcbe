// Repository: Reelforge
// Component: Style Configuration
// Purpose: Per-job composition style: framing mode, safe-zone guides and the
//          metadata strings rendered over the video.
// Copyright (c) 2025 Reelforge

#include "reelforge/compose/StyleConfig.hpp"

#include <algorithm>
#include <cctype>

namespace reelforge::compose {

const char* CompositionModeName(CompositionMode mode) {
  switch (mode) {
    case CompositionMode::kBlur: return "blur";
    case CompositionMode::kCrop: return "crop";
  }
  return "blur";
}

std::optional<CompositionMode> ParseCompositionMode(const std::string& name) {
  std::string lower = name;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (lower == "blur") return CompositionMode::kBlur;
  if (lower == "crop") return CompositionMode::kCrop;
  return std::nullopt;
}

}  // namespace reelforge::compose
