// Repository: Reelforge
// Component: Text Layout
// Purpose: Width estimation and ellipsis truncation for overlay text.
// Copyright (c) 2025 Reelforge

#include "reelforge/compose/TextLayout.hpp"

#include <vector>

namespace reelforge::compose {

namespace {

// Byte length of the code point starting at lead byte c.
size_t CodepointLength(unsigned char c) {
  if (c < 0x80) return 1;
  if ((c & 0xE0) == 0xC0) return 2;
  if ((c & 0xF0) == 0xE0) return 3;
  if ((c & 0xF8) == 0xF0) return 4;
  return 1;
}

// Byte offsets of each code point boundary, including text.size().
std::vector<size_t> CodepointBoundaries(const std::string& text) {
  std::vector<size_t> bounds;
  size_t i = 0;
  bounds.push_back(0);
  while (i < text.size()) {
    size_t len = CodepointLength(static_cast<unsigned char>(text[i]));
    i = (i + len > text.size()) ? text.size() : i + len;
    bounds.push_back(i);
  }
  return bounds;
}

}  // namespace

int CountCodepoints(const std::string& text) {
  return static_cast<int>(CodepointBoundaries(text).size()) - 1;
}

double MeasureTextWidth(const std::string& text, int font_px) {
  return CountCodepoints(text) * font_px * kMonospaceAdvanceEm;
}

std::string TruncateToWidth(const std::string& text, double max_width_px, int font_px) {
  if (MeasureTextWidth(text, font_px) <= max_width_px) {
    return text;
  }
  const std::vector<size_t> bounds = CodepointBoundaries(text);
  const int ellipsis_points = CountCodepoints(kEllipsis);
  // Longest prefix (in code points) that still fits with the ellipsis.
  int keep = static_cast<int>(bounds.size()) - 1;
  while (keep > 0 && (keep + ellipsis_points) * font_px * kMonospaceAdvanceEm > max_width_px) {
    --keep;
  }
  if (keep > 0 || MeasureTextWidth(kEllipsis, font_px) <= max_width_px) {
    return text.substr(0, bounds[static_cast<size_t>(keep)]) + kEllipsis;
  }
  // Too narrow for the full ellipsis: as many dots as fit, possibly none.
  std::string dots = kEllipsis;
  while (!dots.empty() && MeasureTextWidth(dots, font_px) > max_width_px) {
    dots.pop_back();
  }
  return dots;
}

}  // namespace reelforge::compose
