// Repository: Reelforge
// Component: Text Layout
// Purpose: Width estimation and ellipsis truncation for overlay text.
// Copyright (c) 2025 Reelforge

#ifndef REELFORGE_COMPOSE_TEXT_LAYOUT_HPP_
#define REELFORGE_COMPOSE_TEXT_LAYOUT_HPP_

#include <string>

namespace reelforge::compose {

inline constexpr char kEllipsis[] = "...";

// Advance width of DejaVu Sans Mono (1233/2048 em). Overlay text is rendered
// in a monospaced face so this estimate matches the rendered width.
inline constexpr double kMonospaceAdvanceEm = 1233.0 / 2048.0;

// Number of UTF-8 code points. Invalid lead bytes count as one each.
int CountCodepoints(const std::string& text);

// Estimated rendered width in pixels.
double MeasureTextWidth(const std::string& text, int font_px);

// Returns text unchanged when it fits max_width_px. Otherwise drops trailing
// code points until prefix + "..." fits and returns that. When even "..."
// is wider than max_width_px, returns the dots that fit. Idempotent:
// TruncateToWidth(TruncateToWidth(t)) == TruncateToWidth(t).
std::string TruncateToWidth(const std::string& text, double max_width_px, int font_px);

}  // namespace reelforge::compose

#endif  // REELFORGE_COMPOSE_TEXT_LAYOUT_HPP_
