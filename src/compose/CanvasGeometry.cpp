// Repository: Reelforge
// Component: Canvas Geometry
// Purpose: Pure rectangle math for fit/fill framing onto the 9:16 canvas,
//          safe-zone bands and overlay anchor points.
// Copyright (c) 2025 Reelforge

#include "reelforge/compose/CanvasGeometry.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>

namespace reelforge::compose {

namespace {

constexpr double kLayoutReferenceWidth = 540.0;

int Scaled(double px, double scale, int min_value) {
  return std::max(min_value, static_cast<int>(std::lround(px * scale)));
}

}  // namespace

bool IsPortraitCanvas(int canvas_width, int canvas_height) {
  if (canvas_width <= 0 || canvas_height <= 0) return false;
  return static_cast<int64_t>(canvas_width) * kCanvasAspectDen ==
         static_cast<int64_t>(canvas_height) * kCanvasAspectNum;
}

Rect FitRect(int src_width, int src_height, int canvas_width, int canvas_height) {
  Rect r;
  const double frame_aspect = static_cast<double>(src_width) / src_height;
  const double canvas_aspect = static_cast<double>(canvas_width) / canvas_height;
  if (frame_aspect > canvas_aspect) {
    r.width = canvas_width;
    r.height = static_cast<int>(std::lround(canvas_width / frame_aspect));
  } else {
    r.height = canvas_height;
    r.width = static_cast<int>(std::lround(canvas_height * frame_aspect));
  }
  r.width = std::clamp(r.width, 1, canvas_width);
  r.height = std::clamp(r.height, 1, canvas_height);
  r.x = (canvas_width - r.width) / 2;
  r.y = (canvas_height - r.height) / 2;
  return r;
}

Rect FillCropRect(int src_width, int src_height, int canvas_width, int canvas_height) {
  Rect r;
  const double frame_aspect = static_cast<double>(src_width) / src_height;
  const double canvas_aspect = static_cast<double>(canvas_width) / canvas_height;
  if (frame_aspect > canvas_aspect) {
    r.height = src_height;
    r.width = static_cast<int>(std::lround(src_height * canvas_aspect));
  } else {
    r.width = src_width;
    r.height = static_cast<int>(std::lround(src_width / canvas_aspect));
  }
  r.width = std::clamp(r.width, 1, src_width);
  r.height = std::clamp(r.height, 1, src_height);
  r.x = (src_width - r.width) / 2;
  r.y = (src_height - r.height) / 2;
  return r;
}

SafeZoneBands ResolveSafeZones(const StyleConfig& style, int canvas_height) {
  SafeZoneBands bands;
  bands.top_px = style.top_safe_zone_px > 0
                     ? style.top_safe_zone_px
                     : static_cast<int>(std::lround(canvas_height * kDefaultTopSafeZoneRatio));
  bands.bottom_px = style.bottom_safe_zone_px > 0
                        ? style.bottom_safe_zone_px
                        : static_cast<int>(std::lround(canvas_height * kDefaultBottomSafeZoneRatio));
  bands.top_px = std::clamp(bands.top_px, 0, canvas_height);
  bands.bottom_px = std::clamp(bands.bottom_px, 0, canvas_height);
  return bands;
}

OverlayLayout ComputeOverlayLayout(int canvas_width, int canvas_height) {
  const double scale = canvas_width / kLayoutReferenceWidth;
  OverlayLayout l;

  l.title_font_px = Scaled(24, scale, 8);
  l.title_y = static_cast<int>(std::lround(canvas_height * 0.05));
  l.title_max_width = static_cast<int>(canvas_width * 0.8);

  const int avatar_size = Scaled(40, scale, 4);
  const int avatar_x = static_cast<int>(std::lround(canvas_width * 0.10));
  const int avatar_y = static_cast<int>(std::lround(canvas_height * 0.75));
  l.avatar_radius = avatar_size / 2;
  l.avatar_center_x = avatar_x + l.avatar_radius;
  l.avatar_center_y = avatar_y + l.avatar_radius;

  l.channel_font_px = Scaled(16, scale, 6);
  l.channel_x = avatar_x + avatar_size + Scaled(12, scale, 2);
  l.channel_y = avatar_y;
  l.subscriber_font_px = Scaled(14, scale, 6);
  l.subscriber_y = l.channel_y + Scaled(20, scale, l.channel_font_px);

  l.title_shadow_offset = Scaled(2, scale, 1);
  l.channel_shadow_offset = Scaled(1, scale, 1);
  return l;
}

}  // namespace reelforge::compose
