// Repository: Reelforge
// Component: Canvas Geometry
// Purpose: Pure rectangle math for fit/fill framing onto the 9:16 canvas,
//          safe-zone bands and overlay anchor points.
// Copyright (c) 2025 Reelforge

#ifndef REELFORGE_COMPOSE_CANVAS_GEOMETRY_HPP_
#define REELFORGE_COMPOSE_CANVAS_GEOMETRY_HPP_

#include "reelforge/compose/StyleConfig.hpp"

namespace reelforge::compose {

inline constexpr int kCanvasAspectNum = 9;
inline constexpr int kCanvasAspectDen = 16;

struct Rect {
  int x = 0;
  int y = 0;
  int width = 0;
  int height = 0;

  bool operator==(const Rect& o) const {
    return x == o.x && y == o.y && width == o.width && height == o.height;
  }
};

// Exact 9:16 check (width * 16 == height * 9).
bool IsPortraitCanvas(int canvas_width, int canvas_height);

// Destination rect for drawing the whole source inside the canvas with its
// aspect preserved and centered (letterbox/pillarbox). Both inputs must be
// positive.
Rect FitRect(int src_width, int src_height, int canvas_width, int canvas_height);

// Source-space region with the canvas aspect, centered. Wider sources lose
// their sides, taller sources lose top and bottom.
Rect FillCropRect(int src_width, int src_height, int canvas_width, int canvas_height);

struct SafeZoneBands {
  int top_px = 0;
  int bottom_px = 0;
};

// Overrides > 0 win; otherwise 15% / 20% of canvas height. Each band is
// clamped to the canvas.
SafeZoneBands ResolveSafeZones(const StyleConfig& style, int canvas_height);

// Overlay anchors. Font sizes scale with canvas width against a 540 px
// reference (24 px title, 16 px channel, 14 px subscriber label).
struct OverlayLayout {
  int title_font_px = 0;
  int title_y = 0;               // top of title text, 5% of height
  int title_max_width = 0;       // 80% of canvas width

  int avatar_center_x = 0;       // circle left edge at 10% of width
  int avatar_center_y = 0;       // circle top edge at 75% of height
  int avatar_radius = 0;

  int channel_font_px = 0;
  int channel_x = 0;
  int channel_y = 0;
  int subscriber_font_px = 0;
  int subscriber_y = 0;

  int title_shadow_offset = 0;
  int channel_shadow_offset = 0;
};

OverlayLayout ComputeOverlayLayout(int canvas_width, int canvas_height);

}  // namespace reelforge::compose

#endif  // REELFORGE_COMPOSE_CANVAS_GEOMETRY_HPP_
