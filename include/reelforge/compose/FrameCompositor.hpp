// Repository: Reelforge
// Component: Frame Compositor
// Purpose: Turns one decoded source frame into one 9:16 canvas frame:
//          blur/crop framing, safe-zone guides, avatar and metadata text.
// Copyright (c) 2025 Reelforge

#ifndef REELFORGE_COMPOSE_FRAME_COMPOSITOR_HPP_
#define REELFORGE_COMPOSE_FRAME_COMPOSITOR_HPP_

#include <array>
#include <memory>
#include <string>

#include "reelforge/buffer/Frame.hpp"
#include "reelforge/compose/CanvasGeometry.hpp"
#include "reelforge/compose/StyleConfig.hpp"
#include "reelforge/compose/TextOverlay.hpp"

struct SwsContext;

namespace reelforge::compose {

inline constexpr int kDefaultCanvasWidth = 1080;
inline constexpr int kDefaultCanvasHeight = 1920;

// Number of progressive down/up-scale passes in blur mode. Pass i scales by
// kBlurBaseScale / (1 + 0.5 * i).
inline constexpr int kBlurPasses = 3;
inline constexpr double kBlurBaseScale = 0.125;

// FrameCompositor is deterministic: the same source frame and style always
// produce byte-identical output.
//
// Lifecycle:
// 1. Create() with the job's style and canvas size (rejects non-9:16)
// 2. Compose() once per frame
//
// Text rendering degrades: when the drawtext graph cannot be built the
// compositor logs one warning and renders everything except text.
//
// Thread Safety: not thread-safe; one compositor per job.
class FrameCompositor {
 public:
  static std::unique_ptr<FrameCompositor> Create(const StyleConfig& style,
                                                 int canvas_width,
                                                 int canvas_height,
                                                 std::string* error);
  ~FrameCompositor();

  FrameCompositor(const FrameCompositor&) = delete;
  FrameCompositor& operator=(const FrameCompositor&) = delete;

  // out is resized to exactly the canvas. Fails only for a source frame with
  // non-positive dimensions or a short payload, or a scaler failure.
  bool Compose(const buffer::Frame& source, buffer::Frame& out, std::string* error);

  int canvas_width() const { return canvas_width_; }
  int canvas_height() const { return canvas_height_; }
  const StyleConfig& style() const { return style_; }
  bool text_enabled() const { return overlay_.Enabled() && !text_failed_; }

  // Title after truncation to 80% of canvas width (empty when no title).
  const std::string& rendered_title() const { return rendered_title_; }

 private:
  FrameCompositor(const StyleConfig& style, int canvas_width, int canvas_height);

  void BuildTextOverlay();
  bool DrawCrop(const buffer::Frame& source, buffer::Frame& out, std::string* error);
  bool DrawBlur(const buffer::Frame& source, buffer::Frame& out, std::string* error);
  bool BlurInPlace(buffer::Frame& canvas, std::string* error);
  void DrawSafeZones(buffer::Frame& out) const;
  void DrawAvatar(buffer::Frame& out) const;

  StyleConfig style_;
  int canvas_width_;
  int canvas_height_;
  OverlayLayout layout_;
  SafeZoneBands bands_;
  std::string rendered_title_;

  TextOverlay overlay_;
  bool text_failed_;

  SwsContext* fill_ctx_;
  SwsContext* fit_ctx_;
  std::array<SwsContext*, kBlurPasses> blur_down_ctx_;
  std::array<SwsContext*, kBlurPasses> blur_up_ctx_;
  buffer::Frame fit_scratch_;
  buffer::Frame blur_scratch_;
};

}  // namespace reelforge::compose

#endif  // REELFORGE_COMPOSE_FRAME_COMPOSITOR_HPP_
