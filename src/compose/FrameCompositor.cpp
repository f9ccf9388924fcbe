// Repository: Reelforge
// Component: Frame Compositor
// Purpose: Turns one decoded source frame into one 9:16 canvas frame:
//          blur/crop framing, safe-zone guides, avatar and metadata text.
// Copyright (c) 2025 Reelforge

#include "reelforge/compose/FrameCompositor.hpp"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <vector>

#include "reelforge/compose/TextLayout.hpp"
#include "reelforge/util/Logger.hpp"

extern "C" {
#include <libavutil/pixfmt.h>
#include <libswscale/swscale.h>
}

namespace reelforge::compose {

namespace {

struct Rgba {
  uint8_t r;
  uint8_t g;
  uint8_t b;
};

constexpr Rgba kTopGuide{255, 0, 0};
constexpr Rgba kBottomGuide{0, 0, 255};
constexpr Rgba kAvatarFill{0x66, 0x66, 0x66};
constexpr double kBandAlpha = 0.1;
constexpr double kGuideLineAlpha = 0.6;

void SetError(std::string* error, const std::string& message) {
  if (error) *error = message;
}

bool ScaleRgba(SwsContext** ctx,
               const uint8_t* src, int src_stride, int src_w, int src_h,
               uint8_t* dst, int dst_stride, int dst_w, int dst_h,
               int flags, std::string* error) {
  *ctx = sws_getCachedContext(*ctx, src_w, src_h, AV_PIX_FMT_RGBA,
                              dst_w, dst_h, AV_PIX_FMT_RGBA,
                              flags, nullptr, nullptr, nullptr);
  if (!*ctx) {
    SetError(error, "sws_getCachedContext failed for " + std::to_string(src_w) + "x" +
                        std::to_string(src_h) + " -> " + std::to_string(dst_w) + "x" +
                        std::to_string(dst_h));
    return false;
  }
  const uint8_t* src_planes[4] = {src, nullptr, nullptr, nullptr};
  const int src_strides[4] = {src_stride, 0, 0, 0};
  uint8_t* dst_planes[4] = {dst, nullptr, nullptr, nullptr};
  const int dst_strides[4] = {dst_stride, 0, 0, 0};
  const int rows = sws_scale(*ctx, src_planes, src_strides, 0, src_h, dst_planes, dst_strides);
  if (rows <= 0) {
    SetError(error, "sws_scale produced no output");
    return false;
  }
  return true;
}

void BlendRect(buffer::Frame& f, int x0, int y0, int w, int h, Rgba c, double alpha) {
  const int x1 = std::min(f.width, x0 + w);
  const int y1 = std::min(f.height, y0 + h);
  x0 = std::max(0, x0);
  y0 = std::max(0, y0);
  const double keep = 1.0 - alpha;
  for (int y = y0; y < y1; ++y) {
    uint8_t* p = f.PixelAt(x0, y);
    for (int x = x0; x < x1; ++x, p += buffer::kRgbaBytesPerPixel) {
      p[0] = static_cast<uint8_t>(std::lround(p[0] * keep + c.r * alpha));
      p[1] = static_cast<uint8_t>(std::lround(p[1] * keep + c.g * alpha));
      p[2] = static_cast<uint8_t>(std::lround(p[2] * keep + c.b * alpha));
      p[3] = 255;
    }
  }
}

void FillCircle(buffer::Frame& f, int cx, int cy, int radius, Rgba c) {
  const int64_t r2 = static_cast<int64_t>(radius) * radius;
  const int y0 = std::max(0, cy - radius);
  const int y1 = std::min(f.height - 1, cy + radius);
  const int x0 = std::max(0, cx - radius);
  const int x1 = std::min(f.width - 1, cx + radius);
  for (int y = y0; y <= y1; ++y) {
    const int64_t dy = y - cy;
    for (int x = x0; x <= x1; ++x) {
      const int64_t dx = x - cx;
      if (dx * dx + dy * dy <= r2) {
        uint8_t* p = f.PixelAt(x, y);
        p[0] = c.r;
        p[1] = c.g;
        p[2] = c.b;
        p[3] = 255;
      }
    }
  }
}

void FillOpaqueBlack(buffer::Frame& f) {
  for (size_t i = 0; i < f.data.size(); i += buffer::kRgbaBytesPerPixel) {
    f.data[i] = 0;
    f.data[i + 1] = 0;
    f.data[i + 2] = 0;
    f.data[i + 3] = 255;
  }
}

void EnsureSize(buffer::Frame& f, int w, int h) {
  if (f.width != w || f.height != h || f.data.size() != buffer::Frame::ByteSize(w, h)) {
    f.width = w;
    f.height = h;
    f.data.assign(buffer::Frame::ByteSize(w, h), 0);
  }
}

}  // namespace

std::unique_ptr<FrameCompositor> FrameCompositor::Create(const StyleConfig& style,
                                                         int canvas_width,
                                                         int canvas_height,
                                                         std::string* error) {
  if (!IsPortraitCanvas(canvas_width, canvas_height)) {
    SetError(error, "canvas " + std::to_string(canvas_width) + "x" +
                        std::to_string(canvas_height) + " is not 9:16");
    return nullptr;
  }
  std::unique_ptr<FrameCompositor> compositor(
      new FrameCompositor(style, canvas_width, canvas_height));
  compositor->BuildTextOverlay();
  return compositor;
}

FrameCompositor::FrameCompositor(const StyleConfig& style, int canvas_width, int canvas_height)
    : style_(style),
      canvas_width_(canvas_width),
      canvas_height_(canvas_height),
      layout_(ComputeOverlayLayout(canvas_width, canvas_height)),
      bands_(ResolveSafeZones(style, canvas_height)),
      text_failed_(false),
      fill_ctx_(nullptr),
      fit_ctx_(nullptr) {
  blur_down_ctx_.fill(nullptr);
  blur_up_ctx_.fill(nullptr);
  if (!style_.metadata.title.empty()) {
    rendered_title_ = TruncateToWidth(style_.metadata.title, layout_.title_max_width,
                                      layout_.title_font_px);
  }
}

FrameCompositor::~FrameCompositor() {
  sws_freeContext(fill_ctx_);
  sws_freeContext(fit_ctx_);
  for (SwsContext* ctx : blur_down_ctx_) sws_freeContext(ctx);
  for (SwsContext* ctx : blur_up_ctx_) sws_freeContext(ctx);
}

void FrameCompositor::BuildTextOverlay() {
  std::vector<TextItem> items;
  if (!rendered_title_.empty()) {
    TextItem title;
    title.text = rendered_title_;
    title.font_px = layout_.title_font_px;
    title.x = "(w-text_w)/2";
    title.y = layout_.title_y;
    title.shadow_offset = layout_.title_shadow_offset;
    items.push_back(title);
  }
  if (!style_.metadata.channel_name.empty()) {
    TextItem channel;
    channel.text = style_.metadata.channel_name;
    channel.font_px = layout_.channel_font_px;
    channel.x = std::to_string(layout_.channel_x);
    channel.y = layout_.channel_y;
    channel.shadow_offset = layout_.channel_shadow_offset;
    items.push_back(channel);
  }
  if (!style_.metadata.subscriber_count_label.empty()) {
    TextItem subs;
    subs.text = style_.metadata.subscriber_count_label;
    subs.font_px = layout_.subscriber_font_px;
    subs.x = std::to_string(layout_.channel_x);
    subs.y = layout_.subscriber_y;
    subs.color = "0xCCCCCC";
    subs.shadow_offset = layout_.channel_shadow_offset;
    items.push_back(subs);
  }
  if (items.empty()) {
    return;
  }

  std::string error;
  if (!overlay_.Build(canvas_width_, canvas_height_, items, style_.font_file, &error)) {
    util::Logger::Warn("[FrameCompositor] Text overlay disabled: " + error);
  }
}

bool FrameCompositor::Compose(const buffer::Frame& source, buffer::Frame& out, std::string* error) {
  if (source.width <= 0 || source.height <= 0) {
    SetError(error, "source frame has non-positive dimensions " + std::to_string(source.width) +
                        "x" + std::to_string(source.height));
    return false;
  }
  if (!source.IsValid()) {
    SetError(error, "source frame payload is " + std::to_string(source.data.size()) +
                        " bytes, expected " +
                        std::to_string(buffer::Frame::ByteSize(source.width, source.height)));
    return false;
  }

  EnsureSize(out, canvas_width_, canvas_height_);
  FillOpaqueBlack(out);

  const bool drawn = (style_.mode == CompositionMode::kCrop) ? DrawCrop(source, out, error)
                                                             : DrawBlur(source, out, error);
  if (!drawn) {
    return false;
  }

  if (style_.show_safe_zones) {
    DrawSafeZones(out);
  }
  if (!style_.metadata.channel_name.empty()) {
    DrawAvatar(out);
  }

  if (overlay_.Enabled() && !text_failed_) {
    std::string text_error;
    if (!overlay_.Apply(out, &text_error)) {
      text_failed_ = true;
      util::Logger::Warn("[FrameCompositor] Text overlay failed, continuing without text: " +
                         text_error);
    }
  }

  out.pts_us = source.pts_us;
  return true;
}

bool FrameCompositor::DrawCrop(const buffer::Frame& source, buffer::Frame& out,
                               std::string* error) {
  const Rect crop = FillCropRect(source.width, source.height, canvas_width_, canvas_height_);
  return ScaleRgba(&fill_ctx_, source.PixelAt(crop.x, crop.y), source.Stride(),
                   crop.width, crop.height, out.data.data(), out.Stride(),
                   canvas_width_, canvas_height_, SWS_BILINEAR, error);
}

bool FrameCompositor::DrawBlur(const buffer::Frame& source, buffer::Frame& out,
                               std::string* error) {
  // Background: fill-scaled source, softened.
  if (!DrawCrop(source, out, error)) {
    return false;
  }
  if (!BlurInPlace(out, error)) {
    return false;
  }

  // Foreground: whole source, letterboxed and centered.
  const Rect fit = FitRect(source.width, source.height, canvas_width_, canvas_height_);
  EnsureSize(fit_scratch_, fit.width, fit.height);
  if (!ScaleRgba(&fit_ctx_, source.data.data(), source.Stride(), source.width, source.height,
                 fit_scratch_.data.data(), fit_scratch_.Stride(), fit.width, fit.height,
                 SWS_BICUBIC, error)) {
    return false;
  }
  const size_t row_bytes = static_cast<size_t>(fit.width) * buffer::kRgbaBytesPerPixel;
  for (int y = 0; y < fit.height; ++y) {
    std::memcpy(out.PixelAt(fit.x, fit.y + y), fit_scratch_.PixelAt(0, y), row_bytes);
  }
  return true;
}

bool FrameCompositor::BlurInPlace(buffer::Frame& canvas, std::string* error) {
  for (int i = 0; i < kBlurPasses; ++i) {
    const double scale = kBlurBaseScale / (1.0 + 0.5 * i);
    const int small_w = std::max(2, static_cast<int>(std::lround(canvas.width * scale)));
    const int small_h = std::max(2, static_cast<int>(std::lround(canvas.height * scale)));
    EnsureSize(blur_scratch_, small_w, small_h);
    if (!ScaleRgba(&blur_down_ctx_[static_cast<size_t>(i)], canvas.data.data(), canvas.Stride(),
                   canvas.width, canvas.height, blur_scratch_.data.data(), blur_scratch_.Stride(),
                   small_w, small_h, SWS_AREA, error)) {
      return false;
    }
    if (!ScaleRgba(&blur_up_ctx_[static_cast<size_t>(i)], blur_scratch_.data.data(),
                   blur_scratch_.Stride(), small_w, small_h, canvas.data.data(), canvas.Stride(),
                   canvas.width, canvas.height, SWS_BILINEAR, error)) {
      return false;
    }
  }
  return true;
}

void FrameCompositor::DrawSafeZones(buffer::Frame& out) const {
  const int line = std::max(2, canvas_height_ / 960);
  if (bands_.top_px > 0) {
    BlendRect(out, 0, 0, canvas_width_, bands_.top_px, kTopGuide, kBandAlpha);
    BlendRect(out, 0, std::max(0, bands_.top_px - line), canvas_width_, line, kTopGuide,
              kGuideLineAlpha);
  }
  if (bands_.bottom_px > 0) {
    const int top_of_band = canvas_height_ - bands_.bottom_px;
    BlendRect(out, 0, top_of_band, canvas_width_, bands_.bottom_px, kBottomGuide, kBandAlpha);
    BlendRect(out, 0, top_of_band, canvas_width_, line, kBottomGuide, kGuideLineAlpha);
  }
}

void FrameCompositor::DrawAvatar(buffer::Frame& out) const {
  FillCircle(out, layout_.avatar_center_x, layout_.avatar_center_y, layout_.avatar_radius,
             kAvatarFill);
}

}  // namespace reelforge::compose
