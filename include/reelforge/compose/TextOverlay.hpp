// Repository: Reelforge
// Component: Text Overlay
// Purpose: Renders drop-shadowed metadata text onto RGBA canvases through a
//          libavfilter drawtext graph built once per job.
// Copyright (c) 2025 Reelforge

#ifndef REELFORGE_COMPOSE_TEXT_OVERLAY_HPP_
#define REELFORGE_COMPOSE_TEXT_OVERLAY_HPP_

#include <cstdint>
#include <string>
#include <vector>

#include "reelforge/buffer/Frame.hpp"

struct AVFilterGraph;
struct AVFilterContext;
struct AVFrame;

namespace reelforge::compose {

struct TextItem {
  std::string text;
  int font_px = 16;
  std::string x;                   // drawtext x expression, e.g. "(w-text_w)/2" or "96"
  int y = 0;                       // top of the text box
  std::string color = "white";     // drawtext color syntax
  int shadow_offset = 1;
};

// TextOverlay owns one filter graph:
//   buffer(rgba) -> drawtext[0] -> ... -> drawtext[n-1] -> format(rgba) -> buffersink
//
// Text is passed through av_opt_set with expansion=none, so titles need no
// escaping. Build() failure leaves the overlay disabled; Apply() is then a
// no-op that returns true.
//
// Thread Safety: not thread-safe; one overlay per compositor.
class TextOverlay {
 public:
  TextOverlay();
  ~TextOverlay();

  TextOverlay(const TextOverlay&) = delete;
  TextOverlay& operator=(const TextOverlay&) = delete;

  bool Build(int canvas_width, int canvas_height, const std::vector<TextItem>& items,
             const std::string& font_file, std::string* error);

  bool Enabled() const { return graph_ != nullptr; }

  // Draws all text items onto canvas in place.
  bool Apply(buffer::Frame& canvas, std::string* error);

 private:
  void Reset();

  AVFilterGraph* graph_;
  AVFilterContext* src_ctx_;
  AVFilterContext* sink_ctx_;
  AVFrame* in_frame_;
  AVFrame* out_frame_;
  int width_;
  int height_;
  int64_t next_pts_;
};

}  // namespace reelforge::compose

#endif  // REELFORGE_COMPOSE_TEXT_OVERLAY_HPP_
