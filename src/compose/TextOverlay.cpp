// Repository: Reelforge
// Component: Text Overlay
// Purpose: Renders drop-shadowed metadata text onto RGBA canvases through a
//          libavfilter drawtext graph built once per job.
// Copyright (c) 2025 Reelforge

#include "reelforge/compose/TextOverlay.hpp"

#include <cstdio>
#include <cstring>

#include "reelforge/util/AvError.hpp"

extern "C" {
#include <libavfilter/avfilter.h>
#include <libavfilter/buffersink.h>
#include <libavfilter/buffersrc.h>
#include <libavutil/frame.h>
#include <libavutil/opt.h>
#include <libavutil/pixfmt.h>
}

namespace reelforge::compose {

namespace {

void SetError(std::string* error, const std::string& message) {
  if (error) *error = message;
}

}  // namespace

TextOverlay::TextOverlay()
    : graph_(nullptr),
      src_ctx_(nullptr),
      sink_ctx_(nullptr),
      in_frame_(nullptr),
      out_frame_(nullptr),
      width_(0),
      height_(0),
      next_pts_(0) {}

TextOverlay::~TextOverlay() {
  Reset();
}

void TextOverlay::Reset() {
  if (graph_) {
    avfilter_graph_free(&graph_);  // frees filter contexts too
  }
  graph_ = nullptr;
  src_ctx_ = nullptr;
  sink_ctx_ = nullptr;
  if (in_frame_) av_frame_free(&in_frame_);
  if (out_frame_) av_frame_free(&out_frame_);
  next_pts_ = 0;
}

bool TextOverlay::Build(int canvas_width, int canvas_height, const std::vector<TextItem>& items,
                        const std::string& font_file, std::string* error) {
  Reset();
  if (items.empty()) {
    SetError(error, "no text to render");
    return false;
  }

  const AVFilter* buffer_filter = avfilter_get_by_name("buffer");
  const AVFilter* sink_filter = avfilter_get_by_name("buffersink");
  const AVFilter* format_filter = avfilter_get_by_name("format");
  const AVFilter* drawtext_filter = avfilter_get_by_name("drawtext");
  if (!buffer_filter || !sink_filter || !format_filter) {
    SetError(error, "libavfilter buffer/buffersink/format unavailable");
    return false;
  }
  if (!drawtext_filter) {
    SetError(error, "drawtext filter unavailable (FFmpeg built without libfreetype)");
    return false;
  }

  graph_ = avfilter_graph_alloc();
  if (!graph_) {
    SetError(error, "avfilter_graph_alloc failed");
    return false;
  }

  char args[256];
  std::snprintf(args, sizeof(args),
                "video_size=%dx%d:pix_fmt=%d:time_base=1/30:pixel_aspect=1/1",
                canvas_width, canvas_height, static_cast<int>(AV_PIX_FMT_RGBA));
  int ret = avfilter_graph_create_filter(&src_ctx_, buffer_filter, "in", args, nullptr, graph_);
  if (ret < 0) {
    SetError(error, "buffer source: " + util::AvErrorString(ret));
    Reset();
    return false;
  }

  AVFilterContext* prev = src_ctx_;
  for (size_t i = 0; i < items.size(); ++i) {
    const TextItem& item = items[i];
    const std::string name = "text" + std::to_string(i);
    AVFilterContext* dt = avfilter_graph_alloc_filter(graph_, drawtext_filter, name.c_str());
    if (!dt) {
      SetError(error, "drawtext alloc failed");
      Reset();
      return false;
    }
    const std::string shadow = std::to_string(item.shadow_offset);
    av_opt_set(dt, "fontfile", font_file.c_str(), 0);
    av_opt_set(dt, "text", item.text.c_str(), 0);
    av_opt_set(dt, "expansion", "none", 0);
    av_opt_set(dt, "fontsize", std::to_string(item.font_px).c_str(), 0);
    av_opt_set(dt, "fontcolor", item.color.c_str(), 0);
    av_opt_set(dt, "x", item.x.c_str(), 0);
    av_opt_set(dt, "y", std::to_string(item.y).c_str(), 0);
    av_opt_set(dt, "shadowcolor", "black@0.8", 0);
    av_opt_set(dt, "shadowx", shadow.c_str(), 0);
    av_opt_set(dt, "shadowy", shadow.c_str(), 0);
    ret = avfilter_init_str(dt, nullptr);
    if (ret < 0) {
      SetError(error, "drawtext init (font " + font_file + "): " + util::AvErrorString(ret));
      Reset();
      return false;
    }
    ret = avfilter_link(prev, 0, dt, 0);
    if (ret < 0) {
      SetError(error, "drawtext link: " + util::AvErrorString(ret));
      Reset();
      return false;
    }
    prev = dt;
  }

  AVFilterContext* format_ctx = nullptr;
  ret = avfilter_graph_create_filter(&format_ctx, format_filter, "rgba", "pix_fmts=rgba",
                                     nullptr, graph_);
  if (ret >= 0) ret = avfilter_link(prev, 0, format_ctx, 0);
  if (ret >= 0) {
    ret = avfilter_graph_create_filter(&sink_ctx_, sink_filter, "out", nullptr, nullptr, graph_);
  }
  if (ret >= 0) ret = avfilter_link(format_ctx, 0, sink_ctx_, 0);
  if (ret >= 0) ret = avfilter_graph_config(graph_, nullptr);
  if (ret < 0) {
    SetError(error, "filter graph config: " + util::AvErrorString(ret));
    Reset();
    return false;
  }

  in_frame_ = av_frame_alloc();
  out_frame_ = av_frame_alloc();
  if (!in_frame_ || !out_frame_) {
    SetError(error, "frame alloc failed");
    Reset();
    return false;
  }
  width_ = canvas_width;
  height_ = canvas_height;
  return true;
}

bool TextOverlay::Apply(buffer::Frame& canvas, std::string* error) {
  if (!graph_) {
    return true;
  }
  if (canvas.width != width_ || canvas.height != height_) {
    SetError(error, "canvas size does not match overlay graph");
    return false;
  }

  in_frame_->width = width_;
  in_frame_->height = height_;
  in_frame_->format = AV_PIX_FMT_RGBA;
  in_frame_->pts = next_pts_++;
  int ret = av_frame_get_buffer(in_frame_, 0);
  if (ret < 0) {
    SetError(error, "av_frame_get_buffer: " + util::AvErrorString(ret));
    av_frame_unref(in_frame_);
    return false;
  }
  const int row_bytes = canvas.Stride();
  for (int y = 0; y < height_; ++y) {
    std::memcpy(in_frame_->data[0] + static_cast<size_t>(y) * in_frame_->linesize[0],
                canvas.data.data() + static_cast<size_t>(y) * row_bytes, row_bytes);
  }

  // Takes ownership of the reference and resets in_frame_.
  ret = av_buffersrc_add_frame(src_ctx_, in_frame_);
  if (ret < 0) {
    av_frame_unref(in_frame_);
    SetError(error, "av_buffersrc_add_frame: " + util::AvErrorString(ret));
    return false;
  }

  ret = av_buffersink_get_frame(sink_ctx_, out_frame_);
  if (ret < 0) {
    SetError(error, "av_buffersink_get_frame: " + util::AvErrorString(ret));
    return false;
  }
  for (int y = 0; y < height_; ++y) {
    std::memcpy(canvas.data.data() + static_cast<size_t>(y) * row_bytes,
                out_frame_->data[0] + static_cast<size_t>(y) * out_frame_->linesize[0], row_bytes);
  }
  av_frame_unref(out_frame_);
  return true;
}

}  // namespace reelforge::compose
