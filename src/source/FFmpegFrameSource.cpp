// Repository: Reelforge
// Component: FFmpeg Frame Source
// Purpose: IFrameSource over libavformat/libavcodec with swscale RGBA
//          conversion and swresample audio extraction.
// Copyright (c) 2025 Reelforge

#include "reelforge/source/FFmpegFrameSource.hpp"

#include <algorithm>
#include <sstream>
#include <utility>

#include "reelforge/util/AvError.hpp"
#include "reelforge/util/Logger.hpp"

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/channel_layout.h>
#include <libavutil/frame.h>
#include <libavutil/mathematics.h>
#include <libavutil/samplefmt.h>
#include <libswresample/swresample.h>
#include <libswscale/swscale.h>
}

namespace reelforge::source {

namespace {

constexpr AVRational kMicrosTimeBase = {1, 1000000};

// Jumps further ahead than this seek instead of decoding through.
constexpr int64_t kForwardSeekThresholdUs = 3000000;

void SetError(std::string* error, const std::string& message) {
  if (error) *error = message;
}

// Owns the second demux/decode chain used for the one-shot audio pass.
struct AudioDecodeContext {
  AVFormatContext* format_ctx = nullptr;
  AVCodecContext* codec_ctx = nullptr;
  SwrContext* swr_ctx = nullptr;
  AVFrame* frame = nullptr;
  AVPacket* packet = nullptr;

  ~AudioDecodeContext() {
    if (packet) av_packet_free(&packet);
    if (frame) av_frame_free(&frame);
    if (swr_ctx) swr_free(&swr_ctx);
    if (codec_ctx) avcodec_free_context(&codec_ctx);
    if (format_ctx) avformat_close_input(&format_ctx);
  }
};

// Accumulates resampled planar samples and cuts them into fixed-size blocks.
class AudioBlockCutter {
 public:
  AudioBlockCutter(int sample_rate, int channels, std::vector<buffer::AudioBlock>& blocks)
      : sample_rate_(sample_rate), pending_(static_cast<size_t>(channels)), blocks_(blocks) {}

  void Append(const std::vector<std::vector<float>>& planes, int count) {
    for (size_t c = 0; c < pending_.size(); ++c) {
      pending_[c].insert(pending_[c].end(), planes[c].begin(), planes[c].begin() + count);
    }
    Cut(false);
  }

  void Finish() { Cut(true); }

  int64_t total_samples() const { return emitted_; }

 private:
  void Cut(bool final_block) {
    while (!pending_.empty() &&
           (pending_[0].size() >= static_cast<size_t>(kAudioBlockSamples) ||
            (final_block && !pending_[0].empty()))) {
      const size_t n = std::min(pending_[0].size(), static_cast<size_t>(kAudioBlockSamples));
      buffer::AudioBlock block;
      block.sample_rate = sample_rate_;
      block.timestamp_us = av_rescale_q(emitted_, AVRational{1, sample_rate_}, kMicrosTimeBase);
      block.planes.resize(pending_.size());
      for (size_t c = 0; c < pending_.size(); ++c) {
        block.planes[c].assign(pending_[c].begin(), pending_[c].begin() + static_cast<long>(n));
        pending_[c].erase(pending_[c].begin(), pending_[c].begin() + static_cast<long>(n));
      }
      emitted_ += static_cast<int64_t>(n);
      blocks_.push_back(std::move(block));
    }
  }

  const int sample_rate_;
  std::vector<std::vector<float>> pending_;
  std::vector<buffer::AudioBlock>& blocks_;
  int64_t emitted_ = 0;
};

// Resamples one decoded frame (or flushes when in == nullptr).
bool ResampleInto(SwrContext* swr, const AVFrame* in, int channels, AudioBlockCutter& cutter,
                  std::string* error) {
  const int in_count = in ? in->nb_samples : 0;
  const int out_capacity = swr_get_out_samples(swr, in_count);
  if (out_capacity <= 0) {
    return true;
  }
  std::vector<std::vector<float>> scratch(static_cast<size_t>(channels),
                                          std::vector<float>(static_cast<size_t>(out_capacity)));
  std::vector<uint8_t*> out_planes(static_cast<size_t>(channels));
  for (int c = 0; c < channels; ++c) {
    out_planes[static_cast<size_t>(c)] = reinterpret_cast<uint8_t*>(scratch[static_cast<size_t>(c)].data());
  }
  const int got = swr_convert(swr, out_planes.data(), out_capacity,
                              in ? const_cast<const uint8_t**>(in->extended_data) : nullptr,
                              in_count);
  if (got < 0) {
    SetError(error, "swr_convert: " + util::AvErrorString(got));
    return false;
  }
  if (got > 0) {
    cutter.Append(scratch, got);
  }
  return true;
}

}  // namespace

FFmpegFrameSource::FFmpegFrameSource(std::string input_path)
    : input_path_(std::move(input_path)),
      format_ctx_(nullptr),
      codec_ctx_(nullptr),
      frame_(nullptr),
      held_frame_(nullptr),
      packet_(nullptr),
      sws_ctx_(nullptr),
      video_stream_index_(-1),
      width_(0),
      height_(0),
      duration_us_(0),
      start_time_us_(0),
      half_frame_us_(0),
      has_audio_(false),
      demux_eof_(false),
      has_last_frame_(false),
      held_converted_(false) {}

FFmpegFrameSource::~FFmpegFrameSource() {
  Close();
}

bool FFmpegFrameSource::Open(std::string* error) {
  if (IsOpen()) {
    SetError(error, "source already open");
    return false;
  }
  av_log_set_level(AV_LOG_ERROR);

  int ret = avformat_open_input(&format_ctx_, input_path_.c_str(), nullptr, nullptr);
  if (ret < 0) {
    format_ctx_ = nullptr;
    SetError(error, "cannot open " + input_path_ + ": " + util::AvErrorString(ret));
    return false;
  }

  ret = avformat_find_stream_info(format_ctx_, nullptr);
  if (ret < 0) {
    SetError(error, "cannot read stream info: " + util::AvErrorString(ret));
    Close();
    return false;
  }

  video_stream_index_ = av_find_best_stream(format_ctx_, AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
  if (video_stream_index_ < 0) {
    SetError(error, "no video stream in " + input_path_);
    Close();
    return false;
  }
  has_audio_ = av_find_best_stream(format_ctx_, AVMEDIA_TYPE_AUDIO, -1, -1, nullptr, 0) >= 0;

  AVStream* stream = format_ctx_->streams[video_stream_index_];
  const AVCodec* codec = avcodec_find_decoder(stream->codecpar->codec_id);
  if (!codec) {
    SetError(error, std::string("no decoder for ") + avcodec_get_name(stream->codecpar->codec_id));
    Close();
    return false;
  }
  codec_ctx_ = avcodec_alloc_context3(codec);
  if (!codec_ctx_) {
    SetError(error, "failed to allocate decoder context");
    Close();
    return false;
  }
  ret = avcodec_parameters_to_context(codec_ctx_, stream->codecpar);
  if (ret < 0) {
    SetError(error, "failed to copy codec parameters: " + util::AvErrorString(ret));
    Close();
    return false;
  }
  ret = avcodec_open2(codec_ctx_, codec, nullptr);
  if (ret < 0) {
    SetError(error, "failed to open decoder: " + util::AvErrorString(ret));
    Close();
    return false;
  }

  frame_ = av_frame_alloc();
  held_frame_ = av_frame_alloc();
  packet_ = av_packet_alloc();
  if (!frame_ || !held_frame_ || !packet_) {
    SetError(error, "failed to allocate decode buffers");
    Close();
    return false;
  }

  width_ = codec_ctx_->width;
  height_ = codec_ctx_->height;
  if (width_ <= 0 || height_ <= 0) {
    SetError(error, "video stream has no dimensions");
    Close();
    return false;
  }

  start_time_us_ = stream->start_time != AV_NOPTS_VALUE
                       ? av_rescale_q(stream->start_time, stream->time_base, kMicrosTimeBase)
                       : 0;
  if (format_ctx_->duration != AV_NOPTS_VALUE && format_ctx_->duration > 0) {
    duration_us_ = av_rescale_q(format_ctx_->duration, AVRational{1, AV_TIME_BASE}, kMicrosTimeBase);
  } else if (stream->duration != AV_NOPTS_VALUE && stream->duration > 0) {
    duration_us_ = av_rescale_q(stream->duration, stream->time_base, kMicrosTimeBase);
  } else {
    duration_us_ = 0;
  }

  AVRational rate = stream->avg_frame_rate;
  if (rate.num <= 0 || rate.den <= 0) rate = stream->r_frame_rate;
  if (rate.num > 0 && rate.den > 0) {
    half_frame_us_ = av_rescale(1000000, rate.den, rate.num) / 2;
  } else {
    half_frame_us_ = 1000000 / 60;
  }

  std::ostringstream oss;
  oss << "[FFmpegFrameSource] Opened " << input_path_ << " " << width_ << "x" << height_
      << " duration=" << duration_us_ << "us audio=" << (has_audio_ ? "yes" : "no");
  util::Logger::Info(oss.str());
  return true;
}

void FFmpegFrameSource::Close() {
  if (sws_ctx_) {
    sws_freeContext(sws_ctx_);
    sws_ctx_ = nullptr;
  }
  if (packet_) {
    av_packet_free(&packet_);
  }
  if (held_frame_) {
    av_frame_free(&held_frame_);
  }
  if (frame_) {
    av_frame_free(&frame_);
  }
  if (codec_ctx_) {
    avcodec_free_context(&codec_ctx_);
  }
  if (format_ctx_) {
    avformat_close_input(&format_ctx_);
  }
  video_stream_index_ = -1;
  demux_eof_ = false;
  has_last_frame_ = false;
  held_converted_ = false;
}

FFmpegFrameSource::DecodeResult FFmpegFrameSource::DecodeNextFrame(std::string* error) {
  while (true) {
    int ret = avcodec_receive_frame(codec_ctx_, frame_);
    if (ret == 0) {
      av_frame_unref(held_frame_);
      av_frame_move_ref(held_frame_, frame_);
      held_converted_ = false;
      return DecodeResult::kFrame;
    }
    if (ret == AVERROR_EOF) {
      return DecodeResult::kEof;
    }
    if (ret != AVERROR(EAGAIN)) {
      SetError(error, "decode failed: " + util::AvErrorString(ret));
      return DecodeResult::kError;
    }

    ret = av_read_frame(format_ctx_, packet_);
    if (ret == AVERROR_EOF) {
      if (!demux_eof_) {
        demux_eof_ = true;
        avcodec_send_packet(codec_ctx_, nullptr);
      }
      continue;
    }
    if (ret < 0) {
      SetError(error, "read failed: " + util::AvErrorString(ret));
      return DecodeResult::kError;
    }
    if (packet_->stream_index != video_stream_index_) {
      av_packet_unref(packet_);
      continue;
    }
    ret = avcodec_send_packet(codec_ctx_, packet_);
    av_packet_unref(packet_);
    if (ret < 0 && ret != AVERROR(EAGAIN)) {
      // Corrupt packet: skip it and keep decoding.
      util::Logger::Debug("[FFmpegFrameSource] Dropped packet: " + util::AvErrorString(ret));
    }
  }
}

bool FFmpegFrameSource::SeekTo(int64_t position_us, std::string* error) {
  AVStream* stream = format_ctx_->streams[video_stream_index_];
  const int64_t target = av_rescale_q(position_us + start_time_us_, kMicrosTimeBase, stream->time_base);
  const int ret = av_seek_frame(format_ctx_, video_stream_index_, target, AVSEEK_FLAG_BACKWARD);
  if (ret < 0) {
    SetError(error, "seek to " + std::to_string(position_us) + "us failed: " + util::AvErrorString(ret));
    return false;
  }
  avcodec_flush_buffers(codec_ctx_);
  demux_eof_ = false;
  has_last_frame_ = false;
  av_frame_unref(held_frame_);
  held_converted_ = false;
  return true;
}

int64_t FFmpegFrameSource::HeldFramePtsUs() const {
  int64_t pts = held_frame_->best_effort_timestamp;
  if (pts == AV_NOPTS_VALUE) pts = held_frame_->pts;
  if (pts == AV_NOPTS_VALUE) return 0;
  AVStream* stream = format_ctx_->streams[video_stream_index_];
  return av_rescale_q(pts, stream->time_base, kMicrosTimeBase) - start_time_us_;
}

bool FFmpegFrameSource::ConvertHeldFrame(std::string* error) {
  const int w = held_frame_->width;
  const int h = held_frame_->height;
  sws_ctx_ = sws_getCachedContext(sws_ctx_, w, h, static_cast<AVPixelFormat>(held_frame_->format),
                                  w, h, AV_PIX_FMT_RGBA, SWS_BILINEAR, nullptr, nullptr, nullptr);
  if (!sws_ctx_) {
    SetError(error, "cannot convert frame format to RGBA");
    return false;
  }
  if (last_frame_.width != w || last_frame_.height != h || !last_frame_.IsValid()) {
    last_frame_ = buffer::Frame(w, h);
  }
  uint8_t* dst[4] = {last_frame_.data.data(), nullptr, nullptr, nullptr};
  int dst_stride[4] = {last_frame_.Stride(), 0, 0, 0};
  sws_scale(sws_ctx_, held_frame_->data, held_frame_->linesize, 0, h, dst, dst_stride);
  last_frame_.pts_us = HeldFramePtsUs();
  has_last_frame_ = true;
  held_converted_ = true;
  return true;
}

bool FFmpegFrameSource::CaptureAt(int64_t position_us, buffer::Frame& frame, std::string* error) {
  if (!IsOpen()) {
    SetError(error, "source not open");
    return false;
  }
  if (position_us < 0) position_us = 0;

  if (has_last_frame_) {
    if (last_frame_.pts_us - half_frame_us_ > position_us) {
      if (!SeekTo(position_us, error)) return false;
    } else if (last_frame_.pts_us + half_frame_us_ >= position_us) {
      frame = last_frame_;
      return true;
    } else if (!demux_eof_ && position_us - last_frame_.pts_us > kForwardSeekThresholdUs) {
      if (!SeekTo(position_us, error)) return false;
    }
  } else if (held_frame_->data[0] == nullptr && !demux_eof_ && position_us > kForwardSeekThresholdUs) {
    if (!SeekTo(position_us, error)) return false;
  }

  while (true) {
    const DecodeResult result = DecodeNextFrame(error);
    if (result == DecodeResult::kError) {
      return false;
    }
    if (result == DecodeResult::kEof) {
      if (!held_converted_ && held_frame_->data[0] != nullptr) {
        if (!ConvertHeldFrame(error)) return false;
      }
      if (!has_last_frame_) {
        SetError(error, "no decodable frame at " + std::to_string(position_us) + "us");
        return false;
      }
      frame = last_frame_;
      return true;
    }
    if (HeldFramePtsUs() + half_frame_us_ < position_us) {
      continue;  // preroll
    }
    if (!ConvertHeldFrame(error)) {
      return false;
    }
    frame = last_frame_;
    return true;
  }
}

bool FFmpegFrameSource::ExtractAudio(int sample_rate, int channels,
                                     std::vector<buffer::AudioBlock>& blocks,
                                     std::string* error) {
  if (sample_rate <= 0 || channels <= 0) {
    SetError(error, "invalid audio extraction format");
    return false;
  }

  AudioDecodeContext ctx;
  int ret = avformat_open_input(&ctx.format_ctx, input_path_.c_str(), nullptr, nullptr);
  if (ret < 0) {
    ctx.format_ctx = nullptr;
    SetError(error, "cannot open " + input_path_ + ": " + util::AvErrorString(ret));
    return false;
  }
  ret = avformat_find_stream_info(ctx.format_ctx, nullptr);
  if (ret < 0) {
    SetError(error, "cannot read stream info: " + util::AvErrorString(ret));
    return false;
  }
  const int stream_index = av_find_best_stream(ctx.format_ctx, AVMEDIA_TYPE_AUDIO, -1, -1, nullptr, 0);
  if (stream_index < 0) {
    SetError(error, "no audio stream");
    return false;
  }

  AVStream* stream = ctx.format_ctx->streams[stream_index];
  const AVCodec* codec = avcodec_find_decoder(stream->codecpar->codec_id);
  if (!codec) {
    SetError(error, std::string("no audio decoder for ") + avcodec_get_name(stream->codecpar->codec_id));
    return false;
  }
  ctx.codec_ctx = avcodec_alloc_context3(codec);
  if (!ctx.codec_ctx) {
    SetError(error, "failed to allocate audio decoder context");
    return false;
  }
  ret = avcodec_parameters_to_context(ctx.codec_ctx, stream->codecpar);
  if (ret >= 0) ret = avcodec_open2(ctx.codec_ctx, codec, nullptr);
  if (ret < 0) {
    SetError(error, "failed to open audio decoder: " + util::AvErrorString(ret));
    return false;
  }
  if (ctx.codec_ctx->ch_layout.nb_channels <= 0) {
    SetError(error, "audio stream has no channels");
    return false;
  }

  AVChannelLayout out_layout;
  av_channel_layout_default(&out_layout, channels);
  ret = swr_alloc_set_opts2(&ctx.swr_ctx,
                            &out_layout, AV_SAMPLE_FMT_FLTP, sample_rate,
                            &ctx.codec_ctx->ch_layout, ctx.codec_ctx->sample_fmt,
                            ctx.codec_ctx->sample_rate, 0, nullptr);
  av_channel_layout_uninit(&out_layout);
  if (ret < 0 || !ctx.swr_ctx) {
    SetError(error, "failed to configure audio resampler: " + util::AvErrorString(ret));
    return false;
  }
  ret = swr_init(ctx.swr_ctx);
  if (ret < 0) {
    SetError(error, "failed to initialize audio resampler: " + util::AvErrorString(ret));
    return false;
  }

  ctx.frame = av_frame_alloc();
  ctx.packet = av_packet_alloc();
  if (!ctx.frame || !ctx.packet) {
    SetError(error, "failed to allocate audio decode buffers");
    return false;
  }

  std::vector<buffer::AudioBlock> out;
  AudioBlockCutter cutter(sample_rate, channels, out);

  auto receive_all = [&]() -> bool {
    while (true) {
      const int r = avcodec_receive_frame(ctx.codec_ctx, ctx.frame);
      if (r == AVERROR(EAGAIN) || r == AVERROR_EOF) return true;
      if (r < 0) {
        SetError(error, "audio decode failed: " + util::AvErrorString(r));
        return false;
      }
      const bool ok = ResampleInto(ctx.swr_ctx, ctx.frame, channels, cutter, error);
      av_frame_unref(ctx.frame);
      if (!ok) return false;
    }
  };

  while ((ret = av_read_frame(ctx.format_ctx, ctx.packet)) >= 0) {
    if (ctx.packet->stream_index == stream_index) {
      const int sent = avcodec_send_packet(ctx.codec_ctx, ctx.packet);
      if (sent < 0 && sent != AVERROR(EAGAIN)) {
        util::Logger::Debug("[FFmpegFrameSource] Dropped audio packet: " + util::AvErrorString(sent));
      }
    }
    av_packet_unref(ctx.packet);
    if (!receive_all()) return false;
  }
  if (ret != AVERROR_EOF) {
    SetError(error, "audio read failed: " + util::AvErrorString(ret));
    return false;
  }
  avcodec_send_packet(ctx.codec_ctx, nullptr);
  if (!receive_all()) return false;
  if (!ResampleInto(ctx.swr_ctx, nullptr, channels, cutter, error)) return false;
  cutter.Finish();

  if (cutter.total_samples() == 0) {
    SetError(error, "audio stream produced no samples");
    return false;
  }

  std::ostringstream oss;
  oss << "[FFmpegFrameSource] Extracted " << out.size() << " audio blocks ("
      << cutter.total_samples() << " samples @ " << sample_rate << " Hz, " << channels << " ch)";
  util::Logger::Info(oss.str());
  blocks = std::move(out);
  return true;
}

std::unique_ptr<IFrameSource> OpenFFmpegFrameSource(const std::string& input_path,
                                                    std::string* error) {
  auto source = std::make_unique<FFmpegFrameSource>(input_path);
  if (!source->Open(error)) {
    return nullptr;
  }
  return source;
}

}  // namespace reelforge::source
