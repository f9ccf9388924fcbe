// Repository: Reelforge
// Component: FFmpeg Video Encoder
// Purpose: IVideoEncoderBackend over libavcodec H.264 (libx264 preferred).
//          RGBA input is converted to YUV420P with libswscale.
// Copyright (c) 2025 Reelforge

#include "reelforge/encode/FFmpegVideoEncoder.hpp"

#include <sstream>

#include "reelforge/codec/FFmpegCodecRuntime.hpp"
#include "reelforge/util/AvError.hpp"
#include "reelforge/util/Logger.hpp"

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavutil/dict.h>
#include <libavutil/frame.h>
#include <libavutil/mathematics.h>
#include <libswscale/swscale.h>
}

namespace reelforge::encode {

namespace {

constexpr AVRational kMicrosTimeBase = {1, 1000000};

void SetError(std::string* error, const std::string& message) {
  if (error) *error = message;
}

}  // namespace

FFmpegVideoEncoder::FFmpegVideoEncoder()
    : codec_ctx_(nullptr),
      frame_(nullptr),
      packet_(nullptr),
      sws_ctx_(nullptr),
      flushed_(false) {}

FFmpegVideoEncoder::~FFmpegVideoEncoder() {
  Close();
}

bool FFmpegVideoEncoder::Open(const codec::EncoderConfig& config, std::string* error) {
  Close();
  const AVCodec* codec = codec::FFmpegCodecRuntime::FindVideoEncoder();
  if (!codec) {
    SetError(error, "no H.264 encoder registered");
    return false;
  }

  codec_ctx_ = avcodec_alloc_context3(codec);
  if (!codec_ctx_) {
    SetError(error, "failed to allocate video codec context");
    return false;
  }

  AVDictionary* opts = nullptr;
  codec::FFmpegCodecRuntime::ConfigureVideoContext(codec_ctx_, codec, config, &opts);
  int ret = avcodec_open2(codec_ctx_, codec, &opts);
  av_dict_free(&opts);
  if (ret < 0) {
    SetError(error, "failed to open " + std::string(codec->name) + ": " + util::AvErrorString(ret));
    Close();
    return false;
  }

  frame_ = av_frame_alloc();
  packet_ = av_packet_alloc();
  if (!frame_ || !packet_) {
    SetError(error, "failed to allocate video frame/packet");
    Close();
    return false;
  }
  frame_->format = codec_ctx_->pix_fmt;
  frame_->width = codec_ctx_->width;
  frame_->height = codec_ctx_->height;
  ret = av_frame_get_buffer(frame_, 0);
  if (ret < 0) {
    SetError(error, "failed to allocate video frame buffer: " + util::AvErrorString(ret));
    Close();
    return false;
  }

  config_ = config;
  flushed_ = false;
  std::ostringstream oss;
  oss << "[FFmpegVideoEncoder] Opened " << codec->name << " " << config.Describe()
      << " extradata=" << codec_ctx_->extradata_size << "B";
  util::Logger::Info(oss.str());
  return true;
}

bool FFmpegVideoEncoder::Encode(const buffer::Frame& frame, int64_t timestamp_us,
                                std::vector<EncodedChunk>& out, std::string* error) {
  if (!codec_ctx_ || flushed_) {
    SetError(error, "video encoder not open");
    return false;
  }
  if (frame.width != codec_ctx_->width || frame.height != codec_ctx_->height) {
    SetError(error, "frame size changed mid-stream");
    return false;
  }

  sws_ctx_ = sws_getCachedContext(sws_ctx_, frame.width, frame.height, AV_PIX_FMT_RGBA,
                                  codec_ctx_->width, codec_ctx_->height, codec_ctx_->pix_fmt,
                                  SWS_BILINEAR, nullptr, nullptr, nullptr);
  if (!sws_ctx_) {
    SetError(error, "failed to create RGBA->YUV420P converter");
    return false;
  }

  int ret = av_frame_make_writable(frame_);
  if (ret < 0) {
    SetError(error, "av_frame_make_writable: " + util::AvErrorString(ret));
    return false;
  }
  const uint8_t* src[4] = {frame.data.data(), nullptr, nullptr, nullptr};
  const int src_stride[4] = {frame.Stride(), 0, 0, 0};
  sws_scale(sws_ctx_, src, src_stride, 0, frame.height, frame_->data, frame_->linesize);

  frame_->pts = av_rescale_q(timestamp_us, kMicrosTimeBase, codec_ctx_->time_base);
  pts_to_timestamp_us_[frame_->pts] = timestamp_us;

  ret = avcodec_send_frame(codec_ctx_, frame_);
  if (ret < 0) {
    SetError(error, "avcodec_send_frame: " + util::AvErrorString(ret));
    return false;
  }
  return ReceivePackets(out, error);
}

bool FFmpegVideoEncoder::Flush(std::vector<EncodedChunk>& out, std::string* error) {
  if (!codec_ctx_) {
    SetError(error, "video encoder not open");
    return false;
  }
  if (flushed_) {
    return true;
  }
  flushed_ = true;
  int ret = avcodec_send_frame(codec_ctx_, nullptr);
  if (ret < 0 && ret != AVERROR_EOF) {
    SetError(error, "flush send: " + util::AvErrorString(ret));
    return false;
  }
  return ReceivePackets(out, error);
}

bool FFmpegVideoEncoder::ReceivePackets(std::vector<EncodedChunk>& out, std::string* error) {
  while (true) {
    int ret = avcodec_receive_packet(codec_ctx_, packet_);
    if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF) {
      return true;
    }
    if (ret < 0) {
      SetError(error, "avcodec_receive_packet: " + util::AvErrorString(ret));
      return false;
    }

    EncodedChunk chunk;
    chunk.type = (packet_->flags & AV_PKT_FLAG_KEY) ? ChunkType::kKey : ChunkType::kDelta;
    auto it = pts_to_timestamp_us_.find(packet_->pts);
    if (it != pts_to_timestamp_us_.end()) {
      chunk.timestamp_us = it->second;
      pts_to_timestamp_us_.erase(it);
    } else {
      chunk.timestamp_us = av_rescale_q(packet_->pts, codec_ctx_->time_base, kMicrosTimeBase);
    }
    chunk.duration_us = config_.fps.FrameDurationUs();
    chunk.payload.assign(packet_->data, packet_->data + packet_->size);
    out.push_back(std::move(chunk));
    av_packet_unref(packet_);
  }
}

std::vector<uint8_t> FFmpegVideoEncoder::CodecDescription() const {
  if (!codec_ctx_ || !codec_ctx_->extradata || codec_ctx_->extradata_size <= 0) {
    return {};
  }
  return std::vector<uint8_t>(codec_ctx_->extradata,
                              codec_ctx_->extradata + codec_ctx_->extradata_size);
}

void FFmpegVideoEncoder::Close() {
  if (sws_ctx_) {
    sws_freeContext(sws_ctx_);
    sws_ctx_ = nullptr;
  }
  if (frame_) {
    av_frame_free(&frame_);
  }
  if (packet_) {
    av_packet_free(&packet_);
  }
  if (codec_ctx_) {
    avcodec_free_context(&codec_ctx_);
  }
  pts_to_timestamp_us_.clear();
  flushed_ = false;
}

}  // namespace reelforge::encode
