// Repository: Reelforge
// Component: FFmpeg Audio Encoder
// Purpose: IAudioEncoderBackend over libavcodec AAC. Interleaved float input
//          is buffered into codec-sized frames and converted with libswresample.
// Copyright (c) 2025 Reelforge

#include "reelforge/encode/FFmpegAudioEncoder.hpp"

#include <algorithm>
#include <sstream>

#include "reelforge/codec/FFmpegCodecRuntime.hpp"
#include "reelforge/util/AvError.hpp"
#include "reelforge/util/Logger.hpp"

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavutil/channel_layout.h>
#include <libavutil/frame.h>
#include <libavutil/mathematics.h>
#include <libavutil/samplefmt.h>
#include <libswresample/swresample.h>
}

namespace reelforge::encode {

namespace {

constexpr AVRational kMicrosTimeBase = {1, 1000000};
constexpr int kFallbackAacFrameSize = 1024;

void SetError(std::string* error, const std::string& message) {
  if (error) *error = message;
}

}  // namespace

FFmpegAudioEncoder::FFmpegAudioEncoder()
    : codec_ctx_(nullptr),
      frame_(nullptr),
      packet_(nullptr),
      swr_ctx_(nullptr),
      frame_size_(kFallbackAacFrameSize),
      flushed_(false),
      samples_sent_(0),
      has_base_timestamp_(false),
      base_timestamp_us_(0) {}

FFmpegAudioEncoder::~FFmpegAudioEncoder() {
  Close();
}

bool FFmpegAudioEncoder::Open(const codec::AudioConfig& config, std::string* error) {
  Close();
  const AVCodec* codec = codec::FFmpegCodecRuntime::FindAudioEncoder();
  if (!codec) {
    SetError(error, "no AAC encoder registered");
    return false;
  }

  codec_ctx_ = avcodec_alloc_context3(codec);
  if (!codec_ctx_) {
    SetError(error, "failed to allocate audio codec context");
    return false;
  }
  if (!codec::FFmpegCodecRuntime::ConfigureAudioContext(codec_ctx_, config)) {
    SetError(error, "unsupported channel count " + std::to_string(config.channel_count));
    Close();
    return false;
  }

  // Open codec (this is where libavcodec populates AudioSpecificConfig extradata).
  int ret = avcodec_open2(codec_ctx_, codec, nullptr);
  if (ret < 0) {
    SetError(error, "failed to open " + std::string(codec->name) + ": " + util::AvErrorString(ret));
    Close();
    return false;
  }
  frame_size_ = codec_ctx_->frame_size > 0 ? codec_ctx_->frame_size : kFallbackAacFrameSize;

  // Interleaved float in, codec sample format out, same rate and layout.
  ret = swr_alloc_set_opts2(&swr_ctx_,
                            &codec_ctx_->ch_layout, codec_ctx_->sample_fmt, codec_ctx_->sample_rate,
                            &codec_ctx_->ch_layout, AV_SAMPLE_FMT_FLT, codec_ctx_->sample_rate,
                            0, nullptr);
  if (ret < 0 || !swr_ctx_) {
    SetError(error, "failed to set resampler options: " + util::AvErrorString(ret));
    Close();
    return false;
  }
  ret = swr_init(swr_ctx_);
  if (ret < 0) {
    SetError(error, "failed to initialize resampler: " + util::AvErrorString(ret));
    Close();
    return false;
  }

  frame_ = av_frame_alloc();
  packet_ = av_packet_alloc();
  if (!frame_ || !packet_) {
    SetError(error, "failed to allocate audio frame/packet");
    Close();
    return false;
  }
  frame_->format = codec_ctx_->sample_fmt;
  frame_->sample_rate = codec_ctx_->sample_rate;
  frame_->nb_samples = frame_size_;
  ret = av_channel_layout_copy(&frame_->ch_layout, &codec_ctx_->ch_layout);
  if (ret >= 0) {
    ret = av_frame_get_buffer(frame_, 0);
  }
  if (ret < 0) {
    SetError(error, "failed to allocate audio frame buffer: " + util::AvErrorString(ret));
    Close();
    return false;
  }

  config_ = config;
  std::ostringstream oss;
  oss << "[FFmpegAudioEncoder] Opened " << codec->name << " " << config.Describe()
      << " frame_size=" << frame_size_ << " extradata=" << codec_ctx_->extradata_size << "B";
  util::Logger::Info(oss.str());
  return true;
}

bool FFmpegAudioEncoder::Encode(const std::vector<float>& interleaved, int samples_per_channel,
                                int64_t timestamp_us, std::vector<EncodedChunk>& out,
                                std::string* error) {
  if (!codec_ctx_ || flushed_) {
    SetError(error, "audio encoder not open");
    return false;
  }
  const size_t channels = static_cast<size_t>(config_.channel_count);
  if (interleaved.size() != static_cast<size_t>(samples_per_channel) * channels) {
    SetError(error, "interleaved buffer size does not match sample count");
    return false;
  }
  if (!has_base_timestamp_) {
    has_base_timestamp_ = true;
    base_timestamp_us_ = timestamp_us;
  }

  pending_.insert(pending_.end(), interleaved.begin(), interleaved.end());
  const size_t frame_floats = static_cast<size_t>(frame_size_) * channels;
  while (pending_.size() >= frame_floats) {
    if (!EncodeFrontFrame(frame_size_, out, error)) {
      return false;
    }
  }
  return true;
}

bool FFmpegAudioEncoder::EncodeFrontFrame(int samples, std::vector<EncodedChunk>& out,
                                          std::string* error) {
  const size_t channels = static_cast<size_t>(config_.channel_count);
  int ret = av_frame_make_writable(frame_);
  if (ret < 0) {
    SetError(error, "av_frame_make_writable: " + util::AvErrorString(ret));
    return false;
  }

  // Short final blocks are zero-padded to a full codec frame.
  std::vector<float> block(static_cast<size_t>(frame_size_) * channels, 0.0f);
  const size_t take = static_cast<size_t>(samples) * channels;
  std::copy(pending_.begin(), pending_.begin() + static_cast<std::ptrdiff_t>(take), block.begin());
  pending_.erase(pending_.begin(), pending_.begin() + static_cast<std::ptrdiff_t>(take));

  const uint8_t* in[1] = {reinterpret_cast<const uint8_t*>(block.data())};
  const int converted = swr_convert(swr_ctx_, frame_->data, frame_size_, in, frame_size_);
  if (converted < 0) {
    SetError(error, "swr_convert: " + util::AvErrorString(converted));
    return false;
  }
  frame_->nb_samples = frame_size_;
  frame_->pts = samples_sent_;
  samples_sent_ += frame_size_;

  ret = avcodec_send_frame(codec_ctx_, frame_);
  if (ret < 0) {
    SetError(error, "avcodec_send_frame: " + util::AvErrorString(ret));
    return false;
  }
  return ReceivePackets(out, error);
}

bool FFmpegAudioEncoder::Flush(std::vector<EncodedChunk>& out, std::string* error) {
  if (!codec_ctx_) {
    SetError(error, "audio encoder not open");
    return false;
  }
  if (flushed_) {
    return true;
  }
  if (!pending_.empty()) {
    const int remaining = static_cast<int>(pending_.size() / static_cast<size_t>(config_.channel_count));
    if (!EncodeFrontFrame(remaining, out, error)) {
      return false;
    }
  }
  flushed_ = true;
  int ret = avcodec_send_frame(codec_ctx_, nullptr);
  if (ret < 0 && ret != AVERROR_EOF) {
    SetError(error, "flush send: " + util::AvErrorString(ret));
    return false;
  }
  return ReceivePackets(out, error);
}

bool FFmpegAudioEncoder::ReceivePackets(std::vector<EncodedChunk>& out, std::string* error) {
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
    chunk.type = ChunkType::kKey;  // every AAC frame is a sync sample
    chunk.timestamp_us =
        base_timestamp_us_ + av_rescale_q(packet_->pts, codec_ctx_->time_base, kMicrosTimeBase);
    const int64_t duration = packet_->duration > 0 ? packet_->duration : frame_size_;
    chunk.duration_us = av_rescale_q(duration, codec_ctx_->time_base, kMicrosTimeBase);
    chunk.payload.assign(packet_->data, packet_->data + packet_->size);
    out.push_back(std::move(chunk));
    av_packet_unref(packet_);
  }
}

std::vector<uint8_t> FFmpegAudioEncoder::CodecDescription() const {
  if (!codec_ctx_ || !codec_ctx_->extradata || codec_ctx_->extradata_size <= 0) {
    return {};
  }
  return std::vector<uint8_t>(codec_ctx_->extradata,
                              codec_ctx_->extradata + codec_ctx_->extradata_size);
}

void FFmpegAudioEncoder::Close() {
  if (swr_ctx_) {
    swr_free(&swr_ctx_);
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
  pending_.clear();
  samples_sent_ = 0;
  has_base_timestamp_ = false;
  base_timestamp_us_ = 0;
  flushed_ = false;
}

}  // namespace reelforge::encode
