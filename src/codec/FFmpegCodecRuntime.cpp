// Repository: Reelforge
// Component: FFmpeg Codec Runtime
// Purpose: ICodecRuntime backed by libavcodec. A config counts as supported
//          only if an encoder context opens with it.
// Copyright (c) 2025 Reelforge

#include "reelforge/codec/FFmpegCodecRuntime.hpp"

#include <string>

#include "reelforge/util/AvError.hpp"
#include "reelforge/util/Logger.hpp"

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavutil/channel_layout.h>
#include <libavutil/dict.h>
#include <libavutil/log.h>
}

namespace reelforge::codec {

FFmpegCodecRuntime::FFmpegCodecRuntime() {
  av_log_set_level(AV_LOG_ERROR);
}

const AVCodec* FFmpegCodecRuntime::FindVideoEncoder() {
  const AVCodec* codec = avcodec_find_encoder_by_name("libx264");
  if (!codec) {
    codec = avcodec_find_encoder(AV_CODEC_ID_H264);
  }
  return codec;
}

const AVCodec* FFmpegCodecRuntime::FindAudioEncoder() {
  const AVCodec* codec = avcodec_find_encoder_by_name("aac");
  if (!codec) {
    codec = avcodec_find_encoder_by_name("libfdk_aac");
  }
  if (!codec) {
    codec = avcodec_find_encoder(AV_CODEC_ID_AAC);
  }
  return codec;
}

bool FFmpegCodecRuntime::HasVideoEncoder() const {
  return FindVideoEncoder() != nullptr;
}

bool FFmpegCodecRuntime::HasAudioEncoder() const {
  return FindAudioEncoder() != nullptr;
}

std::string FFmpegCodecRuntime::Name() const {
  const AVCodec* video = FindVideoEncoder();
  const AVCodec* audio = FindAudioEncoder();
  return std::string("ffmpeg(video=") + (video ? video->name : "none") +
         ", audio=" + (audio ? audio->name : "none") + ")";
}

void FFmpegCodecRuntime::ConfigureVideoContext(AVCodecContext* ctx, const AVCodec* codec,
                                               const EncoderConfig& config,
                                               AVDictionary** opts) {
  ctx->codec_id = AV_CODEC_ID_H264;
  ctx->codec_type = AVMEDIA_TYPE_VIDEO;
  ctx->pix_fmt = AV_PIX_FMT_YUV420P;
  ctx->width = config.width;
  ctx->height = config.height;
  ctx->bit_rate = config.bitrate_bps;
  ctx->rc_max_rate = config.bitrate_bps;
  ctx->rc_buffer_size = static_cast<int>(config.bitrate_bps);  // 1 s VBV
  ctx->gop_size = config.gop_size;
  ctx->max_b_frames = 0;  // output order == input order
  ctx->time_base.num = static_cast<int>(config.fps.den);
  ctx->time_base.den = static_cast<int>(config.fps.num);
  ctx->framerate.num = static_cast<int>(config.fps.num);
  ctx->framerate.den = static_cast<int>(config.fps.den);
  // Parameter sets go to extradata; the MP4 muxer needs them for avcC.
  ctx->flags |= AV_CODEC_FLAG_GLOBAL_HEADER;

  av_dict_set(opts, "profile", ProfileName(config.profile), 0);
  if (std::string(codec->name) == "libx264") {
    av_dict_set(opts, "preset", "veryfast", 0);
    av_dict_set(opts, "x264-params", "bframes=0:nal-hrd=vbr", 0);
  }
}

bool FFmpegCodecRuntime::ConfigureAudioContext(AVCodecContext* ctx, const AudioConfig& config) {
  ctx->codec_id = AV_CODEC_ID_AAC;
  ctx->codec_type = AVMEDIA_TYPE_AUDIO;
  ctx->sample_fmt = AV_SAMPLE_FMT_FLTP;
  ctx->sample_rate = config.sample_rate;
  ctx->bit_rate = config.bitrate_bps;
  ctx->profile = 1;  // AAC-LC (mp4a.40.2)
  ctx->time_base.num = 1;
  ctx->time_base.den = config.sample_rate;
  ctx->flags |= AV_CODEC_FLAG_GLOBAL_HEADER;
  av_channel_layout_default(&ctx->ch_layout, config.channel_count);
  return ctx->ch_layout.nb_channels == config.channel_count;
}

bool FFmpegCodecRuntime::IsVideoConfigSupported(const EncoderConfig& config) const {
  if (!config.IsValid()) {
    return false;
  }
  const std::string key = config.Describe();
  {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    auto it = video_cache_.find(key);
    if (it != video_cache_.end()) return it->second;
  }

  bool supported = false;
  const AVCodec* codec = FindVideoEncoder();
  if (codec) {
    AVCodecContext* ctx = avcodec_alloc_context3(codec);
    if (ctx) {
      AVDictionary* opts = nullptr;
      ConfigureVideoContext(ctx, codec, config, &opts);
      int ret = avcodec_open2(ctx, codec, &opts);
      av_dict_free(&opts);
      supported = (ret >= 0);
      if (!supported) {
        util::Logger::Debug("[FFmpegCodecRuntime] Video config rejected: " + key +
                            " (" + util::AvErrorString(ret) + ")");
      }
      avcodec_free_context(&ctx);
    }
  }

  std::lock_guard<std::mutex> lock(cache_mutex_);
  video_cache_[key] = supported;
  return supported;
}

bool FFmpegCodecRuntime::IsAudioConfigSupported(const AudioConfig& config) const {
  if (!config.IsValid()) {
    return false;
  }
  const std::string key = config.Describe();
  {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    auto it = audio_cache_.find(key);
    if (it != audio_cache_.end()) return it->second;
  }

  bool supported = false;
  const AVCodec* codec = FindAudioEncoder();
  if (codec) {
    AVCodecContext* ctx = avcodec_alloc_context3(codec);
    if (ctx) {
      if (ConfigureAudioContext(ctx, config)) {
        int ret = avcodec_open2(ctx, codec, nullptr);
        supported = (ret >= 0);
        if (!supported) {
          util::Logger::Debug("[FFmpegCodecRuntime] Audio config rejected: " + key +
                              " (" + util::AvErrorString(ret) + ")");
        }
      }
      avcodec_free_context(&ctx);
    }
  }

  std::lock_guard<std::mutex> lock(cache_mutex_);
  audio_cache_[key] = supported;
  return supported;
}

}  // namespace reelforge::codec
