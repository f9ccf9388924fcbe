// Repository: Reelforge
// Component: FFmpeg Codec Runtime
// Purpose: ICodecRuntime backed by libavcodec. A config counts as supported
//          only if an encoder context opens with it.
// Copyright (c) 2025 Reelforge

#ifndef REELFORGE_CODEC_FFMPEG_CODEC_RUNTIME_HPP_
#define REELFORGE_CODEC_FFMPEG_CODEC_RUNTIME_HPP_

#include <map>
#include <mutex>
#include <string>

#include "reelforge/codec/ICodecRuntime.hpp"

struct AVCodec;
struct AVCodecContext;
struct AVDictionary;

namespace reelforge::codec {

class FFmpegCodecRuntime : public ICodecRuntime {
 public:
  FFmpegCodecRuntime();
  ~FFmpegCodecRuntime() override = default;

  FFmpegCodecRuntime(const FFmpegCodecRuntime&) = delete;
  FFmpegCodecRuntime& operator=(const FFmpegCodecRuntime&) = delete;

  bool HasVideoEncoder() const override;
  bool HasAudioEncoder() const override;
  bool IsVideoConfigSupported(const EncoderConfig& config) const override;
  bool IsAudioConfigSupported(const AudioConfig& config) const override;
  std::string Name() const override;

  // libx264 preferred; any registered H.264 encoder otherwise.
  static const AVCodec* FindVideoEncoder();
  // Native "aac" preferred, then libfdk_aac, then any AAC encoder.
  static const AVCodec* FindAudioEncoder();

  // Apply config to a freshly allocated context and fill encoder options.
  // The caller owns *opts and must av_dict_free() it.
  static void ConfigureVideoContext(AVCodecContext* ctx, const AVCodec* codec,
                                    const EncoderConfig& config, AVDictionary** opts);
  static bool ConfigureAudioContext(AVCodecContext* ctx, const AudioConfig& config);

 private:
  mutable std::mutex cache_mutex_;
  mutable std::map<std::string, bool> video_cache_;
  mutable std::map<std::string, bool> audio_cache_;
};

}  // namespace reelforge::codec

#endif  // REELFORGE_CODEC_FFMPEG_CODEC_RUNTIME_HPP_
