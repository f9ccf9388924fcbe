// Repository: Reelforge
// Component: FFmpeg Video Encoder
// Purpose: IVideoEncoderBackend over libavcodec H.264 (libx264 preferred).
//          RGBA input is converted to YUV420P with libswscale.
// Copyright (c) 2025 Reelforge

#ifndef REELFORGE_ENCODE_FFMPEG_VIDEO_ENCODER_HPP_
#define REELFORGE_ENCODE_FFMPEG_VIDEO_ENCODER_HPP_

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "reelforge/encode/IEncoderBackend.hpp"

struct AVCodecContext;
struct AVFrame;
struct AVPacket;
struct SwsContext;

namespace reelforge::encode {

// Lifecycle: Open() -> Encode()* -> Flush() -> Close() (or destructor).
// B-frames are disabled so packets leave the encoder in input order.
class FFmpegVideoEncoder : public IVideoEncoderBackend {
 public:
  FFmpegVideoEncoder();
  ~FFmpegVideoEncoder() override;

  FFmpegVideoEncoder(const FFmpegVideoEncoder&) = delete;
  FFmpegVideoEncoder& operator=(const FFmpegVideoEncoder&) = delete;

  bool Open(const codec::EncoderConfig& config, std::string* error) override;
  bool Encode(const buffer::Frame& frame, int64_t timestamp_us,
              std::vector<EncodedChunk>& out, std::string* error) override;
  bool Flush(std::vector<EncodedChunk>& out, std::string* error) override;
  std::vector<uint8_t> CodecDescription() const override;
  void Close() override;

 private:
  bool ReceivePackets(std::vector<EncodedChunk>& out, std::string* error);

  codec::EncoderConfig config_;
  AVCodecContext* codec_ctx_;
  AVFrame* frame_;
  AVPacket* packet_;
  SwsContext* sws_ctx_;
  bool flushed_;
  // Encoder pts -> submitted timestamp, so chunk timestamps are exactly the
  // frame-indexed values the pipeline supplied.
  std::map<int64_t, int64_t> pts_to_timestamp_us_;
};

}  // namespace reelforge::encode

#endif  // REELFORGE_ENCODE_FFMPEG_VIDEO_ENCODER_HPP_
