// Repository: Reelforge
// Component: FFmpeg Audio Encoder
// Purpose: IAudioEncoderBackend over libavcodec AAC. Interleaved float input
//          is buffered into codec-sized frames and converted with libswresample.
// Copyright (c) 2025 Reelforge

#ifndef REELFORGE_ENCODE_FFMPEG_AUDIO_ENCODER_HPP_
#define REELFORGE_ENCODE_FFMPEG_AUDIO_ENCODER_HPP_

#include <cstdint>
#include <string>
#include <vector>

#include "reelforge/encode/IEncoderBackend.hpp"

struct AVCodecContext;
struct AVFrame;
struct AVPacket;
struct SwrContext;

namespace reelforge::encode {

class FFmpegAudioEncoder : public IAudioEncoderBackend {
 public:
  FFmpegAudioEncoder();
  ~FFmpegAudioEncoder() override;

  FFmpegAudioEncoder(const FFmpegAudioEncoder&) = delete;
  FFmpegAudioEncoder& operator=(const FFmpegAudioEncoder&) = delete;

  bool Open(const codec::AudioConfig& config, std::string* error) override;
  bool Encode(const std::vector<float>& interleaved, int samples_per_channel,
              int64_t timestamp_us, std::vector<EncodedChunk>& out,
              std::string* error) override;
  bool Flush(std::vector<EncodedChunk>& out, std::string* error) override;
  std::vector<uint8_t> CodecDescription() const override;
  void Close() override;

 private:
  // Encodes one frame_size_ block from the front of pending_.
  bool EncodeFrontFrame(int samples, std::vector<EncodedChunk>& out, std::string* error);
  bool ReceivePackets(std::vector<EncodedChunk>& out, std::string* error);

  codec::AudioConfig config_;
  AVCodecContext* codec_ctx_;
  AVFrame* frame_;
  AVPacket* packet_;
  SwrContext* swr_ctx_;
  int frame_size_;
  bool flushed_;

  // Interleaved samples not yet handed to the encoder.
  std::vector<float> pending_;
  int64_t samples_sent_;
  bool has_base_timestamp_;
  int64_t base_timestamp_us_;
};

}  // namespace reelforge::encode

#endif  // REELFORGE_ENCODE_FFMPEG_AUDIO_ENCODER_HPP_
