// Repository: Reelforge
// Component: FFmpeg Frame Source
// Purpose: IFrameSource over libavformat/libavcodec with swscale RGBA
//          conversion and swresample audio extraction.
// Copyright (c) 2025 Reelforge

#ifndef REELFORGE_SOURCE_FFMPEG_FRAME_SOURCE_HPP_
#define REELFORGE_SOURCE_FFMPEG_FRAME_SOURCE_HPP_

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "reelforge/buffer/Frame.hpp"
#include "reelforge/source/IFrameSource.hpp"

// Forward declarations for FFmpeg types (avoids pulling in FFmpeg headers here)
struct AVFormatContext;
struct AVCodecContext;
struct AVFrame;
struct AVPacket;
struct SwsContext;

namespace reelforge::source {

// FFmpegFrameSource decodes the best video stream of a file.
//
// Lifecycle:
// 1. Construct with the input path
// 2. Open()
// 3. CaptureAt() with (mostly) increasing positions; ExtractAudio() once
// 4. Close() or rely on the destructor
//
// Capture picks the first decoded frame whose PTS reaches the requested
// position, within half a source frame. Requests behind the current decode
// position seek to the preceding keyframe and decode forward again.
//
// Not thread-safe.
class FFmpegFrameSource : public IFrameSource {
 public:
  explicit FFmpegFrameSource(std::string input_path);
  ~FFmpegFrameSource() override;

  FFmpegFrameSource(const FFmpegFrameSource&) = delete;
  FFmpegFrameSource& operator=(const FFmpegFrameSource&) = delete;

  bool Open(std::string* error);
  void Close();
  bool IsOpen() const { return format_ctx_ != nullptr; }

  int Width() const override { return width_; }
  int Height() const override { return height_; }
  int64_t DurationUs() const override { return duration_us_; }
  bool HasAudio() const override { return has_audio_; }

  bool CaptureAt(int64_t position_us, buffer::Frame& frame, std::string* error) override;
  bool ExtractAudio(int sample_rate, int channels,
                    std::vector<buffer::AudioBlock>& blocks,
                    std::string* error) override;

  const std::string& input_path() const { return input_path_; }

 private:
  enum class DecodeResult { kFrame, kEof, kError };

  DecodeResult DecodeNextFrame(std::string* error);
  bool SeekTo(int64_t position_us, std::string* error);
  bool ConvertHeldFrame(std::string* error);
  int64_t HeldFramePtsUs() const;

  std::string input_path_;

  AVFormatContext* format_ctx_;
  AVCodecContext* codec_ctx_;
  AVFrame* frame_;
  AVFrame* held_frame_;  // last decoded picture, converted lazily
  AVPacket* packet_;
  SwsContext* sws_ctx_;
  int video_stream_index_;

  int width_;
  int height_;
  int64_t duration_us_;
  int64_t start_time_us_;
  int64_t half_frame_us_;
  bool has_audio_;
  bool demux_eof_;

  // Most recently converted picture; held past end of stream.
  buffer::Frame last_frame_;
  bool has_last_frame_;
  bool held_converted_;
};

// Convenience opener for the service's source factory.
std::unique_ptr<IFrameSource> OpenFFmpegFrameSource(const std::string& input_path,
                                                    std::string* error);

}  // namespace reelforge::source

#endif  // REELFORGE_SOURCE_FFMPEG_FRAME_SOURCE_HPP_
