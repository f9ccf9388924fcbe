// Repository: Reelforge
// Component: MP4 Muxer Contract Tests
// Purpose: Track validation, containers with empty and populated audio
//          tracks written in memory and read back, and the output summary.
// Copyright (c) 2025 Reelforge

#include <gtest/gtest.h>

#include <algorithm>
#include <cstdio>
#include <cstring>
#include <string>
#include <vector>

#include "reelforge/encode/EncodedChunk.hpp"
#include "reelforge/media/RationalFps.hpp"
#include "reelforge/mux/Mp4Muxer.hpp"

extern "C" {
#include <libavformat/avformat.h>
#include <libavformat/avio.h>
#include <libavutil/mem.h>
}

namespace reelforge::mux {
namespace {

// avcC record: version 1, Baseline level 3.0, one SPS and one PPS.
const std::vector<uint8_t> kAvcC = {0x01, 0x42, 0xE0, 0x1E, 0xFF, 0xE1, 0x00, 0x04, 0x67, 0x42,
                                    0xE0, 0x1E, 0x01, 0x00, 0x04, 0x68, 0xCE, 0x3C, 0x80};
// AudioSpecificConfig: AAC-LC, 44.1 kHz, stereo.
const std::vector<uint8_t> kAsc = {0x12, 0x10};

std::vector<encode::EncodedChunk> VideoChunks(int count) {
  std::vector<encode::EncodedChunk> chunks;
  for (int i = 0; i < count; ++i) {
    encode::EncodedChunk c;
    c.type = (i % 30 == 0) ? encode::ChunkType::kKey : encode::ChunkType::kDelta;
    c.timestamp_us = media::FPS_30.FrameTimestampUs(i);
    c.duration_us = media::FPS_30.FrameDurationUs();
    // Length-prefixed NAL unit (AVCC framing).
    c.payload = {0x00, 0x00, 0x00, 0x04, static_cast<uint8_t>(i == 0 ? 0x65 : 0x41), 0x88, 0x84,
                 static_cast<uint8_t>(i)};
    chunks.push_back(c);
  }
  return chunks;
}

std::vector<encode::EncodedChunk> AudioChunks(int count) {
  std::vector<encode::EncodedChunk> chunks;
  for (int i = 0; i < count; ++i) {
    encode::EncodedChunk c;
    c.type = encode::ChunkType::kKey;
    c.timestamp_us = (static_cast<int64_t>(i) * 1024 * 1000000) / 44100;
    c.duration_us = 0;
    c.payload = {0x21, 0x10, 0x04, 0x60, 0x8C, 0x1C};
    chunks.push_back(c);
  }
  return chunks;
}

struct ReadCursor {
  const std::vector<uint8_t>* bytes = nullptr;
  size_t pos = 0;
};

int ReadBuffer(void* opaque, uint8_t* buf, int buf_size) {
  auto* cursor = static_cast<ReadCursor*>(opaque);
  const size_t left = cursor->bytes->size() - cursor->pos;
  if (left == 0) return AVERROR_EOF;
  const size_t n = std::min(left, static_cast<size_t>(buf_size));
  std::memcpy(buf, cursor->bytes->data() + cursor->pos, n);
  cursor->pos += n;
  return static_cast<int>(n);
}

int64_t SeekBuffer(void* opaque, int64_t offset, int whence) {
  auto* cursor = static_cast<ReadCursor*>(opaque);
  const int64_t size = static_cast<int64_t>(cursor->bytes->size());
  int64_t next = 0;
  switch (whence & ~AVSEEK_FORCE) {
    case AVSEEK_SIZE: return size;
    case SEEK_SET: next = offset; break;
    case SEEK_CUR: next = static_cast<int64_t>(cursor->pos) + offset; break;
    case SEEK_END: next = size + offset; break;
    default: return AVERROR(EINVAL);
  }
  if (next < 0 || next > size) return AVERROR(EINVAL);
  cursor->pos = static_cast<size_t>(next);
  return next;
}

// What libavformat sees when it demuxes a written buffer.
struct DemuxedLayout {
  bool opened = false;
  int video_streams = 0;
  int audio_streams = 0;
  int audio_sample_rate = 0;
};

DemuxedLayout Demux(const std::vector<uint8_t>& bytes) {
  DemuxedLayout layout;
  ReadCursor cursor;
  cursor.bytes = &bytes;
  constexpr int kBufferSize = 4096;
  auto* buffer = static_cast<uint8_t*>(av_malloc(kBufferSize));
  if (!buffer) return layout;
  AVIOContext* avio =
      avio_alloc_context(buffer, kBufferSize, 0, &cursor, &ReadBuffer, nullptr, &SeekBuffer);
  if (!avio) {
    av_free(buffer);
    return layout;
  }
  AVFormatContext* ctx = avformat_alloc_context();
  if (ctx) {
    ctx->pb = avio;
    if (avformat_open_input(&ctx, nullptr, nullptr, nullptr) == 0) {
      layout.opened = true;
      for (unsigned i = 0; i < ctx->nb_streams; ++i) {
        const AVCodecParameters* par = ctx->streams[i]->codecpar;
        if (par->codec_type == AVMEDIA_TYPE_VIDEO) ++layout.video_streams;
        if (par->codec_type == AVMEDIA_TYPE_AUDIO) {
          ++layout.audio_streams;
          layout.audio_sample_rate = par->sample_rate;
        }
      }
      avformat_close_input(&ctx);
    }
  }
  av_freep(&avio->buffer);
  avio_context_free(&avio);
  return layout;
}

MuxConfig SmallMuxConfig() {
  MuxConfig config;
  config.video = codec::MakeVideoConfig(codec::H264Profile::kBaseline, {540, 960}, media::FPS_30,
                                        1000000);
  config.video_codec_description = kAvcC;
  config.audio_codec_description = kAsc;
  return config;
}

TEST(Mp4MuxerContract, RejectsEmptyVideo) {
  Mp4Muxer muxer;
  MuxedOutput out;
  std::string err;
  EXPECT_FALSE(muxer.Mux({}, AudioChunks(3), SmallMuxConfig(), out, &err));
  EXPECT_EQ(err, "no video chunks to mux");
  EXPECT_TRUE(out.buffer.empty());
}

TEST(Mp4MuxerContract, RejectsTimestampRegression) {
  Mp4Muxer muxer;
  MuxedOutput out;
  std::string err;
  auto video = VideoChunks(5);
  video[3].timestamp_us = video[2].timestamp_us;
  EXPECT_FALSE(muxer.Mux(video, {}, SmallMuxConfig(), out, &err));
  EXPECT_NE(err.find("video timestamp regression at chunk 3"), std::string::npos);

  auto audio = AudioChunks(4);
  audio[2].timestamp_us = 0;
  EXPECT_FALSE(muxer.Mux(VideoChunks(5), audio, SmallMuxConfig(), out, &err));
  EXPECT_NE(err.find("audio timestamp regression"), std::string::npos);
}

TEST(Mp4MuxerContract, ValidateTrackOrderAcceptsEmptyAndSingle) {
  std::string err;
  EXPECT_TRUE(ValidateTrackOrder({}, "audio", &err));
  EXPECT_TRUE(ValidateTrackOrder(VideoChunks(1), "video", &err));
  EXPECT_TRUE(ValidateTrackOrder(VideoChunks(60), "video", &err));
}

TEST(Mp4MuxerContract, DeclaresEmptyAudioTrack) {
  if (!Mp4Muxer::IsAvailable()) {
    GTEST_SKIP() << "libavformat built without the mp4 muxer";
  }
  Mp4Muxer muxer;
  MuxedOutput out;
  std::string err;
  MuxConfig config = SmallMuxConfig();
  config.duration_seconds = 1.0;
  ASSERT_TRUE(muxer.Mux(VideoChunks(30), {}, config, out, &err)) << err;

  ASSERT_GT(out.buffer.size(), 8u);
  EXPECT_EQ(out.size, out.buffer.size());
  EXPECT_EQ(std::memcmp(out.buffer.data() + 4, "ftyp", 4), 0);
  EXPECT_EQ(out.video_tracks, 1);
  EXPECT_EQ(out.audio_tracks, 1);
  EXPECT_EQ(out.video_samples, 30);
  EXPECT_EQ(out.audio_samples, 0);
  EXPECT_DOUBLE_EQ(out.duration_seconds, 1.0);

  const DemuxedLayout layout = Demux(out.buffer);
  ASSERT_TRUE(layout.opened);
  EXPECT_EQ(layout.video_streams, 1);
  EXPECT_EQ(layout.audio_streams, 1);
  EXPECT_EQ(layout.audio_sample_rate, 44100);
}

TEST(Mp4MuxerContract, EmptyAudioTrackFallsBackToDefaultLayout) {
  if (!Mp4Muxer::IsAvailable()) {
    GTEST_SKIP() << "libavformat built without the mp4 muxer";
  }
  Mp4Muxer muxer;
  MuxedOutput out;
  std::string err;
  MuxConfig config = SmallMuxConfig();
  config.audio.sample_rate = 0;
  config.audio_codec_description.clear();
  ASSERT_TRUE(muxer.Mux(VideoChunks(10), {}, config, out, &err)) << err;
  EXPECT_EQ(out.audio_tracks, 1);
  EXPECT_EQ(out.audio_samples, 0);

  const DemuxedLayout layout = Demux(out.buffer);
  ASSERT_TRUE(layout.opened);
  EXPECT_EQ(layout.audio_streams, 1);
  EXPECT_EQ(layout.audio_sample_rate, 44100);
}

TEST(Mp4MuxerContract, AudioChunksNeedASampleRate) {
  Mp4Muxer muxer;
  MuxedOutput out;
  std::string err;
  MuxConfig config = SmallMuxConfig();
  config.audio.sample_rate = 0;
  EXPECT_FALSE(muxer.Mux(VideoChunks(10), AudioChunks(3), config, out, &err));
  EXPECT_EQ(err, "invalid audio sample rate for muxing");
}

TEST(Mp4MuxerContract, WritesAudioAndVideoTracks) {
  if (!Mp4Muxer::IsAvailable()) {
    GTEST_SKIP() << "libavformat built without the mp4 muxer";
  }
  Mp4Muxer muxer;
  MuxedOutput out;
  std::string err;
  ASSERT_TRUE(muxer.Mux(VideoChunks(30), AudioChunks(43), SmallMuxConfig(), out, &err)) << err;
  EXPECT_EQ(out.video_tracks, 1);
  EXPECT_EQ(out.audio_tracks, 1);
  EXPECT_EQ(out.audio_samples, 43);
  // No configured duration: derived from the video track span.
  EXPECT_NEAR(out.duration_seconds, 1.0, 0.001);

  const DemuxedLayout layout = Demux(out.buffer);
  ASSERT_TRUE(layout.opened);
  EXPECT_EQ(layout.video_streams, 1);
  EXPECT_EQ(layout.audio_streams, 1);
}

TEST(Mp4MuxerContract, SummarizesOutput) {
  MuxedOutput out;
  out.size = 3 * 1024 * 1024;
  out.duration_seconds = 75.4;
  MuxConfig config = SmallMuxConfig();
  const OutputSummary summary = SummarizeOutput(out, config);
  EXPECT_DOUBLE_EQ(summary.size_mb, 3.0);
  EXPECT_EQ(summary.duration_label, "1:15");
  EXPECT_NEAR(summary.bitrate_mbps, (3.0 * 1024 * 1024 * 8) / 75.4 / 1e6, 1e-9);
  EXPECT_EQ(summary.resolution, "540x960");

  out.duration_seconds = 0;
  EXPECT_DOUBLE_EQ(SummarizeOutput(out, config).bitrate_mbps, 0.0);
  EXPECT_EQ(SummarizeOutput(out, config).duration_label, "0:00");
}

}  // namespace
}  // namespace reelforge::mux
