// Repository: Reelforge
// Component: MP4 Muxer
// Purpose: Writes one H.264 track (90 kHz) and one AAC track (timescale =
//          sample rate, possibly empty) into an in-memory MP4 via libavformat.
// Copyright (c) 2025 Reelforge

#include "reelforge/mux/Mp4Muxer.hpp"

#include <cmath>
#include <cstdio>
#include <cstring>
#include <sstream>

#include "reelforge/util/AvError.hpp"
#include "reelforge/util/Logger.hpp"

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavformat/avio.h>
#include <libavutil/channel_layout.h>
#include <libavutil/dict.h>
#include <libavutil/mathematics.h>
#include <libavutil/mem.h>
}

namespace reelforge::mux {

namespace {

constexpr AVRational kMicrosTimeBase = {1, 1000000};
constexpr int kAvioBufferSize = 64 * 1024;

#if LIBAVFORMAT_VERSION_MAJOR >= 62
using AvioWriteBuffer = const uint8_t*;
#else
using AvioWriteBuffer = uint8_t*;
#endif

void SetError(std::string* error, const std::string& message) {
  if (error) *error = message;
}

// Growable in-memory write target with random access for moov/mdat patching.
struct MemoryTarget {
  std::vector<uint8_t> bytes;
  int64_t pos = 0;
};

int WriteThunk(void* opaque, AvioWriteBuffer buf, int buf_size) {
  if (opaque == nullptr || buf_size < 0) return AVERROR(EINVAL);
  auto* target = static_cast<MemoryTarget*>(opaque);
  const size_t end = static_cast<size_t>(target->pos) + static_cast<size_t>(buf_size);
  if (end > target->bytes.size()) {
    target->bytes.resize(end);
  }
  std::memcpy(target->bytes.data() + target->pos, buf, static_cast<size_t>(buf_size));
  target->pos = static_cast<int64_t>(end);
  return buf_size;
}

int64_t SeekThunk(void* opaque, int64_t offset, int whence) {
  if (opaque == nullptr) return AVERROR(EINVAL);
  auto* target = static_cast<MemoryTarget*>(opaque);
  whence &= ~AVSEEK_FORCE;
  int64_t next = 0;
  switch (whence) {
    case AVSEEK_SIZE:
      return static_cast<int64_t>(target->bytes.size());
    case SEEK_SET:
      next = offset;
      break;
    case SEEK_CUR:
      next = target->pos + offset;
      break;
    case SEEK_END:
      next = static_cast<int64_t>(target->bytes.size()) + offset;
      break;
    default:
      return AVERROR(EINVAL);
  }
  if (next < 0) return AVERROR(EINVAL);
  target->pos = next;
  return next;
}

// Owns the output context and its custom AVIO for the duration of one Mux().
struct OutputContext {
  AVFormatContext* format_ctx = nullptr;
  AVIOContext* avio_ctx = nullptr;
  AVPacket* packet = nullptr;

  ~OutputContext() {
    if (packet) {
      av_packet_free(&packet);
    }
    if (format_ctx) {
      avformat_free_context(format_ctx);
      format_ctx = nullptr;
    }
    if (avio_ctx) {
      av_freep(&avio_ctx->buffer);
      avio_context_free(&avio_ctx);
    }
  }
};

bool CopyExtradata(AVCodecParameters* par, const std::vector<uint8_t>& data) {
  if (data.empty()) return true;
  par->extradata = static_cast<uint8_t*>(av_mallocz(data.size() + AV_INPUT_BUFFER_PADDING_SIZE));
  if (!par->extradata) return false;
  std::memcpy(par->extradata, data.data(), data.size());
  par->extradata_size = static_cast<int>(data.size());
  return true;
}

struct TrackWriter {
  AVStream* stream = nullptr;
  const std::vector<encode::EncodedChunk>* chunks = nullptr;
  size_t next = 0;
  int64_t fallback_duration_us = 0;
  int64_t last_dts = 0;
  bool has_last = false;
  const char* name = "";
};

bool WriteChunk(OutputContext& out, TrackWriter& track, std::string* error) {
  const encode::EncodedChunk& chunk = (*track.chunks)[track.next];
  AVPacket* pkt = out.packet;
  int ret = av_new_packet(pkt, static_cast<int>(chunk.payload.size()));
  if (ret < 0) {
    SetError(error, std::string("av_new_packet: ") + util::AvErrorString(ret));
    return false;
  }
  if (!chunk.payload.empty()) {
    std::memcpy(pkt->data, chunk.payload.data(), chunk.payload.size());
  }
  const AVRational tb = track.stream->time_base;
  const int64_t ts = av_rescale_q(chunk.timestamp_us, kMicrosTimeBase, tb);
  if (track.has_last && ts <= track.last_dts) {
    av_packet_unref(pkt);
    SetError(error, std::string(track.name) + " chunk " + std::to_string(track.next) +
                        " collides with its predecessor in track timescale " +
                        std::to_string(tb.den));
    return false;
  }
  const int64_t duration_us = chunk.duration_us > 0 ? chunk.duration_us : track.fallback_duration_us;
  pkt->pts = ts;
  pkt->dts = ts;
  pkt->duration = av_rescale_q(duration_us, kMicrosTimeBase, tb);
  pkt->stream_index = track.stream->index;
  if (chunk.IsKey()) {
    pkt->flags |= AV_PKT_FLAG_KEY;
  }
  track.last_dts = ts;
  track.has_last = true;
  ++track.next;

  // av_interleaved_write_frame takes ownership and unrefs the packet.
  ret = av_interleaved_write_frame(out.format_ctx, pkt);
  if (ret < 0) {
    SetError(error, std::string("write ") + track.name + " packet: " + util::AvErrorString(ret));
    return false;
  }
  return true;
}

// Two-byte AudioSpecificConfig for AAC-LC. Rates outside the MPEG-4 index
// table are not representable here and return an empty record.
std::vector<uint8_t> AacLcAudioSpecificConfig(int sample_rate, int channel_count) {
  static const int kRates[] = {96000, 88200, 64000, 48000, 44100, 32000, 24000,
                               22050, 16000, 12000, 11025, 8000,  7350};
  int index = -1;
  for (int i = 0; i < static_cast<int>(sizeof(kRates) / sizeof(kRates[0])); ++i) {
    if (kRates[i] == sample_rate) {
      index = i;
      break;
    }
  }
  if (index < 0 || channel_count < 1 || channel_count > 7) return {};
  constexpr int kAacLcObjectType = 2;
  return {static_cast<uint8_t>((kAacLcObjectType << 3) | (index >> 1)),
          static_cast<uint8_t>(((index & 1) << 7) | (channel_count << 3))};
}

std::string FormatMinutesSeconds(double seconds) {
  const int64_t total = static_cast<int64_t>(std::floor(seconds < 0 ? 0 : seconds));
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%lld:%02lld", static_cast<long long>(total / 60),
                static_cast<long long>(total % 60));
  return std::string(buf);
}

}  // namespace

bool ValidateTrackOrder(const std::vector<encode::EncodedChunk>& chunks,
                        const std::string& track_name, std::string* error) {
  for (size_t i = 1; i < chunks.size(); ++i) {
    if (chunks[i].timestamp_us <= chunks[i - 1].timestamp_us) {
      SetError(error, track_name + " timestamp regression at chunk " + std::to_string(i) + ": " +
                          std::to_string(chunks[i].timestamp_us) + "us after " +
                          std::to_string(chunks[i - 1].timestamp_us) + "us");
      return false;
    }
  }
  return true;
}

OutputSummary SummarizeOutput(const MuxedOutput& output, const MuxConfig& config) {
  OutputSummary summary;
  summary.size_mb = static_cast<double>(output.size) / (1024.0 * 1024.0);
  summary.duration_label = FormatMinutesSeconds(output.duration_seconds);
  summary.bitrate_mbps = output.duration_seconds > 0
                             ? (static_cast<double>(output.size) * 8.0) /
                                   output.duration_seconds / 1000000.0
                             : 0.0;
  summary.resolution = std::to_string(config.video.width) + "x" + std::to_string(config.video.height);
  return summary;
}

bool Mp4Muxer::IsAvailable() {
  return av_guess_format("mp4", nullptr, nullptr) != nullptr;
}

bool Mp4Muxer::Mux(const std::vector<encode::EncodedChunk>& video,
                   const std::vector<encode::EncodedChunk>& audio,
                   const MuxConfig& config,
                   MuxedOutput& output,
                   std::string* error) {
  if (video.empty()) {
    SetError(error, "no video chunks to mux");
    return false;
  }
  if (!ValidateTrackOrder(video, "video", error) || !ValidateTrackOrder(audio, "audio", error)) {
    return false;
  }
  if (!config.video.fps.IsValid() || config.video.width <= 0 || config.video.height <= 0) {
    SetError(error, "invalid video configuration for muxing");
    return false;
  }
  const bool has_audio = !audio.empty();
  if (has_audio && config.audio.sample_rate <= 0) {
    SetError(error, "invalid audio sample rate for muxing");
    return false;
  }
  // An empty audio track is still declared; it falls back to the default
  // AAC-LC layout when the caller has no usable audio config.
  codec::AudioConfig audio_config = config.audio;
  std::vector<uint8_t> audio_description = config.audio_codec_description;
  if (!has_audio) {
    if (AacLcAudioSpecificConfig(audio_config.sample_rate, audio_config.channel_count).empty()) {
      audio_config = codec::AudioConfig();
      audio_description.clear();
    }
    if (audio_description.empty()) {
      audio_description =
          AacLcAudioSpecificConfig(audio_config.sample_rate, audio_config.channel_count);
    }
  }

  const AVOutputFormat* format = av_guess_format("mp4", nullptr, nullptr);
  if (!format) {
    SetError(error, "MP4 muxer unavailable in this FFmpeg build");
    return false;
  }

  MemoryTarget target;
  OutputContext out;
  int ret = avformat_alloc_output_context2(&out.format_ctx, format, nullptr, nullptr);
  if (ret < 0 || !out.format_ctx) {
    SetError(error, "failed to allocate output context: " + util::AvErrorString(ret));
    return false;
  }

  uint8_t* avio_buffer = static_cast<uint8_t*>(av_malloc(kAvioBufferSize));
  if (!avio_buffer) {
    SetError(error, "failed to allocate AVIO buffer");
    return false;
  }
  out.avio_ctx = avio_alloc_context(avio_buffer, kAvioBufferSize, 1, &target, nullptr,
                                    &WriteThunk, &SeekThunk);
  if (!out.avio_ctx) {
    av_free(avio_buffer);
    SetError(error, "failed to allocate AVIO context");
    return false;
  }
  out.format_ctx->pb = out.avio_ctx;
  out.format_ctx->flags |= AVFMT_FLAG_CUSTOM_IO;

  // Video track.
  TrackWriter video_track;
  video_track.name = "video";
  video_track.chunks = &video;
  video_track.fallback_duration_us = config.video.fps.FrameDurationUs();
  video_track.stream = avformat_new_stream(out.format_ctx, nullptr);
  if (!video_track.stream) {
    SetError(error, "failed to create video stream");
    return false;
  }
  video_track.stream->time_base = AVRational{1, kVideoTimescale};
  video_track.stream->avg_frame_rate =
      AVRational{static_cast<int>(config.video.fps.num), static_cast<int>(config.video.fps.den)};
  AVCodecParameters* vpar = video_track.stream->codecpar;
  vpar->codec_type = AVMEDIA_TYPE_VIDEO;
  vpar->codec_id = AV_CODEC_ID_H264;
  vpar->width = config.video.width;
  vpar->height = config.video.height;
  vpar->format = AV_PIX_FMT_YUV420P;
  vpar->bit_rate = config.video.bitrate_bps;
  if (!CopyExtradata(vpar, config.video_codec_description)) {
    SetError(error, "failed to copy video codec description");
    return false;
  }

  // Audio track, declared even when no chunks are supplied.
  TrackWriter audio_track;
  audio_track.name = "audio";
  audio_track.chunks = &audio;
  audio_track.fallback_duration_us =
      av_rescale_q(kAacSamplesPerFrame, AVRational{1, audio_config.sample_rate}, kMicrosTimeBase);
  audio_track.stream = avformat_new_stream(out.format_ctx, nullptr);
  if (!audio_track.stream) {
    SetError(error, "failed to create audio stream");
    return false;
  }
  audio_track.stream->time_base = AVRational{1, audio_config.sample_rate};
  AVCodecParameters* apar = audio_track.stream->codecpar;
  apar->codec_type = AVMEDIA_TYPE_AUDIO;
  apar->codec_id = AV_CODEC_ID_AAC;
  apar->sample_rate = audio_config.sample_rate;
  apar->frame_size = kAacSamplesPerFrame;
  apar->bit_rate = audio_config.bitrate_bps;
  av_channel_layout_default(&apar->ch_layout, audio_config.channel_count);
  if (!CopyExtradata(apar, audio_description)) {
    SetError(error, "failed to copy audio codec description");
    return false;
  }

  // A progressive moov leaves out traks without samples, so a file with an
  // empty audio track is written fragmented with the moov up front.
  AVDictionary* header_options = nullptr;
  if (!has_audio) {
    av_dict_set(&header_options, "movflags", "empty_moov+frag_keyframe+default_base_moof", 0);
  }

  ret = avformat_write_header(out.format_ctx, &header_options);
  av_dict_free(&header_options);
  if (ret < 0) {
    SetError(error, "failed to write MP4 header: " + util::AvErrorString(ret));
    return false;
  }
  // The muxer may adjust stream time bases in write_header; TrackWriter reads
  // stream->time_base per packet so rescaling follows whatever it chose.

  out.packet = av_packet_alloc();
  if (!out.packet) {
    SetError(error, "failed to allocate packet");
    return false;
  }

  // Merge both tracks by timestamp; video first on ties.
  while (video_track.next < video.size() || audio_track.next < audio.size()) {
    bool take_video = video_track.next < video.size();
    if (take_video && audio_track.next < audio.size()) {
      take_video = video[video_track.next].timestamp_us <= audio[audio_track.next].timestamp_us;
    }
    if (!WriteChunk(out, take_video ? video_track : audio_track, error)) {
      return false;
    }
  }

  ret = av_write_trailer(out.format_ctx);
  if (ret < 0) {
    SetError(error, "failed to write MP4 trailer: " + util::AvErrorString(ret));
    return false;
  }
  avio_flush(out.avio_ctx);

  output.buffer = std::move(target.bytes);
  output.size = output.buffer.size();
  output.video_tracks = 1;
  output.audio_tracks = 1;
  output.video_samples = static_cast<int64_t>(video.size());
  output.audio_samples = static_cast<int64_t>(audio.size());
  if (config.duration_seconds > 0) {
    output.duration_seconds = config.duration_seconds;
  } else {
    const auto& last = video.back();
    const int64_t last_duration = last.duration_us > 0 ? last.duration_us : video_track.fallback_duration_us;
    output.duration_seconds =
        static_cast<double>(last.timestamp_us + last_duration - video.front().timestamp_us) / 1e6;
  }

  std::ostringstream oss;
  oss << "[Mp4Muxer] Wrote " << output.size << " bytes: video_samples=" << output.video_samples
      << " audio_samples=" << output.audio_samples << " duration=" << output.duration_seconds << "s";
  util::Logger::Info(oss.str());
  return true;
}

}  // namespace reelforge::mux
