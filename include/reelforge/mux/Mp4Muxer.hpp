// Repository: Reelforge
// Component: MP4 Muxer
// Purpose: Writes one H.264 track (90 kHz) and one AAC track (timescale =
//          sample rate, possibly empty) into an in-memory MP4 via libavformat.
// Copyright (c) 2025 Reelforge

#ifndef REELFORGE_MUX_MP4_MUXER_HPP_
#define REELFORGE_MUX_MP4_MUXER_HPP_

#include <cstdint>
#include <string>
#include <vector>

#include "reelforge/mux/IMuxer.hpp"

namespace reelforge::mux {

// Validates that timestamps strictly increase. Returns false with a message
// naming the track and offending index otherwise.
bool ValidateTrackOrder(const std::vector<encode::EncodedChunk>& chunks,
                        const std::string& track_name, std::string* error);

// Mp4Muxer is stateless between calls; each Mux() builds a fresh
// AVFormatContext writing through custom AVIO into a growable byte buffer.
// The AVIO context is seekable so the muxer can patch mdat/moov sizes.
class Mp4Muxer : public IMuxer {
 public:
  Mp4Muxer() = default;
  ~Mp4Muxer() override = default;

  Mp4Muxer(const Mp4Muxer&) = delete;
  Mp4Muxer& operator=(const Mp4Muxer&) = delete;

  bool Mux(const std::vector<encode::EncodedChunk>& video,
           const std::vector<encode::EncodedChunk>& audio,
           const MuxConfig& config,
           MuxedOutput& output,
           std::string* error) override;

  // True when libavformat has an "mp4" output format registered.
  static bool IsAvailable();
};

}  // namespace reelforge::mux

#endif  // REELFORGE_MUX_MP4_MUXER_HPP_
