// Repository: Reelforge
// Component: Encoded Chunk
// Purpose: One encoded access unit (H.264 picture or AAC frame) with
//          microsecond timing, as emitted by encoder sessions.
// Copyright (c) 2025 Reelforge

#ifndef REELFORGE_ENCODE_ENCODED_CHUNK_HPP_
#define REELFORGE_ENCODE_ENCODED_CHUNK_HPP_

#include <cstdint>
#include <vector>

namespace reelforge::encode {

enum class ChunkType {
  kKey,
  kDelta,
};

// timestamp_us is strictly increasing within a track. duration_us == 0 means
// "unset"; the muxer substitutes the nominal frame duration.
struct EncodedChunk {
  ChunkType type = ChunkType::kDelta;
  int64_t timestamp_us = 0;
  int64_t duration_us = 0;
  std::vector<uint8_t> payload;

  bool IsKey() const { return type == ChunkType::kKey; }
};

}  // namespace reelforge::encode

#endif  // REELFORGE_ENCODE_ENCODED_CHUNK_HPP_
