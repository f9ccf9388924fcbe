// Repository: Reelforge
// Component: Frame Fingerprint
// Purpose: CRC32 fingerprint of composited RGBA output for determinism checks
//          and debug logs.
// Copyright (c) 2025 Reelforge

#ifndef REELFORGE_BUFFER_FRAME_FINGERPRINT_HPP_
#define REELFORGE_BUFFER_FRAME_FINGERPRINT_HPP_

#include <cstdint>
#include <cstdio>
#include <string>

#include <zlib.h>

#include "reelforge/buffer/Frame.hpp"

namespace reelforge::buffer {

// CRC32 over the full RGBA payload. Returns 0 for an empty frame.
inline uint32_t CRC32Frame(const Frame& frame) {
  if (frame.data.empty()) return 0;
  uLong crc = crc32(0L, Z_NULL, 0);
  const uint8_t* p = frame.data.data();
  size_t remaining = frame.data.size();
  // crc32() takes a uInt length; feed in slices for very large frames.
  constexpr size_t kSlice = 1u << 30;
  while (remaining > 0) {
    const size_t n = remaining < kSlice ? remaining : kSlice;
    crc = crc32(crc, p, static_cast<uInt>(n));
    p += n;
    remaining -= n;
  }
  return static_cast<uint32_t>(crc);
}

inline std::string FormatFingerprint(uint32_t crc) {
  char buf[9];
  std::snprintf(buf, sizeof(buf), "%08x", crc);
  return std::string(buf);
}

}  // namespace reelforge::buffer

#endif  // REELFORGE_BUFFER_FRAME_FINGERPRINT_HPP_
