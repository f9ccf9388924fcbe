// Repository: Reelforge
// Component: FFmpeg Error Formatting
// Purpose: Render libav* error codes as text for log lines and error records.
// Copyright (c) 2025 Reelforge

#include "reelforge/util/AvError.hpp"

extern "C" {
#include <libavutil/error.h>
}

namespace reelforge::util {

std::string AvErrorString(int ret) {
  char errbuf[AV_ERROR_MAX_STRING_SIZE];
  if (av_strerror(ret, errbuf, AV_ERROR_MAX_STRING_SIZE) < 0) {
    return "error " + std::to_string(ret);
  }
  return std::string(errbuf);
}

}  // namespace reelforge::util
