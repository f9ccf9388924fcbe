// Repository: Reelforge
// Component: FFmpeg Error Formatting
// Purpose: Render libav* error codes as text for log lines and error records.
// Copyright (c) 2025 Reelforge

#ifndef REELFORGE_UTIL_AV_ERROR_HPP_
#define REELFORGE_UTIL_AV_ERROR_HPP_

#include <string>

namespace reelforge::util {

// Returns av_strerror() text for ret, or "error <ret>" when FFmpeg has no
// description for the code.
std::string AvErrorString(int ret);

}  // namespace reelforge::util

#endif  // REELFORGE_UTIL_AV_ERROR_HPP_
