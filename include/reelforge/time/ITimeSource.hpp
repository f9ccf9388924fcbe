// Repository: Reelforge
// Component: Time Source Interface
// Purpose: Wall-clock seam for job bookkeeping, rate windows and metrics.
// Copyright (c) 2025 Reelforge

#ifndef REELFORGE_TIME_ITIME_SOURCE_HPP_
#define REELFORGE_TIME_ITIME_SOURCE_HPP_

#include <cstdint>

namespace reelforge::time {

class ITimeSource {
 public:
  virtual ~ITimeSource() = default;
  virtual int64_t NowUtcMs() const = 0;
};

}  // namespace reelforge::time

#endif  // REELFORGE_TIME_ITIME_SOURCE_HPP_
