// Repository: Reelforge
// Component: System Time Source
// Purpose: Production ITimeSource backed by std::chrono::system_clock.
// Copyright (c) 2025 Reelforge

#ifndef REELFORGE_TIME_SYSTEM_TIME_SOURCE_HPP_
#define REELFORGE_TIME_SYSTEM_TIME_SOURCE_HPP_

#include <chrono>

#include "reelforge/time/ITimeSource.hpp"

namespace reelforge::time {

class SystemTimeSource : public ITimeSource {
 public:
  int64_t NowUtcMs() const override {
    using namespace std::chrono;
    return duration_cast<milliseconds>(
        system_clock::now().time_since_epoch()).count();
  }
};

}  // namespace reelforge::time

#endif  // REELFORGE_TIME_SYSTEM_TIME_SOURCE_HPP_
