// Repository: Reelforge
// Component: Wait Strategy Interface
// Purpose: Decouple sleeping from retry-delay math in the recovery policy.
//          Production: RealtimeWaitStrategy sleeps for the delay.
//          Tests: DeterministicWaitStrategy (advances virtual time, no sleep).
// Copyright (c) 2025 Reelforge

#ifndef REELFORGE_TIME_IWAIT_STRATEGY_HPP_
#define REELFORGE_TIME_IWAIT_STRATEGY_HPP_

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace reelforge::time {

// One-shot wake-up shared between a waiting job thread and whoever cancels
// it. Once triggered, every current and later wait through it ends early.
class WaitInterrupt {
 public:
  void Trigger() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      triggered_ = true;
    }
    cv_.notify_all();
  }

  bool Triggered() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return triggered_;
  }

  // Blocks up to delay. True when the delay elapsed without a trigger.
  bool SleepFor(std::chrono::milliseconds delay) {
    std::unique_lock<std::mutex> lock(mutex_);
    return !cv_.wait_for(lock, delay, [this] { return triggered_; });
  }

 private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  bool triggered_ = false;
};

class IWaitStrategy {
 public:
  // Returns false when interrupt (may be null) fired before the delay
  // elapsed.
  virtual bool WaitFor(std::chrono::milliseconds delay, WaitInterrupt* interrupt) = 0;
  virtual ~IWaitStrategy() = default;
};

class RealtimeWaitStrategy : public IWaitStrategy {
 public:
  bool WaitFor(std::chrono::milliseconds delay, WaitInterrupt* interrupt) override {
    if (!interrupt) {
      std::this_thread::sleep_for(delay);
      return true;
    }
    return interrupt->SleepFor(delay);
  }
};

}  // namespace reelforge::time

#endif  // REELFORGE_TIME_IWAIT_STRATEGY_HPP_
