// Repository: Reelforge
// Component: Error Recovery Policy
// Purpose: Creates classified processing errors, decides whether a failed
//          job may be re-entered, and keeps a bounded error log.
// Copyright (c) 2025 Reelforge

#ifndef REELFORGE_RECOVERY_ERROR_POLICY_HPP_
#define REELFORGE_RECOVERY_ERROR_POLICY_HPP_

#include <cstddef>
#include <deque>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "reelforge/recovery/ErrorTypes.hpp"
#include "reelforge/time/ITimeSource.hpp"
#include "reelforge/time/IWaitStrategy.hpp"

namespace reelforge::recovery {

inline constexpr size_t kMaxErrorLogSize = 100;
inline constexpr size_t kRecentErrorCount = 10;

struct ErrorStats {
  size_t total_errors = 0;
  size_t recoverable_errors = 0;
  size_t unrecoverable_errors = 0;
  std::map<ErrorKind, size_t> errors_by_kind;
  std::vector<ProcessingError> recent_errors;  // oldest first
};

// ErrorPolicy is shared by every job of a service; all methods are
// thread-safe. HandleError blocks the calling job thread for the strategy
// delay through the injected wait strategy.
class ErrorPolicy {
 public:
  ErrorPolicy(const time::ITimeSource& clock, time::IWaitStrategy& waiter);

  ErrorPolicy(const ErrorPolicy&) = delete;
  ErrorPolicy& operator=(const ErrorPolicy&) = delete;

  // Attaches the kind's strategy and logs the record. When the strategy
  // carries its own retry bound the smaller of the two is kept.
  ProcessingError CreateError(ErrorKind kind, const std::string& message,
                              const std::string& details = std::string(),
                              bool recoverable = true, int max_retries = 3);

  // Not recovered once retry_count >= max_retries or the error is
  // non-recoverable. A sanctioned retry waits the strategy delay and
  // increments retry_count; a sanctioned fallback increments it too and
  // names the fallback in the outcome. A retry whose wait is cut short by
  // interrupt is not recovered and leaves retry_count unchanged.
  RecoveryOutcome HandleError(ProcessingError& error, time::WaitInterrupt* interrupt = nullptr);

  ErrorStats GetErrorStats() const;
  void ClearErrorLog();

  static RecoveryStrategy StrategyFor(ErrorKind kind, bool recoverable);
  static std::string GetUserFriendlyMessage(const ProcessingError& error);
  static std::vector<std::string> GetSuggestedActions(const ProcessingError& error);
  static bool IsRecoverable(const ProcessingError& error);

 private:
  void LogError(const ProcessingError& error);

  const time::ITimeSource& clock_;
  time::IWaitStrategy& waiter_;

  mutable std::mutex mutex_;
  std::deque<ProcessingError> error_log_;
};

}  // namespace reelforge::recovery

#endif  // REELFORGE_RECOVERY_ERROR_POLICY_HPP_
