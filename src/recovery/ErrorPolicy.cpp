// Repository: Reelforge
// Component: Error Recovery Policy
// Purpose: Creates classified processing errors, decides whether a failed
//          job may be re-entered, and keeps a bounded error log.
// Copyright (c) 2025 Reelforge

#include "reelforge/recovery/ErrorPolicy.hpp"

#include <algorithm>
#include <sstream>

#include "reelforge/util/Logger.hpp"

namespace reelforge::recovery {

namespace {

RecoveryStrategy MakeRetry(int64_t delay_ms, int max_retries, const char* message) {
  RecoveryStrategy s;
  s.action = RecoveryAction::kRetry;
  s.delay = std::chrono::milliseconds(delay_ms);
  s.max_retries = max_retries;
  s.user_message = message;
  return s;
}

RecoveryStrategy MakeFallback(const char* method, const char* message) {
  RecoveryStrategy s;
  s.action = RecoveryAction::kFallback;
  s.fallback_method = method;
  // A fallback changes the inputs once; repeating it would rerun the same job.
  s.max_retries = 1;
  s.user_message = message;
  return s;
}

}  // namespace

ErrorPolicy::ErrorPolicy(const time::ITimeSource& clock, time::IWaitStrategy& waiter)
    : clock_(clock), waiter_(waiter) {}

RecoveryStrategy ErrorPolicy::StrategyFor(ErrorKind kind, bool recoverable) {
  if (!recoverable) {
    RecoveryStrategy s;
    s.action = RecoveryAction::kAbort;
    s.user_message =
        "This error cannot be recovered from. Please try a different video or contact support.";
    return s;
  }

  switch (kind) {
    case ErrorKind::kNetworkError:
      return MakeRetry(5000, 3, "Network error detected. Retrying in 5 seconds...");
    case ErrorKind::kTimeout:
      return MakeRetry(10000, 2, "Processing timed out. Retrying with longer timeout...");
    case ErrorKind::kMemoryOverflow:
      return MakeFallback(kFallbackReduceQuality,
                          "Memory limit exceeded. Switching to lower quality processing...");
    case ErrorKind::kUnsupportedCodec:
      return MakeFallback(kFallbackTranscode,
                          "Unsupported video codec. Converting to supported format...");
    case ErrorKind::kVideoTooLarge: {
      RecoveryStrategy s;
      s.action = RecoveryAction::kUserIntervention;
      s.user_message = "Video file is too large. Please compress the video or use a shorter clip.";
      return s;
    }
    default:
      return MakeRetry(3000, 2, "An error occurred. Retrying...");
  }
}

ProcessingError ErrorPolicy::CreateError(ErrorKind kind, const std::string& message,
                                         const std::string& details, bool recoverable,
                                         int max_retries) {
  ProcessingError error;
  error.kind = kind;
  error.message = message;
  error.details = details;
  error.timestamp_ms = clock_.NowUtcMs();
  error.recoverable = recoverable;
  error.retry_count = 0;
  error.strategy = StrategyFor(kind, recoverable);
  error.max_retries = std::max(0, max_retries);
  if (error.strategy.max_retries > 0) {
    error.max_retries = std::min(error.max_retries, error.strategy.max_retries);
  }

  LogError(error);
  return error;
}

RecoveryOutcome ErrorPolicy::HandleError(ProcessingError& error, time::WaitInterrupt* interrupt) {
  RecoveryOutcome outcome;
  if (!error.recoverable || error.retry_count >= error.max_retries) {
    return outcome;
  }

  switch (error.strategy.action) {
    case RecoveryAction::kRetry: {
      if (error.strategy.delay.count() > 0 && !waiter_.WaitFor(error.strategy.delay, interrupt)) {
        util::Logger::Info("[ErrorPolicy] Retry wait interrupted: " + error.message);
        outcome.result = "Retry interrupted";
        return outcome;
      }
      ++error.retry_count;
      std::ostringstream oss;
      oss << "[ErrorPolicy] Retrying operation (" << error.retry_count << "/" << error.max_retries
          << "): " << error.message;
      util::Logger::Info(oss.str());
      outcome.recovered = true;
      outcome.result = "Operation recovered after retry";
      return outcome;
    }
    case RecoveryAction::kFallback: {
      util::Logger::Info("[ErrorPolicy] Applying fallback strategy: " + error.strategy.fallback_method);
      if (error.strategy.fallback_method == kFallbackReduceQuality) {
        outcome.result = "Switched to lower quality processing";
      } else if (error.strategy.fallback_method == kFallbackTranscode) {
        outcome.result = "Video transcoded to supported format";
      } else {
        return outcome;
      }
      ++error.retry_count;
      outcome.recovered = true;
      outcome.fallback_method = error.strategy.fallback_method;
      return outcome;
    }
    case RecoveryAction::kUserIntervention:
    case RecoveryAction::kAbort:
      return outcome;
  }
  return outcome;
}

void ErrorPolicy::LogError(const ProcessingError& error) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    error_log_.push_back(error);
    while (error_log_.size() > kMaxErrorLogSize) {
      error_log_.pop_front();
    }
  }
  std::ostringstream oss;
  oss << "[" << ErrorKindName(error.kind) << "] " << error.message;
  if (!error.details.empty()) {
    oss << " details=" << error.details;
  }
  oss << " recoverable=" << (error.recoverable ? "true" : "false")
      << " strategy=" << RecoveryActionName(error.strategy.action);
  util::Logger::Error(oss.str());
}

ErrorStats ErrorPolicy::GetErrorStats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  ErrorStats stats;
  stats.total_errors = error_log_.size();
  for (const auto& e : error_log_) {
    if (e.recoverable) {
      ++stats.recoverable_errors;
    } else {
      ++stats.unrecoverable_errors;
    }
    ++stats.errors_by_kind[e.kind];
  }
  const size_t first = error_log_.size() > kRecentErrorCount ? error_log_.size() - kRecentErrorCount : 0;
  stats.recent_errors.assign(error_log_.begin() + static_cast<long>(first), error_log_.end());
  return stats;
}

void ErrorPolicy::ClearErrorLog() {
  std::lock_guard<std::mutex> lock(mutex_);
  error_log_.clear();
}

std::string ErrorPolicy::GetUserFriendlyMessage(const ProcessingError& error) {
  if (!error.strategy.user_message.empty()) {
    return error.message + "\n\n" + error.strategy.user_message;
  }
  return error.message;
}

std::vector<std::string> ErrorPolicy::GetSuggestedActions(const ProcessingError& error) {
  std::vector<std::string> actions;
  switch (error.kind) {
    case ErrorKind::kVideoTooLarge:
      actions = {"Compress the video file", "Use a shorter video clip",
                 "Check video resolution and bitrate"};
      break;
    case ErrorKind::kUnsupportedCodec:
      actions = {"Convert video to MP4 format", "Use H.264 or H.265 codec",
                 "Check video file compatibility"};
      break;
    case ErrorKind::kNetworkError:
      actions = {"Check internet connection", "Try again in a few minutes",
                 "Contact support if problem persists"};
      break;
    case ErrorKind::kEncoderUnavailable:
      actions = {"Install an FFmpeg build with libx264 and AAC encoders",
                 "Contact support for assistance"};
      break;
    default:
      actions = {"Retry the job", "Contact support for assistance"};
      break;
  }
  return actions;
}

bool ErrorPolicy::IsRecoverable(const ProcessingError& error) {
  return error.recoverable && error.retry_count < error.max_retries;
}

}  // namespace reelforge::recovery
