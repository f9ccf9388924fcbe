// Repository: Reelforge
// Component: Processing Error Types
// Purpose: Fixed failure taxonomy, recovery strategies and error records.
// Copyright (c) 2025 Reelforge

#ifndef REELFORGE_RECOVERY_ERROR_TYPES_HPP_
#define REELFORGE_RECOVERY_ERROR_TYPES_HPP_

#include <chrono>
#include <cstdint>
#include <string>

namespace reelforge::recovery {

enum class ErrorKind {
  // Video input
  kInvalidVideoFormat,
  kUnsupportedCodec,
  kCorruptedVideoFile,
  kVideoTooLarge,

  // Processing
  kEncodingFailed,
  kFrameExtractionFailed,
  kMemoryOverflow,
  kTimeout,

  // System
  kUnsupportedPlatform,
  kEncoderUnavailable,
  kInsufficientPermissions,

  // Network
  kNetworkError,
  kApiRateLimit,
  kUploadFailed,

  kUnknown,
};

enum class ErrorCategory {
  kVideoInput,
  kProcessing,
  kSystem,
  kNetwork,
  kUnknown,
};

// Upper-case wire names ("ENCODING_FAILED", ...).
const char* ErrorKindName(ErrorKind kind);
ErrorCategory CategoryOf(ErrorKind kind);
const char* ErrorCategoryName(ErrorCategory category);

enum class RecoveryAction {
  kRetry,
  kFallback,
  kUserIntervention,
  kAbort,
};

const char* RecoveryActionName(RecoveryAction action);

inline constexpr const char* kFallbackReduceQuality = "reduce_quality";
inline constexpr const char* kFallbackTranscode = "transcode";

struct RecoveryStrategy {
  RecoveryAction action = RecoveryAction::kAbort;
  std::chrono::milliseconds delay{0};
  int max_retries = 0;          // 0 = strategy sets no bound of its own
  std::string fallback_method;  // kFallback only
  std::string user_message;
};

// retry_count never exceeds max_retries.
struct ProcessingError {
  ErrorKind kind = ErrorKind::kUnknown;
  std::string message;
  std::string details;
  int64_t timestamp_ms = 0;
  bool recoverable = true;
  int retry_count = 0;
  int max_retries = 3;
  RecoveryStrategy strategy;
};

struct RecoveryOutcome {
  bool recovered = false;
  std::string result;
  // Set when the sanctioned recovery is a fallback the caller must apply.
  std::string fallback_method;
};

}  // namespace reelforge::recovery

#endif  // REELFORGE_RECOVERY_ERROR_TYPES_HPP_
