// Repository: Reelforge
// Component: Processing Error Types
// Purpose: Names and categories for the failure taxonomy.
// Copyright (c) 2025 Reelforge

#include "reelforge/recovery/ErrorTypes.hpp"

namespace reelforge::recovery {

const char* ErrorKindName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kInvalidVideoFormat:      return "INVALID_VIDEO_FORMAT";
    case ErrorKind::kUnsupportedCodec:        return "UNSUPPORTED_CODEC";
    case ErrorKind::kCorruptedVideoFile:      return "CORRUPTED_VIDEO_FILE";
    case ErrorKind::kVideoTooLarge:           return "VIDEO_TOO_LARGE";
    case ErrorKind::kEncodingFailed:          return "ENCODING_FAILED";
    case ErrorKind::kFrameExtractionFailed:   return "FRAME_EXTRACTION_FAILED";
    case ErrorKind::kMemoryOverflow:          return "MEMORY_OVERFLOW";
    case ErrorKind::kTimeout:                 return "TIMEOUT";
    case ErrorKind::kUnsupportedPlatform:     return "UNSUPPORTED_PLATFORM";
    case ErrorKind::kEncoderUnavailable:      return "ENCODER_UNAVAILABLE";
    case ErrorKind::kInsufficientPermissions: return "INSUFFICIENT_PERMISSIONS";
    case ErrorKind::kNetworkError:            return "NETWORK_ERROR";
    case ErrorKind::kApiRateLimit:            return "API_RATE_LIMIT";
    case ErrorKind::kUploadFailed:            return "UPLOAD_FAILED";
    case ErrorKind::kUnknown:                 return "UNKNOWN_ERROR";
  }
  return "UNKNOWN_ERROR";
}

ErrorCategory CategoryOf(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kInvalidVideoFormat:
    case ErrorKind::kUnsupportedCodec:
    case ErrorKind::kCorruptedVideoFile:
    case ErrorKind::kVideoTooLarge:
      return ErrorCategory::kVideoInput;
    case ErrorKind::kEncodingFailed:
    case ErrorKind::kFrameExtractionFailed:
    case ErrorKind::kMemoryOverflow:
    case ErrorKind::kTimeout:
      return ErrorCategory::kProcessing;
    case ErrorKind::kUnsupportedPlatform:
    case ErrorKind::kEncoderUnavailable:
    case ErrorKind::kInsufficientPermissions:
      return ErrorCategory::kSystem;
    case ErrorKind::kNetworkError:
    case ErrorKind::kApiRateLimit:
    case ErrorKind::kUploadFailed:
      return ErrorCategory::kNetwork;
    case ErrorKind::kUnknown:
      return ErrorCategory::kUnknown;
  }
  return ErrorCategory::kUnknown;
}

const char* ErrorCategoryName(ErrorCategory category) {
  switch (category) {
    case ErrorCategory::kVideoInput: return "video_input";
    case ErrorCategory::kProcessing: return "processing";
    case ErrorCategory::kSystem:     return "system";
    case ErrorCategory::kNetwork:    return "network";
    case ErrorCategory::kUnknown:    return "unknown";
  }
  return "unknown";
}

const char* RecoveryActionName(RecoveryAction action) {
  switch (action) {
    case RecoveryAction::kRetry:            return "retry";
    case RecoveryAction::kFallback:         return "fallback";
    case RecoveryAction::kUserIntervention: return "user_intervention";
    case RecoveryAction::kAbort:            return "abort";
  }
  return "abort";
}

}  // namespace reelforge::recovery
