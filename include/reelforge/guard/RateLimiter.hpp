// Repository: Reelforge
// Component: Rate Limiter / Abuse Guard
// Purpose: Per-identity request window, concurrent job cap and input
//          allow/deny checks applied before a job is admitted.
// Copyright (c) 2025 Reelforge

#ifndef REELFORGE_GUARD_RATE_LIMITER_HPP_
#define REELFORGE_GUARD_RATE_LIMITER_HPP_

#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <regex>
#include <set>
#include <string>
#include <vector>

#include "reelforge/time/ITimeSource.hpp"

namespace reelforge::guard {

struct RateLimitConfig {
  int max_requests = 10;
  int64_t window_ms = 60 * 1000;
  int64_t block_duration_ms = 5 * 60 * 1000;
};

struct AbusePolicy {
  uint64_t max_file_size_bytes = 500ULL * 1024 * 1024;
  double max_duration_seconds = 600.0;
  std::vector<std::string> allowed_formats = {"mp4", "avi", "mov", "mkv", "webm"};
  size_t max_concurrent_jobs = 3;
  // ECMAScript patterns matched case-insensitively against the filename.
  std::vector<std::string> denied_filename_patterns = {
      "\\.exe$", "\\.bat$", "\\.cmd$", "\\.ps1$", "\\.sh$"};
};

struct VideoInfo {
  uint64_t file_size_bytes = 0;
  double duration_seconds = 0.0;
  std::string format;  // container extension, e.g. "mp4"
  std::string filename;
};

struct RateLimitInfo {
  int remaining = 0;
  int64_t reset_time_ms = 0;
  bool is_blocked = false;
  std::optional<int64_t> block_expiry_ms;
};

struct RateDecision {
  bool allowed = false;
  RateLimitInfo info;
};

struct EligibilityDecision {
  bool allowed = false;
  std::string reason;  // first violation found
};

struct GuardStats {
  size_t identities_with_jobs = 0;
  size_t active_jobs = 0;
  size_t blocked_identities = 0;
  size_t rate_limit_entries = 0;
};

// "500 MB", "1.5 KB", "0 Bytes".
std::string FormatBytes(uint64_t bytes);

// RateLimiter owns all per-identity state; every method is thread-safe and
// CleanupExpired() takes the same lock, so a sweep never removes an entry
// mid-check.
//
// A blocked identity is denied until its block expires, even if its window
// has reset in the meantime.
class RateLimiter {
 public:
  RateLimiter(const time::ITimeSource& clock,
              RateLimitConfig rate_config = RateLimitConfig(),
              AbusePolicy policy = AbusePolicy());

  RateLimiter(const RateLimiter&) = delete;
  RateLimiter& operator=(const RateLimiter&) = delete;

  RateDecision CheckRequestRate(const std::string& identity);

  // size -> duration -> format -> filename denylist -> concurrency.
  EligibilityDecision CheckJobEligibility(const std::string& identity, const VideoInfo& info) const;

  void RegisterJob(const std::string& identity, const std::string& job_id);
  // Removing the last job drops the identity entirely.
  void UnregisterJob(const std::string& identity, const std::string& job_id);
  size_t ActiveJobCount(const std::string& identity) const;

  std::optional<RateLimitInfo> GetRateLimitInfo(const std::string& identity) const;
  GuardStats GetStats() const;

  void ResetIdentity(const std::string& identity);
  void ResetAll();

  // Drops entries whose window and block have both expired. Returns count.
  size_t CleanupExpired();

  const RateLimitConfig& rate_config() const { return rate_config_; }
  const AbusePolicy& policy() const { return policy_; }

 private:
  struct Entry {
    int count = 0;
    int64_t reset_time_ms = 0;
    std::optional<int64_t> blocked_until_ms;
  };

  const time::ITimeSource& clock_;
  const RateLimitConfig rate_config_;
  const AbusePolicy policy_;
  std::vector<std::regex> denied_patterns_;

  mutable std::mutex mutex_;
  std::map<std::string, Entry> entries_;
  std::map<std::string, std::set<std::string>> active_jobs_;
};

}  // namespace reelforge::guard

#endif  // REELFORGE_GUARD_RATE_LIMITER_HPP_
