// Repository: Reelforge
// Component: Rate Limiter / Abuse Guard
// Purpose: Per-identity request window, concurrent job cap and input
//          allow/deny checks applied before a job is admitted.
// Copyright (c) 2025 Reelforge

#include "reelforge/guard/RateLimiter.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <sstream>
#include <utility>

#include "reelforge/util/Logger.hpp"

namespace reelforge::guard {

namespace {

std::string ToLower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

// Up to two decimals, trailing zeros dropped.
std::string TrimmedDecimal(double value) {
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%.2f", value);
  std::string s(buf);
  while (!s.empty() && s.back() == '0') s.pop_back();
  if (!s.empty() && s.back() == '.') s.pop_back();
  return s;
}

std::string FormatSeconds(double seconds) {
  std::ostringstream oss;
  oss << seconds;
  return oss.str();
}

}  // namespace

std::string FormatBytes(uint64_t bytes) {
  if (bytes == 0) return "0 Bytes";
  static const char* kUnits[] = {"Bytes", "KB", "MB", "GB"};
  const double k = 1024.0;
  int i = static_cast<int>(std::floor(std::log(static_cast<double>(bytes)) / std::log(k)));
  i = std::max(0, std::min(i, 3));
  return TrimmedDecimal(static_cast<double>(bytes) / std::pow(k, i)) + " " + kUnits[i];
}

RateLimiter::RateLimiter(const time::ITimeSource& clock, RateLimitConfig rate_config,
                         AbusePolicy policy)
    : clock_(clock), rate_config_(rate_config), policy_(std::move(policy)) {
  for (const auto& pattern : policy_.denied_filename_patterns) {
    denied_patterns_.emplace_back(pattern, std::regex::ECMAScript | std::regex::icase);
  }
}

RateDecision RateLimiter::CheckRequestRate(const std::string& identity) {
  const int64_t now = clock_.NowUtcMs();
  RateDecision decision;

  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(identity);
  if (it == entries_.end()) {
    Entry fresh;
    fresh.reset_time_ms = now + rate_config_.window_ms;
    it = entries_.emplace(identity, fresh).first;
  }
  Entry& entry = it->second;

  if (entry.blocked_until_ms && now < *entry.blocked_until_ms) {
    decision.info.remaining = 0;
    decision.info.reset_time_ms = *entry.blocked_until_ms;
    decision.info.is_blocked = true;
    decision.info.block_expiry_ms = entry.blocked_until_ms;
    return decision;
  }

  if (now >= entry.reset_time_ms) {
    entry.count = 0;
    entry.reset_time_ms = now + rate_config_.window_ms;
    entry.blocked_until_ms.reset();
  }

  if (entry.count >= rate_config_.max_requests) {
    entry.blocked_until_ms = now + rate_config_.block_duration_ms;
    decision.info.remaining = 0;
    decision.info.reset_time_ms = *entry.blocked_until_ms;
    decision.info.is_blocked = true;
    decision.info.block_expiry_ms = entry.blocked_until_ms;
    util::Logger::Warn("[RateLimiter] Blocking " + identity + " for " +
                       std::to_string(rate_config_.block_duration_ms) + "ms");
    return decision;
  }

  ++entry.count;
  decision.allowed = true;
  decision.info.remaining = std::max(0, rate_config_.max_requests - entry.count);
  decision.info.reset_time_ms = entry.reset_time_ms;
  decision.info.is_blocked = false;
  return decision;
}

EligibilityDecision RateLimiter::CheckJobEligibility(const std::string& identity,
                                                     const VideoInfo& info) const {
  EligibilityDecision decision;

  if (info.file_size_bytes > policy_.max_file_size_bytes) {
    decision.reason = "File size (" + FormatBytes(info.file_size_bytes) +
                      ") exceeds maximum allowed size (" +
                      FormatBytes(policy_.max_file_size_bytes) + ")";
    return decision;
  }

  if (info.duration_seconds > policy_.max_duration_seconds) {
    decision.reason = "Video duration (" + FormatSeconds(info.duration_seconds) +
                      "s) exceeds maximum allowed duration (" +
                      FormatSeconds(policy_.max_duration_seconds) + "s)";
    return decision;
  }

  const std::string format = ToLower(info.format);
  if (std::find(policy_.allowed_formats.begin(), policy_.allowed_formats.end(), format) ==
      policy_.allowed_formats.end()) {
    std::string allowed;
    for (size_t i = 0; i < policy_.allowed_formats.size(); ++i) {
      if (i > 0) allowed += ", ";
      allowed += policy_.allowed_formats[i];
    }
    decision.reason = "Video format '" + info.format +
                      "' is not supported. Allowed formats: " + allowed;
    return decision;
  }

  for (const auto& pattern : denied_patterns_) {
    if (std::regex_search(info.filename, pattern)) {
      decision.reason = "File appears to be suspicious and has been blocked for security reasons";
      return decision;
    }
  }

  if (ActiveJobCount(identity) >= policy_.max_concurrent_jobs) {
    decision.reason = "Maximum concurrent jobs (" + std::to_string(policy_.max_concurrent_jobs) +
                      ") exceeded. Please wait for current jobs to complete.";
    return decision;
  }

  decision.allowed = true;
  return decision;
}

void RateLimiter::RegisterJob(const std::string& identity, const std::string& job_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  active_jobs_[identity].insert(job_id);
}

void RateLimiter::UnregisterJob(const std::string& identity, const std::string& job_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = active_jobs_.find(identity);
  if (it == active_jobs_.end()) return;
  it->second.erase(job_id);
  if (it->second.empty()) {
    active_jobs_.erase(it);
  }
}

size_t RateLimiter::ActiveJobCount(const std::string& identity) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = active_jobs_.find(identity);
  return it == active_jobs_.end() ? 0 : it->second.size();
}

std::optional<RateLimitInfo> RateLimiter::GetRateLimitInfo(const std::string& identity) const {
  const int64_t now = clock_.NowUtcMs();
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(identity);
  if (it == entries_.end()) {
    return std::nullopt;
  }
  const Entry& entry = it->second;
  RateLimitInfo info;
  info.remaining = std::max(0, rate_config_.max_requests - entry.count);
  info.reset_time_ms = entry.reset_time_ms;
  info.is_blocked = entry.blocked_until_ms.has_value() && now < *entry.blocked_until_ms;
  info.block_expiry_ms = entry.blocked_until_ms;
  return info;
}

GuardStats RateLimiter::GetStats() const {
  const int64_t now = clock_.NowUtcMs();
  std::lock_guard<std::mutex> lock(mutex_);
  GuardStats stats;
  stats.identities_with_jobs = active_jobs_.size();
  for (const auto& [identity, jobs] : active_jobs_) {
    (void)identity;
    stats.active_jobs += jobs.size();
  }
  for (const auto& [identity, entry] : entries_) {
    (void)identity;
    if (entry.blocked_until_ms && now < *entry.blocked_until_ms) {
      ++stats.blocked_identities;
    }
  }
  stats.rate_limit_entries = entries_.size();
  return stats;
}

void RateLimiter::ResetIdentity(const std::string& identity) {
  std::lock_guard<std::mutex> lock(mutex_);
  entries_.erase(identity);
}

void RateLimiter::ResetAll() {
  std::lock_guard<std::mutex> lock(mutex_);
  entries_.clear();
  active_jobs_.clear();
}

size_t RateLimiter::CleanupExpired() {
  const int64_t now = clock_.NowUtcMs();
  std::lock_guard<std::mutex> lock(mutex_);
  size_t removed = 0;
  for (auto it = entries_.begin(); it != entries_.end();) {
    const Entry& e = it->second;
    const bool expired = now >= e.reset_time_ms && (!e.blocked_until_ms || now >= *e.blocked_until_ms);
    if (expired) {
      it = entries_.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }
  return removed;
}

}  // namespace reelforge::guard
