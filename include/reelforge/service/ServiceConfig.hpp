// Repository: Reelforge
// Component: Service Configuration
// Purpose: Tunables for the job service (encode targets, rate limits, abuse
//          policy, job retention) and their fixed-schema JSON form.
// Copyright (c) 2025 Reelforge

#ifndef REELFORGE_SERVICE_SERVICE_CONFIG_HPP_
#define REELFORGE_SERVICE_SERVICE_CONFIG_HPP_

#include <cstdint>
#include <optional>
#include <string>

#include "reelforge/codec/EncoderConfig.hpp"
#include "reelforge/guard/RateLimiter.hpp"
#include "reelforge/jobs/JobTracker.hpp"
#include "reelforge/media/RationalFps.hpp"

namespace reelforge::service {

// Every section of the JSON form is optional; absent fields keep the
// defaults below. Example:
//
//   {
//     "listen_address": "0.0.0.0:50071",
//     "encode": {"frame_rate": "30/1", "video_bitrate_bps": 6000000,
//                "audio_sample_rate": 44100, "audio_channels": 2,
//                "audio_bitrate_bps": 128000},
//     "rate_limit": {"max_requests": 10, "window_ms": 60000,
//                    "block_duration_ms": 300000, "cleanup_interval_ms": 60000},
//     "abuse": {"max_file_size_bytes": 524288000, "max_duration_seconds": 600,
//               "max_concurrent_jobs": 3},
//     "jobs": {"retention_ms": 86400000, "sweep_interval_ms": 30000,
//              "max_metrics_history": 1000}
//   }
struct ServiceConfig {
  std::string listen_address = "0.0.0.0:50071";
  media::RationalFps fps{30, 1};
  int64_t video_bitrate_bps = 6000000;
  codec::AudioConfig audio;
  guard::RateLimitConfig rate_limit;
  int64_t rate_limit_cleanup_interval_ms = 60 * 1000;
  guard::AbusePolicy abuse;
  jobs::JobTrackerConfig jobs;

  // Returns empty optional on malformed or invalid values.
  static std::optional<ServiceConfig> FromJson(const std::string& json_str);

  // For logging.
  std::string ToJson() const;

  bool IsValid() const;
};

}  // namespace reelforge::service

#endif  // REELFORGE_SERVICE_SERVICE_CONFIG_HPP_
