// Repository: Reelforge
// Component: Job Tracker
// Purpose: Job lifecycle (create/update/cancel/get), retention sweep and
//          aggregate system metrics history.
// Copyright (c) 2025 Reelforge

#ifndef REELFORGE_JOBS_JOB_TRACKER_HPP_
#define REELFORGE_JOBS_JOB_TRACKER_HPP_

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <thread>
#include <vector>

#include "reelforge/jobs/Job.hpp"
#include "reelforge/jobs/RecordStore.hpp"
#include "reelforge/time/ITimeSource.hpp"

namespace reelforge::jobs {

inline constexpr const char* kInitialStepLabel = "Initializing video processing...";
inline constexpr const char* kCancelledError = "Job cancelled by user";
inline constexpr const char* kCancelledStep = "Cancelled";

struct JobTrackerConfig {
  int64_t retention_ms = 24LL * 60 * 60 * 1000;
  int64_t sweep_interval_ms = 30 * 1000;
  size_t max_metrics_history = 1000;
  int64_t throughput_window_ms = 60 * 1000;
};

// Immutable snapshot taken by each sweep.
struct SystemMetrics {
  int64_t timestamp_ms = 0;
  size_t active_jobs = 0;
  size_t completed_jobs = 0;
  size_t failed_jobs = 0;
  double average_processing_ms = 0.0;
  double error_rate = 0.0;        // failed / (completed + failed)
  double throughput_per_min = 0.0;  // completions inside the throughput window
};

enum class HealthStatus {
  kHealthy,
  kWarning,
  kCritical,
};

const char* HealthStatusName(HealthStatus status);

struct SystemHealth {
  HealthStatus status = HealthStatus::kHealthy;
  std::vector<std::string> issues;
  std::vector<std::string> recommendations;
};

// JobTracker is the only writer of job records. Every public method is
// thread-safe; the sweeper thread goes through the same mutex, so a sweep
// never interleaves with an update.
//
// Progress never decreases while a job is processing: a lower value in an
// update is ignored. Terminal jobs accept no further updates.
class JobTracker {
 public:
  explicit JobTracker(const time::ITimeSource& clock,
                      JobTrackerConfig config = JobTrackerConfig(),
                      std::unique_ptr<RecordStore<Job>> store = nullptr);
  ~JobTracker();

  JobTracker(const JobTracker&) = delete;
  JobTracker& operator=(const JobTracker&) = delete;

  // New job: pending, progress 0, step kInitialStepLabel.
  Job Create(const std::string& owner);

  // Returns the updated snapshot, or nullopt with *error set ("Job not
  // found", or the job is already terminal).
  std::optional<Job> Update(const std::string& job_id, const JobUpdate& update,
                            std::string* error);

  // Fails for unknown or terminal jobs. On success the job is failed with
  // kCancelledError / kCancelledStep.
  bool Cancel(const std::string& job_id, std::string* error, Job* snapshot = nullptr);

  std::optional<Job> Get(const std::string& job_id, std::string* error = nullptr) const;
  std::vector<Job> ListJobs() const;

  // Removes terminal jobs older than the retention window (by start time)
  // and appends one metrics snapshot. Returns the number of jobs removed.
  size_t SweepOnce();

  std::vector<SystemMetrics> MetricsHistory() const;
  std::optional<SystemMetrics> LatestMetrics() const;

  // Judged from the latest snapshot; healthy when none exists yet.
  SystemHealth GetSystemHealth() const;

  // Background sweep every config.sweep_interval_ms.
  void StartSweeper();
  void StopSweeper();

  const JobTrackerConfig& config() const { return config_; }

 private:
  std::string NewJobId(int64_t now_ms);
  SystemMetrics CollectMetricsLocked(int64_t now_ms) const;
  void SweeperLoop();

  const time::ITimeSource& clock_;
  const JobTrackerConfig config_;

  mutable std::mutex mutex_;
  std::unique_ptr<RecordStore<Job>> store_;
  std::deque<SystemMetrics> history_;
  std::mt19937_64 rng_;

  std::mutex sweeper_mutex_;
  std::condition_variable sweeper_cv_;
  bool sweeper_stop_;
  std::thread sweeper_;
};

}  // namespace reelforge::jobs

#endif  // REELFORGE_JOBS_JOB_TRACKER_HPP_
