// Repository: Reelforge
// Component: Job Tracker
// Purpose: Job lifecycle (create/update/cancel/get), retention sweep and
//          aggregate system metrics history.
// Copyright (c) 2025 Reelforge

#include "reelforge/jobs/JobTracker.hpp"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <sstream>

#include "reelforge/util/Logger.hpp"

namespace reelforge::jobs {

namespace {

void SetError(std::string* error, const std::string& message) {
  if (error) *error = message;
}

constexpr char kBase36[] = "0123456789abcdefghijklmnopqrstuvwxyz";
constexpr int kJobIdSuffixLength = 9;

}  // namespace

const char* JobStatusName(JobStatus status) {
  switch (status) {
    case JobStatus::kPending:    return "pending";
    case JobStatus::kProcessing: return "processing";
    case JobStatus::kCompleted:  return "completed";
    case JobStatus::kFailed:     return "failed";
  }
  return "unknown";
}

std::optional<JobStatus> ParseJobStatus(const std::string& name) {
  if (name == "pending") return JobStatus::kPending;
  if (name == "processing") return JobStatus::kProcessing;
  if (name == "completed") return JobStatus::kCompleted;
  if (name == "failed") return JobStatus::kFailed;
  return std::nullopt;
}

const char* HealthStatusName(HealthStatus status) {
  switch (status) {
    case HealthStatus::kHealthy:  return "healthy";
    case HealthStatus::kWarning:  return "warning";
    case HealthStatus::kCritical: return "critical";
  }
  return "unknown";
}

JobTracker::JobTracker(const time::ITimeSource& clock, JobTrackerConfig config,
                       std::unique_ptr<RecordStore<Job>> store)
    : clock_(clock),
      config_(config),
      store_(store ? std::move(store) : std::make_unique<InMemoryRecordStore<Job>>()),
      rng_(std::random_device{}()),
      sweeper_stop_(false) {}

JobTracker::~JobTracker() {
  StopSweeper();
}

std::string JobTracker::NewJobId(int64_t now_ms) {
  std::uniform_int_distribution<int> digit(0, 35);
  std::string suffix;
  suffix.reserve(kJobIdSuffixLength);
  for (int i = 0; i < kJobIdSuffixLength; ++i) {
    suffix.push_back(kBase36[digit(rng_)]);
  }
  return "job_" + std::to_string(now_ms) + "_" + suffix;
}

Job JobTracker::Create(const std::string& owner) {
  const int64_t now = clock_.NowUtcMs();
  Job job;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    do {
      job.id = NewJobId(now);
    } while (store_->Get(job.id).has_value());
    job.owner = owner;
    job.status = JobStatus::kPending;
    job.progress_percent = 0.0;
    job.current_step = kInitialStepLabel;
    job.start_time_ms = now;
    store_->Put(job.id, job);
  }
  util::Logger::Info("[JobTracker] Job started: " + job.id + " owner=" + owner);
  return job;
}

std::optional<Job> JobTracker::Update(const std::string& job_id, const JobUpdate& update,
                                      std::string* error) {
  const int64_t now = clock_.NowUtcMs();
  std::optional<JobStatus> status_change;
  Job job;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto existing = store_->Get(job_id);
    if (!existing) {
      SetError(error, "Job not found");
      return std::nullopt;
    }
    job = std::move(*existing);
    if (IsTerminal(job.status)) {
      SetError(error, std::string("Job already ") + JobStatusName(job.status));
      return std::nullopt;
    }

    if (update.progress_percent) {
      const double clamped = std::max(0.0, std::min(100.0, *update.progress_percent));
      const bool regresses = job.status == JobStatus::kProcessing && clamped < job.progress_percent;
      if (!regresses) {
        job.progress_percent = clamped;
        if (*update.progress_percent > 0) {
          const int64_t elapsed = now - job.start_time_ms;
          const double total = (static_cast<double>(elapsed) / *update.progress_percent) * 100.0;
          job.estimated_remaining_ms =
              std::max<int64_t>(0, static_cast<int64_t>(total) - elapsed);
        }
      }
    }
    if (update.current_step) job.current_step = *update.current_step;
    if (update.error) job.error = *update.error;
    if (update.suggested_actions) job.suggested_actions = *update.suggested_actions;
    if (update.result) job.result = *update.result;
    if (update.frames_processed) job.frames_processed = *update.frames_processed;
    if (update.total_frames) job.total_frames = *update.total_frames;
    for (const auto& w : update.add_warnings) {
      job.warnings.push_back(w);
    }
    if (update.status && *update.status != job.status) {
      job.status = *update.status;
      status_change = job.status;
      if (IsTerminal(job.status)) {
        job.end_time_ms = now;
      }
    }
    store_->Put(job.id, job);
  }

  if (status_change) {
    util::Logger::Info(std::string("[JobTracker] Job status updated: ") + job_id + " -> " +
                       JobStatusName(*status_change));
  }
  for (const auto& w : update.add_warnings) {
    util::Logger::Warn("[JobTracker] Job warning: " + job_id + " " + w);
  }
  return job;
}

bool JobTracker::Cancel(const std::string& job_id, std::string* error, Job* snapshot) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto job = store_->Get(job_id);
    if (!job) {
      SetError(error, "Job not found");
      return false;
    }
    if (IsTerminal(job->status)) {
      SetError(error, "Cannot cancel completed or failed job");
      return false;
    }
    job->status = JobStatus::kFailed;
    job->error = kCancelledError;
    job->current_step = kCancelledStep;
    job->end_time_ms = clock_.NowUtcMs();
    if (snapshot) *snapshot = *job;
    store_->Put(job_id, *job);
  }
  util::Logger::Info("[JobTracker] Job cancelled: " + job_id);
  return true;
}

std::optional<Job> JobTracker::Get(const std::string& job_id, std::string* error) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto job = store_->Get(job_id);
  if (!job) {
    SetError(error, "Job not found");
  }
  return job;
}

std::vector<Job> JobTracker::ListJobs() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<Job> jobs;
  jobs.reserve(store_->Size());
  store_->ForEach([&jobs](const Job& job) { jobs.push_back(job); });
  std::sort(jobs.begin(), jobs.end(), [](const Job& a, const Job& b) {
    return a.start_time_ms != b.start_time_ms ? a.start_time_ms < b.start_time_ms : a.id < b.id;
  });
  return jobs;
}

SystemMetrics JobTracker::CollectMetricsLocked(int64_t now_ms) const {
  SystemMetrics m;
  m.timestamp_ms = now_ms;
  int64_t total_duration = 0;
  size_t finished = 0;
  size_t recent_completions = 0;
  const int64_t window_start = now_ms - config_.throughput_window_ms;

  store_->ForEach([&](const Job& job) {
    switch (job.status) {
      case JobStatus::kProcessing: ++m.active_jobs; break;
      case JobStatus::kCompleted:  ++m.completed_jobs; break;
      case JobStatus::kFailed:     ++m.failed_jobs; break;
      case JobStatus::kPending:    break;
    }
    if (job.end_time_ms) {
      total_duration += *job.end_time_ms - job.start_time_ms;
      ++finished;
      if (job.status == JobStatus::kCompleted && *job.end_time_ms > window_start) {
        ++recent_completions;
      }
    }
  });

  m.average_processing_ms = finished > 0 ? static_cast<double>(total_duration) / finished : 0.0;
  const size_t terminal = m.completed_jobs + m.failed_jobs;
  m.error_rate = terminal > 0 ? static_cast<double>(m.failed_jobs) / terminal : 0.0;
  m.throughput_per_min = static_cast<double>(recent_completions);
  return m;
}

size_t JobTracker::SweepOnce() {
  const int64_t now = clock_.NowUtcMs();
  size_t removed = 0;
  size_t remaining = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const int64_t cutoff = now - config_.retention_ms;
    removed = store_->EraseIf([cutoff](const Job& job) {
      return IsTerminal(job.status) && job.start_time_ms < cutoff;
    });
    history_.push_back(CollectMetricsLocked(now));
    while (history_.size() > config_.max_metrics_history) {
      history_.pop_front();
    }
    remaining = store_->Size();
  }
  if (removed > 0) {
    util::Logger::Info("[JobTracker] Sweep removed " + std::to_string(removed) +
                       " expired jobs, " + std::to_string(remaining) + " remaining");
  }
  return removed;
}

std::vector<SystemMetrics> JobTracker::MetricsHistory() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return std::vector<SystemMetrics>(history_.begin(), history_.end());
}

std::optional<SystemMetrics> JobTracker::LatestMetrics() const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (history_.empty()) return std::nullopt;
  return history_.back();
}

SystemHealth JobTracker::GetSystemHealth() const {
  SystemHealth health;
  const auto latest = LatestMetrics();
  if (!latest) {
    return health;
  }

  if (latest->error_rate > 0.1) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "High error rate: %.1f%%", latest->error_rate * 100.0);
    health.issues.push_back(buf);
    health.recommendations.push_back("Review recent error logs for patterns");
    health.recommendations.push_back("Check system resources and dependencies");
  }
  if (latest->throughput_per_min < 0.5) {
    health.issues.push_back("Low processing throughput detected");
    health.recommendations.push_back("Check system performance");
    health.recommendations.push_back("Review processing pipeline efficiency");
  }

  if (health.issues.size() > 2) {
    health.status = HealthStatus::kCritical;
  } else if (!health.issues.empty()) {
    health.status = HealthStatus::kWarning;
  }
  return health;
}

void JobTracker::StartSweeper() {
  std::lock_guard<std::mutex> lock(sweeper_mutex_);
  if (sweeper_.joinable()) return;
  sweeper_stop_ = false;
  sweeper_ = std::thread(&JobTracker::SweeperLoop, this);
}

void JobTracker::StopSweeper() {
  {
    std::lock_guard<std::mutex> lock(sweeper_mutex_);
    sweeper_stop_ = true;
  }
  sweeper_cv_.notify_all();
  if (sweeper_.joinable()) {
    sweeper_.join();
  }
}

void JobTracker::SweeperLoop() {
  std::unique_lock<std::mutex> lock(sweeper_mutex_);
  while (!sweeper_stop_) {
    sweeper_cv_.wait_for(lock, std::chrono::milliseconds(config_.sweep_interval_ms),
                         [this] { return sweeper_stop_; });
    if (sweeper_stop_) break;
    lock.unlock();
    SweepOnce();
    lock.lock();
  }
}

}  // namespace reelforge::jobs
