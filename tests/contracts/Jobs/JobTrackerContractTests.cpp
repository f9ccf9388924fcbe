// Repository: Reelforge
// Component: Job Tracker Contract Tests
// Purpose: Job lifecycle, progress clamping and ETA, cancellation, retention
//          sweep and metrics-derived health.
// Copyright (c) 2025 Reelforge

#include <gtest/gtest.h>

#include <regex>
#include <set>
#include <string>

#include "reelforge/jobs/JobTracker.hpp"

#include "../../support/DeterministicTimeSource.hpp"

namespace reelforge::jobs {
namespace {

JobUpdate Progress(double pct) {
  JobUpdate u;
  u.progress_percent = pct;
  return u;
}

JobUpdate Status(JobStatus status) {
  JobUpdate u;
  u.status = status;
  return u;
}

class JobTrackerContract : public ::testing::Test {
 protected:
  tests::DeterministicTimeSource clock_;
};

TEST_F(JobTrackerContract, CreateStartsPending) {
  JobTracker tracker(clock_);
  const Job job = tracker.Create("203.0.113.7");
  EXPECT_TRUE(std::regex_match(job.id, std::regex("job_1700000000000_[0-9a-z]{9}"))) << job.id;
  EXPECT_EQ(job.owner, "203.0.113.7");
  EXPECT_EQ(job.status, JobStatus::kPending);
  EXPECT_DOUBLE_EQ(job.progress_percent, 0.0);
  EXPECT_EQ(job.current_step, kInitialStepLabel);
  EXPECT_EQ(job.start_time_ms, clock_.NowUtcMs());
  EXPECT_FALSE(job.end_time_ms.has_value());

  auto fetched = tracker.Get(job.id);
  ASSERT_TRUE(fetched.has_value());
  EXPECT_EQ(fetched->id, job.id);
}

TEST_F(JobTrackerContract, IdsAreUnique) {
  JobTracker tracker(clock_);
  std::set<std::string> ids;
  for (int i = 0; i < 200; ++i) {
    ids.insert(tracker.Create("owner").id);
  }
  EXPECT_EQ(ids.size(), 200u);
  EXPECT_EQ(tracker.ListJobs().size(), 200u);
}

TEST_F(JobTrackerContract, UnknownJobIsNotFound) {
  JobTracker tracker(clock_);
  std::string err;
  EXPECT_FALSE(tracker.Get("job_0_missing", &err).has_value());
  EXPECT_EQ(err, "Job not found");
  EXPECT_FALSE(tracker.Update("job_0_missing", Progress(10), &err).has_value());
  EXPECT_EQ(err, "Job not found");
  EXPECT_FALSE(tracker.Cancel("job_0_missing", &err));
  EXPECT_EQ(err, "Job not found");
}

TEST_F(JobTrackerContract, ProgressIsClamped) {
  JobTracker tracker(clock_);
  std::string err;
  const std::string a = tracker.Create("o").id;
  auto job = tracker.Update(a, Progress(150.0), &err);
  ASSERT_TRUE(job.has_value());
  EXPECT_DOUBLE_EQ(job->progress_percent, 100.0);

  const std::string b = tracker.Create("o").id;
  job = tracker.Update(b, Progress(-5.0), &err);
  ASSERT_TRUE(job.has_value());
  EXPECT_DOUBLE_EQ(job->progress_percent, 0.0);
}

TEST_F(JobTrackerContract, ProgressNeverRegressesWhileProcessing) {
  JobTracker tracker(clock_);
  std::string err;
  const std::string id = tracker.Create("o").id;
  JobUpdate start = Status(JobStatus::kProcessing);
  start.progress_percent = 50.0;
  ASSERT_TRUE(tracker.Update(id, start, &err).has_value());

  auto job = tracker.Update(id, Progress(30.0), &err);
  ASSERT_TRUE(job.has_value());
  EXPECT_DOUBLE_EQ(job->progress_percent, 50.0);

  job = tracker.Update(id, Progress(75.0), &err);
  EXPECT_DOUBLE_EQ(job->progress_percent, 75.0);
}

TEST_F(JobTrackerContract, EstimatesRemainingTime) {
  JobTracker tracker(clock_);
  std::string err;
  const std::string id = tracker.Create("o").id;
  clock_.AdvanceMs(10000);
  auto job = tracker.Update(id, Progress(25.0), &err);
  ASSERT_TRUE(job.has_value());
  ASSERT_TRUE(job->estimated_remaining_ms.has_value());
  EXPECT_EQ(*job->estimated_remaining_ms, 30000);

  clock_.AdvanceMs(10000);
  job = tracker.Update(id, Progress(100.0), &err);
  EXPECT_EQ(*job->estimated_remaining_ms, 0);
}

TEST_F(JobTrackerContract, TerminalJobsRejectUpdates) {
  JobTracker tracker(clock_);
  std::string err;
  const std::string id = tracker.Create("o").id;
  clock_.AdvanceMs(500);
  JobUpdate done = Status(JobStatus::kCompleted);
  done.progress_percent = 100.0;
  done.result = JobResult{};
  auto job = tracker.Update(id, done, &err);
  ASSERT_TRUE(job.has_value());
  ASSERT_TRUE(job->end_time_ms.has_value());
  EXPECT_EQ(*job->end_time_ms - job->start_time_ms, 500);
  EXPECT_TRUE(job->result.has_value());

  EXPECT_FALSE(tracker.Update(id, Progress(10.0), &err).has_value());
  EXPECT_EQ(err, "Job already completed");
}

TEST_F(JobTrackerContract, AccumulatesWarnings) {
  JobTracker tracker(clock_);
  std::string err;
  const std::string id = tracker.Create("o").id;
  JobUpdate u;
  u.add_warnings = {"first"};
  tracker.Update(id, u, &err);
  u.add_warnings = {"second"};
  auto job = tracker.Update(id, u, &err);
  ASSERT_TRUE(job.has_value());
  EXPECT_EQ(job->warnings, (std::vector<std::string>{"first", "second"}));
}

TEST_F(JobTrackerContract, CancelFailsTheJob) {
  JobTracker tracker(clock_);
  std::string err;
  const std::string id = tracker.Create("o").id;
  Job snapshot;
  ASSERT_TRUE(tracker.Cancel(id, &err, &snapshot));
  EXPECT_EQ(snapshot.status, JobStatus::kFailed);
  EXPECT_EQ(snapshot.error, std::optional<std::string>(kCancelledError));
  EXPECT_EQ(snapshot.current_step, kCancelledStep);
  EXPECT_TRUE(snapshot.end_time_ms.has_value());

  EXPECT_FALSE(tracker.Cancel(id, &err));
  EXPECT_EQ(err, "Cannot cancel completed or failed job");
  EXPECT_FALSE(tracker.Update(id, Progress(50.0), &err).has_value());
  EXPECT_EQ(err, "Job already failed");
}

TEST_F(JobTrackerContract, SweepRemovesOnlyExpiredTerminalJobs) {
  JobTrackerConfig config;
  config.retention_ms = 1000;
  JobTracker tracker(clock_, config);
  std::string err;

  const std::string old_done = tracker.Create("o").id;
  tracker.Update(old_done, Status(JobStatus::kCompleted), &err);
  const std::string old_pending = tracker.Create("o").id;
  clock_.AdvanceMs(2000);
  const std::string fresh_done = tracker.Create("o").id;
  tracker.Update(fresh_done, Status(JobStatus::kFailed), &err);

  EXPECT_EQ(tracker.SweepOnce(), 1u);
  EXPECT_FALSE(tracker.Get(old_done).has_value());
  EXPECT_TRUE(tracker.Get(old_pending).has_value());
  EXPECT_TRUE(tracker.Get(fresh_done).has_value());
}

TEST_F(JobTrackerContract, MetricsHistoryIsBounded) {
  JobTrackerConfig config;
  config.max_metrics_history = 3;
  JobTracker tracker(clock_, config);
  EXPECT_FALSE(tracker.LatestMetrics().has_value());
  for (int i = 0; i < 5; ++i) {
    clock_.AdvanceMs(1000);
    tracker.SweepOnce();
  }
  const auto history = tracker.MetricsHistory();
  ASSERT_EQ(history.size(), 3u);
  EXPECT_EQ(history.back().timestamp_ms, clock_.NowUtcMs());
  EXPECT_LT(history.front().timestamp_ms, history.back().timestamp_ms);
}

TEST_F(JobTrackerContract, MetricsSummarizeJobs) {
  JobTracker tracker(clock_);
  std::string err;
  const std::string ok = tracker.Create("o").id;
  const std::string bad = tracker.Create("o").id;
  const std::string running = tracker.Create("o").id;
  tracker.Update(running, Status(JobStatus::kProcessing), &err);
  clock_.AdvanceMs(4000);
  tracker.Update(ok, Status(JobStatus::kCompleted), &err);
  clock_.AdvanceMs(2000);
  tracker.Update(bad, Status(JobStatus::kFailed), &err);

  tracker.SweepOnce();
  const auto m = tracker.LatestMetrics();
  ASSERT_TRUE(m.has_value());
  EXPECT_EQ(m->active_jobs, 1u);
  EXPECT_EQ(m->completed_jobs, 1u);
  EXPECT_EQ(m->failed_jobs, 1u);
  EXPECT_DOUBLE_EQ(m->error_rate, 0.5);
  EXPECT_DOUBLE_EQ(m->average_processing_ms, 5000.0);
  EXPECT_DOUBLE_EQ(m->throughput_per_min, 1.0);

  const SystemHealth health = tracker.GetSystemHealth();
  EXPECT_EQ(health.status, HealthStatus::kWarning);
  ASSERT_EQ(health.issues.size(), 1u);
  EXPECT_EQ(health.issues[0], "High error rate: 50.0%");
  EXPECT_EQ(health.recommendations.size(), 2u);
}

TEST_F(JobTrackerContract, HealthWithoutSnapshotsIsHealthy) {
  JobTracker tracker(clock_);
  const SystemHealth health = tracker.GetSystemHealth();
  EXPECT_EQ(health.status, HealthStatus::kHealthy);
  EXPECT_TRUE(health.issues.empty());
}

TEST_F(JobTrackerContract, IdleServiceReportsLowThroughput) {
  JobTracker tracker(clock_);
  tracker.SweepOnce();
  const SystemHealth health = tracker.GetSystemHealth();
  EXPECT_EQ(health.status, HealthStatus::kWarning);
  ASSERT_EQ(health.issues.size(), 1u);
  EXPECT_EQ(health.issues[0], "Low processing throughput detected");
  EXPECT_STREQ(HealthStatusName(health.status), "warning");
}

TEST_F(JobTrackerContract, StatusNamesRoundTrip) {
  for (JobStatus s : {JobStatus::kPending, JobStatus::kProcessing, JobStatus::kCompleted,
                      JobStatus::kFailed}) {
    EXPECT_EQ(ParseJobStatus(JobStatusName(s)), s);
  }
  EXPECT_FALSE(ParseJobStatus("queued").has_value());
}

TEST_F(JobTrackerContract, SweeperStartsAndStops) {
  JobTrackerConfig config;
  config.sweep_interval_ms = 10;
  JobTracker tracker(clock_, config);
  tracker.StartSweeper();
  tracker.StartSweeper();
  tracker.StopSweeper();
  tracker.StopSweeper();
  SUCCEED();
}

}  // namespace
}  // namespace reelforge::jobs
