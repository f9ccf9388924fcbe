// Repository: Reelforge
// Component: Job Record
// Purpose: Per-job lifecycle record and the partial update applied to it.
// Copyright (c) 2025 Reelforge

#ifndef REELFORGE_JOBS_JOB_HPP_
#define REELFORGE_JOBS_JOB_HPP_

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace reelforge::jobs {

enum class JobStatus {
  kPending,
  kProcessing,
  kCompleted,
  kFailed,
};

const char* JobStatusName(JobStatus status);
std::optional<JobStatus> ParseJobStatus(const std::string& name);

inline bool IsTerminal(JobStatus status) {
  return status == JobStatus::kCompleted || status == JobStatus::kFailed;
}

struct JobResult {
  std::string output_path;
  double duration_seconds = 0.0;
  uint64_t file_size = 0;
  std::string resolution;
  int video_tracks = 0;
  int audio_tracks = 0;
  int64_t video_samples = 0;
  int64_t audio_samples = 0;
};

struct Job {
  std::string id;
  std::string owner;
  JobStatus status = JobStatus::kPending;
  double progress_percent = 0.0;  // [0, 100]
  std::string current_step;
  int64_t start_time_ms = 0;
  std::optional<int64_t> end_time_ms;
  std::optional<int64_t> estimated_remaining_ms;
  std::optional<std::string> error;
  std::vector<std::string> suggested_actions;
  std::optional<JobResult> result;
  std::vector<std::string> warnings;
  int64_t frames_processed = 0;
  int64_t total_frames = 0;
};

// Fields left unset are not touched. add_warnings are appended.
struct JobUpdate {
  std::optional<JobStatus> status;
  std::optional<double> progress_percent;
  std::optional<std::string> current_step;
  std::optional<std::string> error;
  std::optional<std::vector<std::string>> suggested_actions;
  std::optional<JobResult> result;
  std::optional<int64_t> frames_processed;
  std::optional<int64_t> total_frames;
  std::vector<std::string> add_warnings;
};

}  // namespace reelforge::jobs

#endif  // REELFORGE_JOBS_JOB_HPP_
