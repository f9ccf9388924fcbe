// Repository: Reelforge
// Component: Story Service
// Purpose: Job admission, per-job worker threads, retry loop and output
//          writing.
// Copyright (c) 2025 Reelforge

#include "reelforge/service/StoryService.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <utility>

#include "reelforge/codec/CapabilityProber.hpp"
#include "reelforge/util/Logger.hpp"

namespace reelforge::service {

using recovery::ErrorKind;
using recovery::ProcessingError;

namespace {

void SetError(std::string* error, const std::string& message) {
  if (error) *error = message;
}

// Fills the fields the caller left empty from the input path.
void CompleteVideoInfo(const std::string& input_path, const source::IFrameSource& source,
                       guard::VideoInfo& info) {
  const std::filesystem::path path(input_path);
  if (info.filename.empty()) {
    info.filename = path.filename().string();
  }
  if (info.format.empty()) {
    std::string ext = path.extension().string();
    if (!ext.empty() && ext[0] == '.') ext.erase(0, 1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    info.format = ext;
  }
  if (info.file_size_bytes == 0) {
    std::error_code ec;
    const auto size = std::filesystem::file_size(path, ec);
    if (!ec) info.file_size_bytes = static_cast<uint64_t>(size);
  }
  if (info.duration_seconds <= 0.0) {
    info.duration_seconds = static_cast<double>(source.DurationUs()) / 1e6;
  }
}

}  // namespace

const char* DeclineKindName(DeclineKind kind) {
  switch (kind) {
    case DeclineKind::kNone:           return "none";
    case DeclineKind::kRateLimited:    return "rate_limited";
    case DeclineKind::kIneligible:     return "ineligible";
    case DeclineKind::kInvalidRequest: return "invalid_request";
    case DeclineKind::kShuttingDown:   return "shutting_down";
  }
  return "unknown";
}

bool WriteOutputFile(const std::string& output_path, const std::vector<uint8_t>& bytes,
                     std::string* error) {
  std::ofstream out(output_path, std::ios::binary | std::ios::trunc);
  if (!out) {
    SetError(error, "cannot open " + output_path + " for writing");
    return false;
  }
  out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
  out.close();
  if (!out) {
    SetError(error, "short write to " + output_path);
    return false;
  }
  return true;
}

StoryService::StoryService(ServiceConfig config, StoryServiceDeps deps)
    : config_(std::move(config)),
      deps_(std::move(deps)),
      tracker_(*deps_.clock, config_.jobs),
      limiter_(*deps_.clock, config_.rate_limit, config_.abuse),
      errors_(*deps_.clock, *deps_.waiter),
      shutting_down_(false),
      cleanup_stop_(false) {
  if (!deps_.write_output) {
    deps_.write_output = &WriteOutputFile;
  }
}

StoryService::~StoryService() {
  Shutdown();
}

void StoryService::Start() {
  tracker_.StartSweeper();
  std::lock_guard<std::mutex> lock(cleanup_mutex_);
  if (cleanup_thread_.joinable()) return;
  cleanup_stop_ = false;
  cleanup_thread_ = std::thread(&StoryService::CleanupLoop, this);
  util::Logger::Info("[StoryService] Started (" + config_.ToJson() + ")");
}

SubmitResult StoryService::SubmitJob(const std::string& identity, const JobRequest& request) {
  SubmitResult result;
  {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    if (shutting_down_) {
      result.decline = DeclineKind::kShuttingDown;
      result.reason = "Service is shutting down";
      return result;
    }
  }
  ReapFinishedWorkers();

  const guard::RateDecision rate = limiter_.CheckRequestRate(identity);
  result.rate_info = rate.info;
  if (!rate.allowed) {
    result.decline = DeclineKind::kRateLimited;
    result.reason = rate.info.is_blocked
                        ? "Rate limit exceeded; requests blocked until the block expires"
                        : "Rate limit exceeded";
    util::Logger::Warn("[StoryService] Declined " + identity + ": " + result.reason);
    return result;
  }

  if (request.input_path.empty() || request.output_path.empty()) {
    result.decline = DeclineKind::kInvalidRequest;
    result.reason = "input_path and output_path are required";
    return result;
  }

  std::string err;
  std::unique_ptr<source::IFrameSource> source = deps_.open_source(request.input_path, &err);
  if (!source) {
    result.decline = DeclineKind::kInvalidRequest;
    result.reason = "Cannot open input video: " + err;
    util::Logger::Warn("[StoryService] Declined " + identity + ": " + result.reason);
    return result;
  }

  guard::VideoInfo info = request.video_info;
  CompleteVideoInfo(request.input_path, *source, info);
  const guard::EligibilityDecision eligible = limiter_.CheckJobEligibility(identity, info);
  if (!eligible.allowed) {
    result.decline = DeclineKind::kIneligible;
    result.reason = eligible.reason;
    util::Logger::Warn("[StoryService] Declined " + identity + ": " + result.reason);
    return result;
  }

  const jobs::Job job = tracker_.Create(identity);
  limiter_.RegisterJob(identity, job.id);

  auto worker = std::make_shared<Worker>();
  {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    if (!shutting_down_) {
      workers_[job.id] = worker;
      worker->thread = std::thread(&StoryService::RunJob, this, worker, identity, job.id,
                                   std::move(source), request);
      result.accepted = true;
      result.job_id = job.id;
      return result;
    }
  }

  // Shutdown began between admission and launch.
  std::string cancel_err;
  if (!tracker_.Cancel(job.id, &cancel_err)) {
    util::Logger::Debug("[StoryService] Cancel on shutdown: " + cancel_err);
  }
  limiter_.UnregisterJob(identity, job.id);
  result.decline = DeclineKind::kShuttingDown;
  result.reason = "Service is shutting down";
  return result;
}

void StoryService::RunJob(std::shared_ptr<Worker> worker, std::string identity,
                          std::string job_id, std::unique_ptr<source::IFrameSource> source,
                          JobRequest request) {
  util::ScopedJobTag tag(job_id);
  auto finish = [&] {
    limiter_.UnregisterJob(identity, job_id);
    {
      std::lock_guard<std::mutex> lock(worker->mutex);
      worker->done = true;
    }
    worker->done_cv.notify_all();
  };

  jobs::JobUpdate start;
  start.status = jobs::JobStatus::kProcessing;
  start.current_step = kAnalyzingStep;
  std::string err;
  if (!tracker_.Update(job_id, start, &err)) {
    util::Logger::Info("[StoryService] Job " + job_id + " not started: " + err);
    finish();
    return;
  }

  const int64_t total_frames = pipeline::TotalFramesFor(source->DurationUs(), config_.fps);
  if (total_frames <= 0) {
    FailJob(job_id, errors_.CreateError(ErrorKind::kInvalidVideoFormat,
                                        "Video has no frames to process", "", false));
    finish();
    return;
  }
  jobs::JobUpdate totals;
  totals.total_frames = total_frames;
  tracker_.Update(job_id, totals, nullptr);

  pipeline::PipelineOptions options = OptionsFor(request);
  int retry_count = 0;
  while (true) {
    pipeline::CompositionPipeline pipeline(*source, *deps_.runtime, *deps_.backends,
                                           *deps_.muxer, errors_, options);
    pipeline.SetProgressCallback([this, &job_id](const pipeline::PipelineProgress& p) {
      jobs::JobUpdate u;
      u.progress_percent = p.percentage;
      u.current_step = p.status;
      u.frames_processed = p.current_frame;
      tracker_.Update(job_id, u, nullptr);
    });
    {
      std::lock_guard<std::mutex> lock(worker->mutex);
      if (worker->cancelled) break;
      worker->pipeline = &pipeline;
    }

    const pipeline::PipelineOutcome outcome = pipeline.Run(total_frames);

    bool cancelled = false;
    {
      std::lock_guard<std::mutex> lock(worker->mutex);
      worker->pipeline = nullptr;
      cancelled = worker->cancelled;
    }
    if (outcome.cancelled || cancelled) {
      util::Logger::Info("[StoryService] Job " + job_id + " stopped after cancellation");
      break;
    }

    if (outcome.success) {
      ProcessingError write_error;
      if (!FinishJob(job_id, request, outcome, &write_error)) {
        FailJob(job_id, write_error);
      }
      break;
    }

    ProcessingError error = outcome.error
                                ? *outcome.error
                                : errors_.CreateError(ErrorKind::kUnknown,
                                                      "Pipeline failed without an error record");
    error.retry_count = retry_count;
    recovery::RecoveryOutcome recovery = errors_.HandleError(error, &worker->retry_wait);
    if (worker->retry_wait.Triggered()) {
      util::Logger::Info("[StoryService] Job " + job_id + " cancelled before retry");
      break;
    }
    if (recovery.recovered && recovery.fallback_method == recovery::kFallbackTranscode) {
      // Every decodable input already goes through FFmpeg; nothing to switch to.
      recovery.recovered = false;
    }
    if (!recovery.recovered) {
      FailJob(job_id, error);
      break;
    }
    retry_count = error.retry_count;
    if (recovery.fallback_method == recovery::kFallbackReduceQuality) {
      options.prefer_reduced_resolution = true;
    }

    jobs::JobUpdate retry;
    retry.current_step = kRetryingStep;
    retry.add_warnings.push_back(std::string("Retrying after ") +
                                 recovery::ErrorKindName(error.kind) + ": " + error.message);
    if (!tracker_.Update(job_id, retry, &err)) {
      util::Logger::Info("[StoryService] Job " + job_id + " not retried: " + err);
      break;
    }
    util::Logger::Info("[StoryService] Job " + job_id + " attempt " +
                       std::to_string(retry_count + 1) + ": " + recovery.result);
  }

  finish();
}

bool StoryService::FinishJob(const std::string& job_id, const JobRequest& request,
                             const pipeline::PipelineOutcome& outcome, ProcessingError* error) {
  jobs::JobUpdate writing;
  writing.current_step = kWritingStep;
  tracker_.Update(job_id, writing, nullptr);

  std::string err;
  if (!deps_.write_output(request.output_path, outcome.output.buffer, &err)) {
    *error = errors_.CreateError(ErrorKind::kUploadFailed, "Failed to write output file", err,
                                 false);
    return false;
  }

  jobs::JobResult result;
  result.output_path = request.output_path;
  result.duration_seconds = outcome.output.duration_seconds;
  result.file_size = outcome.output.size;
  result.resolution = std::to_string(outcome.video_config.width) + "x" +
                      std::to_string(outcome.video_config.height);
  result.video_tracks = outcome.output.video_tracks;
  result.audio_tracks = outcome.output.audio_tracks;
  result.video_samples = outcome.output.video_samples;
  result.audio_samples = outcome.output.audio_samples;

  jobs::JobUpdate done;
  done.status = jobs::JobStatus::kCompleted;
  done.progress_percent = 100.0;
  done.current_step = kCompletedStep;
  done.frames_processed = outcome.frames_processed;
  done.result = result;
  done.add_warnings = outcome.warnings;
  if (!tracker_.Update(job_id, done, &err)) {
    util::Logger::Warn("[StoryService] Job " + job_id + " output written but record closed: " +
                       err);
    return true;
  }
  util::Logger::Info("[StoryService] Job " + job_id + " completed: " + request.output_path +
                     " (" + result.resolution + ", " + std::to_string(result.file_size) +
                     " bytes)");
  return true;
}

void StoryService::FailJob(const std::string& job_id, const ProcessingError& error) {
  jobs::JobUpdate u;
  u.status = jobs::JobStatus::kFailed;
  u.current_step = kFailedStep;
  u.error = recovery::ErrorPolicy::GetUserFriendlyMessage(error);
  u.suggested_actions = recovery::ErrorPolicy::GetSuggestedActions(error);
  std::string err;
  if (!tracker_.Update(job_id, u, &err)) {
    util::Logger::Debug("[StoryService] Failure not recorded for " + job_id + ": " + err);
    return;
  }
  util::Logger::Error("[StoryService] Job " + job_id + " failed: " + error.message);
}

pipeline::PipelineOptions StoryService::OptionsFor(const JobRequest& request) const {
  pipeline::PipelineOptions options;
  options.style = request.style;
  options.fps = config_.fps;
  options.video_bitrate_bps = config_.video_bitrate_bps;
  options.audio = config_.audio;
  options.include_audio = request.include_audio;
  return options;
}

bool StoryService::CancelJob(const std::string& job_id, std::string* error) {
  if (!tracker_.Cancel(job_id, error)) {
    return false;
  }
  std::shared_ptr<Worker> worker;
  {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    auto it = workers_.find(job_id);
    if (it != workers_.end()) worker = it->second;
  }
  if (worker) {
    std::lock_guard<std::mutex> lock(worker->mutex);
    worker->cancelled = true;
    if (worker->pipeline) worker->pipeline->Cancel();
  }
  if (worker) worker->retry_wait.Trigger();
  return true;
}

std::optional<jobs::Job> StoryService::UpdateProgress(const std::string& job_id,
                                                      double progress_percent,
                                                      const std::string& step,
                                                      std::string* error) {
  jobs::JobUpdate u;
  u.progress_percent = progress_percent;
  if (!step.empty()) u.current_step = step;
  return tracker_.Update(job_id, u, error);
}

std::optional<jobs::Job> StoryService::GetJob(const std::string& job_id,
                                              std::string* error) const {
  return tracker_.Get(job_id, error);
}

bool StoryService::WaitForJob(const std::string& job_id, std::chrono::milliseconds timeout) {
  std::shared_ptr<Worker> worker;
  {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    auto it = workers_.find(job_id);
    if (it == workers_.end()) return true;
    worker = it->second;
  }
  std::unique_lock<std::mutex> lock(worker->mutex);
  return worker->done_cv.wait_for(lock, timeout, [&worker] { return worker->done; });
}

void StoryService::ReapFinishedWorkers() {
  std::vector<std::shared_ptr<Worker>> finished;
  {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    for (auto it = workers_.begin(); it != workers_.end();) {
      bool done = false;
      {
        std::lock_guard<std::mutex> wl(it->second->mutex);
        done = it->second->done;
      }
      if (done) {
        finished.push_back(it->second);
        it = workers_.erase(it);
      } else {
        ++it;
      }
    }
  }
  for (auto& w : finished) {
    if (w->thread.joinable()) w->thread.join();
  }
}

void StoryService::Shutdown() {
  std::map<std::string, std::shared_ptr<Worker>> workers;
  {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    shutting_down_ = true;
    workers.swap(workers_);
  }

  for (auto& entry : workers) {
    bool running = false;
    {
      std::lock_guard<std::mutex> lock(entry.second->mutex);
      running = !entry.second->done;
      entry.second->cancelled = true;
      if (entry.second->pipeline) entry.second->pipeline->Cancel();
    }
    entry.second->retry_wait.Trigger();
    std::string err;
    if (running && !tracker_.Cancel(entry.first, &err)) {
      util::Logger::Debug("[StoryService] Shutdown cancel " + entry.first + ": " + err);
    }
  }
  for (auto& entry : workers) {
    if (entry.second->thread.joinable()) entry.second->thread.join();
  }

  {
    std::lock_guard<std::mutex> lock(cleanup_mutex_);
    cleanup_stop_ = true;
  }
  cleanup_cv_.notify_all();
  if (cleanup_thread_.joinable()) cleanup_thread_.join();
  tracker_.StopSweeper();

  if (!workers.empty()) {
    util::Logger::Info("[StoryService] Shutdown joined " + std::to_string(workers.size()) +
                       " workers");
  }
}

void StoryService::CleanupLoop() {
  std::unique_lock<std::mutex> lock(cleanup_mutex_);
  while (!cleanup_stop_) {
    cleanup_cv_.wait_for(lock, std::chrono::milliseconds(config_.rate_limit_cleanup_interval_ms),
                         [this] { return cleanup_stop_; });
    if (cleanup_stop_) break;
    lock.unlock();
    const size_t removed = limiter_.CleanupExpired();
    if (removed > 0) {
      util::Logger::Debug("[StoryService] Rate-limit cleanup removed " + std::to_string(removed) +
                          " entries");
    }
    lock.lock();
  }
}

bool StoryService::IsEncodingSupported() const {
  codec::ProbeRequest probe;
  probe.fps = config_.fps;
  probe.video_bitrate_bps = config_.video_bitrate_bps;
  probe.audio = config_.audio;
  return codec::CapabilityProber(*deps_.runtime, probe).IsEncodingSupported();
}

std::string StoryService::GetSupportDescription() const {
  codec::ProbeRequest probe;
  probe.fps = config_.fps;
  probe.video_bitrate_bps = config_.video_bitrate_bps;
  probe.audio = config_.audio;
  return codec::CapabilityProber(*deps_.runtime, probe).GetSupportDescription();
}

}  // namespace reelforge::service
