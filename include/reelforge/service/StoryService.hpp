// Repository: Reelforge
// Component: Story Service
// Purpose: Admits render jobs through the rate limiter, runs each job's
//          composition pipeline on a worker thread with policy-driven
//          retries, and writes the finished MP4.
// Copyright (c) 2025 Reelforge

#ifndef REELFORGE_SERVICE_STORY_SERVICE_HPP_
#define REELFORGE_SERVICE_STORY_SERVICE_HPP_

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "reelforge/codec/ICodecRuntime.hpp"
#include "reelforge/compose/StyleConfig.hpp"
#include "reelforge/encode/IEncoderBackend.hpp"
#include "reelforge/guard/RateLimiter.hpp"
#include "reelforge/jobs/JobTracker.hpp"
#include "reelforge/mux/IMuxer.hpp"
#include "reelforge/pipeline/CompositionPipeline.hpp"
#include "reelforge/recovery/ErrorPolicy.hpp"
#include "reelforge/service/ServiceConfig.hpp"
#include "reelforge/source/IFrameSource.hpp"
#include "reelforge/time/ITimeSource.hpp"
#include "reelforge/time/IWaitStrategy.hpp"

namespace reelforge::service {

inline constexpr char kAnalyzingStep[] = "Analyzing video...";
inline constexpr char kRetryingStep[] = "Retrying after error...";
inline constexpr char kWritingStep[] = "Writing output file...";
inline constexpr char kCompletedStep[] = "Completed";
inline constexpr char kFailedStep[] = "Failed";

// Collaborators are borrowed and must outlive the service.
struct StoryServiceDeps {
  using SourceOpener = std::function<std::unique_ptr<source::IFrameSource>(
      const std::string& input_path, std::string* error)>;
  using OutputWriter = std::function<bool(const std::string& output_path,
                                          const std::vector<uint8_t>& bytes,
                                          std::string* error)>;

  SourceOpener open_source;
  const codec::ICodecRuntime* runtime = nullptr;
  encode::IEncoderBackendFactory* backends = nullptr;
  mux::IMuxer* muxer = nullptr;
  const time::ITimeSource* clock = nullptr;
  time::IWaitStrategy* waiter = nullptr;
  // Empty: WriteOutputFile.
  OutputWriter write_output;
};

// Writes bytes to path, replacing any existing file.
bool WriteOutputFile(const std::string& output_path, const std::vector<uint8_t>& bytes,
                     std::string* error);

struct JobRequest {
  std::string input_path;
  std::string output_path;
  compose::StyleConfig style;
  bool include_audio = true;
  // Fields left empty/zero are filled from the input file.
  guard::VideoInfo video_info;
};

enum class DeclineKind {
  kNone,
  kRateLimited,
  kIneligible,
  kInvalidRequest,
  kShuttingDown,
};

const char* DeclineKindName(DeclineKind kind);

struct SubmitResult {
  bool accepted = false;
  std::string job_id;
  DeclineKind decline = DeclineKind::kNone;
  std::string reason;
  guard::RateLimitInfo rate_info;
};

// StoryService is the composition root of the job surface. One worker thread
// per accepted job; the JobTracker record is the only state other threads
// observe. All public methods are thread-safe.
class StoryService {
 public:
  StoryService(ServiceConfig config, StoryServiceDeps deps);
  ~StoryService();

  StoryService(const StoryService&) = delete;
  StoryService& operator=(const StoryService&) = delete;

  // Starts the job sweeper and the rate-limit cleanup loop.
  void Start();

  // rate check -> input probe -> eligibility -> create -> register -> run.
  SubmitResult SubmitJob(const std::string& identity, const JobRequest& request);

  // Fails the record and cancels the running pipeline, if any.
  bool CancelJob(const std::string& job_id, std::string* error);

  // Externally reported progress (e.g. from a client-side renderer).
  std::optional<jobs::Job> UpdateProgress(const std::string& job_id, double progress_percent,
                                          const std::string& step, std::string* error);

  std::optional<jobs::Job> GetJob(const std::string& job_id, std::string* error) const;

  // True once the job's worker has finished (or the job is unknown to this
  // service). False on timeout.
  bool WaitForJob(const std::string& job_id, std::chrono::milliseconds timeout);

  // Cancels every running job, joins all workers and stops background loops.
  // Idempotent; new submissions are declined afterwards.
  void Shutdown();

  bool IsEncodingSupported() const;
  std::string GetSupportDescription() const;

  jobs::JobTracker& tracker() { return tracker_; }
  const jobs::JobTracker& tracker() const { return tracker_; }
  guard::RateLimiter& limiter() { return limiter_; }
  recovery::ErrorPolicy& errors() { return errors_; }
  const ServiceConfig& config() const { return config_; }

 private:
  struct Worker {
    std::thread thread;
    std::mutex mutex;
    std::condition_variable done_cv;
    pipeline::CompositionPipeline* pipeline = nullptr;
    time::WaitInterrupt retry_wait;
    bool cancelled = false;
    bool done = false;
  };

  void RunJob(std::shared_ptr<Worker> worker, std::string identity, std::string job_id,
              std::unique_ptr<source::IFrameSource> source, JobRequest request);
  void FailJob(const std::string& job_id, const recovery::ProcessingError& error);
  bool FinishJob(const std::string& job_id, const JobRequest& request,
                 const pipeline::PipelineOutcome& outcome, recovery::ProcessingError* error);
  pipeline::PipelineOptions OptionsFor(const JobRequest& request) const;
  void ReapFinishedWorkers();
  void CleanupLoop();

  const ServiceConfig config_;
  StoryServiceDeps deps_;

  jobs::JobTracker tracker_;
  guard::RateLimiter limiter_;
  recovery::ErrorPolicy errors_;

  std::mutex workers_mutex_;
  std::map<std::string, std::shared_ptr<Worker>> workers_;
  bool shutting_down_;

  std::mutex cleanup_mutex_;
  std::condition_variable cleanup_cv_;
  bool cleanup_stop_;
  std::thread cleanup_thread_;
};

}  // namespace reelforge::service

#endif  // REELFORGE_SERVICE_STORY_SERVICE_HPP_
