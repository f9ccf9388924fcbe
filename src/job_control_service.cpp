// Repository: Reelforge
// Component: JobControl gRPC Service Implementation
// Purpose: Exposes the story service's job surface over gRPC.
// Copyright (c) 2025 Reelforge

#include "job_control_service.h"

#include <cmath>
#include <string>

#include "reelforge/util/Logger.hpp"

namespace reelforge
{
  namespace rpc
  {

    namespace
    {
      void ToProto(const guard::RateLimitInfo &info, RateLimitInfo *out)
      {
        out->set_remaining(info.remaining);
        out->set_reset_time_ms(info.reset_time_ms);
        out->set_is_blocked(info.is_blocked);
        out->set_block_expiry_ms(info.block_expiry_ms.value_or(0));
      }

      void ToProto(const jobs::Job &job, Job *out)
      {
        out->set_id(job.id);
        out->set_owner(job.owner);
        out->set_status(jobs::JobStatusName(job.status));
        out->set_progress_percent(job.progress_percent);
        out->set_current_step(job.current_step);
        out->set_start_time_ms(job.start_time_ms);
        out->set_end_time_ms(job.end_time_ms.value_or(0));
        if (job.estimated_remaining_ms)
        {
          out->set_has_estimate(true);
          out->set_estimated_remaining_ms(*job.estimated_remaining_ms);
        }
        out->set_error(job.error.value_or(""));
        for (const auto &action : job.suggested_actions)
        {
          out->add_suggested_actions(action);
        }
        if (job.result)
        {
          out->set_has_result(true);
          JobResult *r = out->mutable_result();
          r->set_output_path(job.result->output_path);
          r->set_duration_seconds(job.result->duration_seconds);
          r->set_file_size(job.result->file_size);
          r->set_resolution(job.result->resolution);
          r->set_video_tracks(job.result->video_tracks);
          r->set_audio_tracks(job.result->audio_tracks);
          r->set_video_samples(job.result->video_samples);
          r->set_audio_samples(job.result->audio_samples);
        }
        for (const auto &w : job.warnings)
        {
          out->add_warnings(w);
        }
        out->set_frames_processed(job.frames_processed);
        out->set_total_frames(job.total_frames);
      }

      grpc::StatusCode StatusCodeForDecline(service::DeclineKind kind)
      {
        switch (kind)
        {
        case service::DeclineKind::kRateLimited:
          return grpc::StatusCode::RESOURCE_EXHAUSTED;
        case service::DeclineKind::kIneligible:
          return grpc::StatusCode::FAILED_PRECONDITION;
        case service::DeclineKind::kInvalidRequest:
          return grpc::StatusCode::INVALID_ARGUMENT;
        case service::DeclineKind::kShuttingDown:
          return grpc::StatusCode::UNAVAILABLE;
        case service::DeclineKind::kNone:
          break;
        }
        return grpc::StatusCode::INTERNAL;
      }
    } // namespace

    grpc::StatusCode StatusCodeForJobError(const std::string &message)
    {
      if (message.find("not found") != std::string::npos)
      {
        return grpc::StatusCode::NOT_FOUND;
      }
      if (message.find("already") != std::string::npos ||
          message.find("Cannot cancel") != std::string::npos)
      {
        return grpc::StatusCode::FAILED_PRECONDITION;
      }
      return grpc::StatusCode::INTERNAL;
    }

    JobControlImpl::JobControlImpl(service::StoryService &service) : service_(service) {}

    grpc::Status JobControlImpl::CreateJob(grpc::ServerContext *context,
                                           const CreateJobRequest *request,
                                           CreateJobResponse *response)
    {
      // Anonymous callers are limited per peer address.
      const std::string identity =
          request->identity().empty() ? context->peer() : request->identity();

      util::Logger::Info("[CreateJob] Request received: identity=" + identity +
                         ", input=" + request->input_path());

      service::JobRequest job;
      job.input_path = request->input_path();
      job.output_path = request->output_path();
      if (!request->composition_mode().empty())
      {
        auto mode = compose::ParseCompositionMode(request->composition_mode());
        if (!mode)
        {
          return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT,
                              "Unknown composition mode: " + request->composition_mode());
        }
        job.style.mode = *mode;
      }
      if (request->top_safe_zone_px() < 0 || request->bottom_safe_zone_px() < 0)
      {
        return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT,
                            "Safe zone heights must not be negative");
      }
      job.style.show_safe_zones = request->show_safe_zones();
      job.style.top_safe_zone_px = request->top_safe_zone_px();
      job.style.bottom_safe_zone_px = request->bottom_safe_zone_px();
      job.style.metadata.title = request->metadata().title();
      job.style.metadata.channel_name = request->metadata().channel_name();
      job.style.metadata.subscriber_count_label = request->metadata().subscriber_count_label();
      job.include_audio = !request->video_only();
      job.video_info.file_size_bytes = request->video_info().file_size_bytes();
      job.video_info.duration_seconds = request->video_info().duration_seconds();
      job.video_info.format = request->video_info().format();
      job.video_info.filename = request->video_info().filename();

      const service::SubmitResult result = service_.SubmitJob(identity, job);
      ToProto(result.rate_info, response->mutable_rate_limit());
      if (!result.accepted)
      {
        util::Logger::Warn("[CreateJob] Declined (" +
                           std::string(service::DeclineKindName(result.decline)) + "): " +
                           result.reason);
        return grpc::Status(StatusCodeForDecline(result.decline), result.reason);
      }

      response->set_job_id(result.job_id);
      util::Logger::Info("[CreateJob] Job " + result.job_id + " accepted");
      return grpc::Status::OK;
    }

    grpc::Status JobControlImpl::GetJobStatus(grpc::ServerContext *context,
                                              const GetJobStatusRequest *request,
                                              JobStatusResponse *response)
    {
      if (request->job_id().empty())
      {
        return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, "job_id is required");
      }
      std::string err;
      auto job = service_.GetJob(request->job_id(), &err);
      if (!job)
      {
        return grpc::Status(StatusCodeForJobError(err), err);
      }
      ToProto(*job, response->mutable_job());
      return grpc::Status::OK;
    }

    grpc::Status JobControlImpl::UpdateProgress(grpc::ServerContext *context,
                                                const UpdateProgressRequest *request,
                                                JobStatusResponse *response)
    {
      if (request->job_id().empty())
      {
        return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, "job_id is required");
      }
      if (!std::isfinite(request->progress_percent()))
      {
        return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, "progress_percent must be finite");
      }
      std::string err;
      auto job = service_.UpdateProgress(request->job_id(), request->progress_percent(),
                                         request->current_step(), &err);
      if (!job)
      {
        return grpc::Status(StatusCodeForJobError(err), err);
      }
      ToProto(*job, response->mutable_job());
      return grpc::Status::OK;
    }

    grpc::Status JobControlImpl::CancelJob(grpc::ServerContext *context,
                                           const CancelJobRequest *request,
                                           CancelJobResponse *response)
    {
      util::Logger::Info("[CancelJob] Request received: job_id=" + request->job_id());
      if (request->job_id().empty())
      {
        return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, "job_id is required");
      }

      std::string err;
      const bool ok = service_.CancelJob(request->job_id(), &err);
      response->set_success(ok);
      response->set_message(ok ? "Job cancelled" : err);
      if (!ok)
      {
        return grpc::Status(StatusCodeForJobError(err), err);
      }
      return grpc::Status::OK;
    }

    grpc::Status JobControlImpl::GetCapabilities(grpc::ServerContext *context,
                                                 const CapabilitiesRequest *request,
                                                 CapabilitiesResponse *response)
    {
      response->set_encoding_supported(service_.IsEncodingSupported());
      response->set_description(service_.GetSupportDescription());
      return grpc::Status::OK;
    }

    grpc::Status JobControlImpl::GetSystemMetrics(grpc::ServerContext *context,
                                                  const SystemMetricsRequest *request,
                                                  SystemMetricsResponse *response)
    {
      const auto latest = service_.tracker().LatestMetrics();
      if (latest)
      {
        response->set_has_metrics(true);
        SystemMetrics *m = response->mutable_latest();
        m->set_timestamp_ms(latest->timestamp_ms);
        m->set_active_jobs(latest->active_jobs);
        m->set_completed_jobs(latest->completed_jobs);
        m->set_failed_jobs(latest->failed_jobs);
        m->set_average_processing_ms(latest->average_processing_ms);
        m->set_error_rate(latest->error_rate);
        m->set_throughput_per_min(latest->throughput_per_min);
      }

      const jobs::SystemHealth health = service_.tracker().GetSystemHealth();
      response->set_health_status(jobs::HealthStatusName(health.status));
      for (const auto &issue : health.issues)
      {
        response->add_issues(issue);
      }
      for (const auto &rec : health.recommendations)
      {
        response->add_recommendations(rec);
      }

      const guard::GuardStats guard = service_.limiter().GetStats();
      response->set_active_guarded_jobs(guard.active_jobs);
      response->set_blocked_identities(guard.blocked_identities);

      const recovery::ErrorStats errors = service_.errors().GetErrorStats();
      response->set_total_errors(errors.total_errors);
      response->set_recoverable_errors(errors.recoverable_errors);
      response->set_unrecoverable_errors(errors.unrecoverable_errors);
      return grpc::Status::OK;
    }

  } // namespace rpc
} // namespace reelforge
