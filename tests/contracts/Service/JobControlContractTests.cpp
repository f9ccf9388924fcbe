// Repository: Reelforge
// Component: JobControl Contract Tests
// Purpose: Status-code mapping and request validation of the gRPC adapter.
// Copyright (c) 2025 Reelforge

#include <gtest/gtest.h>

#include <chrono>
#include <limits>
#include <memory>
#include <string>

#include "job_control_service.h"
#include "reelforge/service/StoryService.hpp"

#include "../../support/DeterministicTimeSource.hpp"
#include "../../support/DeterministicWaitStrategy.hpp"
#include "../../support/FakeCodecRuntime.hpp"
#include "../../support/FakeEncoderBackends.hpp"
#include "../../support/FakeMuxer.hpp"
#include "../../support/SyntheticFrameSource.hpp"

namespace reelforge::rpc {
namespace {

using namespace std::chrono_literals;

TEST(JobControlStatusMapping, MapsJobErrorsToStatusCodes) {
  EXPECT_EQ(StatusCodeForJobError("Job not found"), grpc::StatusCode::NOT_FOUND);
  EXPECT_EQ(StatusCodeForJobError("Job already completed"),
            grpc::StatusCode::FAILED_PRECONDITION);
  EXPECT_EQ(StatusCodeForJobError("Job already failed"), grpc::StatusCode::FAILED_PRECONDITION);
  EXPECT_EQ(StatusCodeForJobError("Cannot cancel completed or failed job"),
            grpc::StatusCode::FAILED_PRECONDITION);
  EXPECT_EQ(StatusCodeForJobError("something broke"), grpc::StatusCode::INTERNAL);
}

class JobControlContract : public ::testing::Test {
 protected:
  JobControlContract() : waiter_(&clock_) {
    service::StoryServiceDeps deps;
    deps.open_source = [](const std::string& path,
                          std::string* error) -> std::unique_ptr<source::IFrameSource> {
      if (path.find("missing") != std::string::npos) {
        if (error) *error = "No such file or directory";
        return nullptr;
      }
      return std::make_unique<tests::SyntheticFrameSource>(1280, 720, 1000000);
    };
    deps.runtime = &runtime_;
    deps.backends = &factory_;
    deps.muxer = &muxer_;
    deps.clock = &clock_;
    deps.waiter = &waiter_;
    deps.write_output = [](const std::string&, const std::vector<uint8_t>&, std::string*) {
      return true;
    };
    service_ = std::make_unique<service::StoryService>(service::ServiceConfig{}, deps);
    impl_ = std::make_unique<JobControlImpl>(*service_);
  }

  ~JobControlContract() override { service_->Shutdown(); }

  static CreateJobRequest Create(const std::string& input) {
    CreateJobRequest request;
    request.set_identity("203.0.113.9");
    request.set_input_path(input);
    request.set_output_path("/tmp/rpc.mp4");
    request.set_video_only(true);
    return request;
  }

  tests::DeterministicTimeSource clock_;
  tests::DeterministicWaitStrategy waiter_;
  tests::FakeCodecRuntime runtime_;
  tests::FakeEncoderFactory factory_;
  tests::FakeMuxer muxer_;
  std::unique_ptr<service::StoryService> service_;
  std::unique_ptr<JobControlImpl> impl_;
};

TEST_F(JobControlContract, CreateJobRunsToCompletion) {
  CreateJobRequest request = Create("clip.mp4");
  request.set_composition_mode("crop");
  request.mutable_metadata()->set_title("Launch day");
  CreateJobResponse created;
  grpc::Status status = impl_->CreateJob(nullptr, &request, &created);
  ASSERT_TRUE(status.ok()) << status.error_message();
  ASSERT_FALSE(created.job_id().empty());
  EXPECT_EQ(created.rate_limit().remaining(), 9);
  EXPECT_FALSE(created.rate_limit().is_blocked());
  ASSERT_TRUE(service_->WaitForJob(created.job_id(), 10s));

  GetJobStatusRequest get;
  get.set_job_id(created.job_id());
  JobStatusResponse response;
  status = impl_->GetJobStatus(nullptr, &get, &response);
  ASSERT_TRUE(status.ok()) << status.error_message();
  EXPECT_EQ(response.job().id(), created.job_id());
  EXPECT_EQ(response.job().owner(), "203.0.113.9");
  EXPECT_EQ(response.job().status(), "completed");
  EXPECT_DOUBLE_EQ(response.job().progress_percent(), 100.0);
  ASSERT_TRUE(response.job().has_result());
  EXPECT_EQ(response.job().result().output_path(), "/tmp/rpc.mp4");
  EXPECT_EQ(response.job().result().resolution(), "540x960");
  EXPECT_EQ(response.job().frames_processed(), 30);

  CancelJobRequest cancel;
  cancel.set_job_id(created.job_id());
  CancelJobResponse cancelled;
  status = impl_->CancelJob(nullptr, &cancel, &cancelled);
  EXPECT_EQ(status.error_code(), grpc::StatusCode::FAILED_PRECONDITION);
  EXPECT_FALSE(cancelled.success());
  EXPECT_EQ(cancelled.message(), "Cannot cancel completed or failed job");
}

TEST_F(JobControlContract, CreateJobValidatesArguments) {
  CreateJobRequest request = Create("clip.mp4");
  request.set_composition_mode("stretch");
  CreateJobResponse response;
  grpc::Status status = impl_->CreateJob(nullptr, &request, &response);
  EXPECT_EQ(status.error_code(), grpc::StatusCode::INVALID_ARGUMENT);
  EXPECT_EQ(status.error_message(), "Unknown composition mode: stretch");

  request = Create("clip.mp4");
  request.set_top_safe_zone_px(-1);
  status = impl_->CreateJob(nullptr, &request, &response);
  EXPECT_EQ(status.error_code(), grpc::StatusCode::INVALID_ARGUMENT);

  request = Create("missing.mp4");
  status = impl_->CreateJob(nullptr, &request, &response);
  EXPECT_EQ(status.error_code(), grpc::StatusCode::INVALID_ARGUMENT);
  EXPECT_EQ(status.error_message(), "Cannot open input video: No such file or directory");
  EXPECT_TRUE(response.job_id().empty());
}

TEST_F(JobControlContract, IneligibleInputIsFailedPrecondition) {
  CreateJobRequest request = Create("clip.flv");
  CreateJobResponse response;
  const grpc::Status status = impl_->CreateJob(nullptr, &request, &response);
  EXPECT_EQ(status.error_code(), grpc::StatusCode::FAILED_PRECONDITION);
  EXPECT_TRUE(response.has_rate_limit());
}

TEST_F(JobControlContract, JobCallsRequireAKnownId) {
  GetJobStatusRequest get;
  JobStatusResponse response;
  EXPECT_EQ(impl_->GetJobStatus(nullptr, &get, &response).error_code(),
            grpc::StatusCode::INVALID_ARGUMENT);
  get.set_job_id("job_0_missing");
  EXPECT_EQ(impl_->GetJobStatus(nullptr, &get, &response).error_code(),
            grpc::StatusCode::NOT_FOUND);

  UpdateProgressRequest update;
  update.set_job_id("job_0_missing");
  update.set_progress_percent(std::numeric_limits<double>::quiet_NaN());
  EXPECT_EQ(impl_->UpdateProgress(nullptr, &update, &response).error_code(),
            grpc::StatusCode::INVALID_ARGUMENT);
  update.set_progress_percent(10.0);
  EXPECT_EQ(impl_->UpdateProgress(nullptr, &update, &response).error_code(),
            grpc::StatusCode::NOT_FOUND);

  CancelJobRequest cancel;
  CancelJobResponse cancelled;
  EXPECT_EQ(impl_->CancelJob(nullptr, &cancel, &cancelled).error_code(),
            grpc::StatusCode::INVALID_ARGUMENT);
}

TEST_F(JobControlContract, ReportsCapabilitiesAndMetrics) {
  CapabilitiesRequest caps_request;
  CapabilitiesResponse caps;
  ASSERT_TRUE(impl_->GetCapabilities(nullptr, &caps_request, &caps).ok());
  EXPECT_TRUE(caps.encoding_supported());
  EXPECT_FALSE(caps.description().empty());

  SystemMetricsRequest metrics_request;
  SystemMetricsResponse metrics;
  ASSERT_TRUE(impl_->GetSystemMetrics(nullptr, &metrics_request, &metrics).ok());
  EXPECT_FALSE(metrics.has_metrics());
  EXPECT_EQ(metrics.health_status(), "healthy");
  EXPECT_EQ(metrics.active_guarded_jobs(), 0u);
  EXPECT_EQ(metrics.total_errors(), 0u);
}

}  // namespace
}  // namespace reelforge::rpc
