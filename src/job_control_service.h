// Repository: Reelforge
// Component: JobControl gRPC Service Implementation
// Purpose: Exposes the story service's job surface over gRPC.
// Copyright (c) 2025 Reelforge

#ifndef REELFORGE_JOB_CONTROL_SERVICE_H_
#define REELFORGE_JOB_CONTROL_SERVICE_H_

#include <grpcpp/grpcpp.h>

#include "reelforge.grpc.pb.h"
#include "reelforge.pb.h"
#include "reelforge/service/StoryService.hpp"

namespace reelforge {
namespace rpc {

// JobControlImpl implements the gRPC service defined in reelforge.proto.
// This is a thin adapter that delegates to StoryService; declines and
// lookup failures become status codes, never exceptions.
class JobControlImpl final : public JobControl::Service {
 public:
  explicit JobControlImpl(service::StoryService& service);
  ~JobControlImpl() override = default;

  JobControlImpl(const JobControlImpl&) = delete;
  JobControlImpl& operator=(const JobControlImpl&) = delete;

  grpc::Status CreateJob(grpc::ServerContext* context,
                         const CreateJobRequest* request,
                         CreateJobResponse* response) override;

  grpc::Status GetJobStatus(grpc::ServerContext* context,
                            const GetJobStatusRequest* request,
                            JobStatusResponse* response) override;

  grpc::Status UpdateProgress(grpc::ServerContext* context,
                              const UpdateProgressRequest* request,
                              JobStatusResponse* response) override;

  grpc::Status CancelJob(grpc::ServerContext* context,
                         const CancelJobRequest* request,
                         CancelJobResponse* response) override;

  grpc::Status GetCapabilities(grpc::ServerContext* context,
                               const CapabilitiesRequest* request,
                               CapabilitiesResponse* response) override;

  grpc::Status GetSystemMetrics(grpc::ServerContext* context,
                                const SystemMetricsRequest* request,
                                SystemMetricsResponse* response) override;

 private:
  service::StoryService& service_;
};

// Maps a job lookup/update error string to a status code.
grpc::StatusCode StatusCodeForJobError(const std::string& message);

}  // namespace rpc
}  // namespace reelforge

#endif  // REELFORGE_JOB_CONTROL_SERVICE_H_
