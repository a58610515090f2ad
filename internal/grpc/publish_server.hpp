#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "masterplan/services/v1/publish_service.grpc.pb.h"
#include "internal/service/publish_service.hpp"

namespace masterplan::grpc {

class PublishServer final : public masterplan::services::v1::PublishService::Service {
public:
  explicit PublishServer(std::shared_ptr<masterplan::service::PublishService> svc);

  ::grpc::Status StartPublish(::grpc::ServerContext*,
                              const masterplan::services::v1::StartPublishRequest*,
                              masterplan::services::v1::StartJobResponse*) override;

  ::grpc::Status StartTileGeneration(::grpc::ServerContext*,
                                     const masterplan::services::v1::StartTileGenerationRequest*,
                                     masterplan::services::v1::StartJobResponse*) override;

  ::grpc::Status ValidatePublish(::grpc::ServerContext*,
                                 const masterplan::services::v1::ValidatePublishRequest*,
                                 masterplan::services::v1::ValidatePublishResponse*) override;

  ::grpc::Status GetJob(::grpc::ServerContext*,
                        const masterplan::services::v1::GetJobRequest*,
                        masterplan::release::v1::JobState*) override;

  ::grpc::Status StreamJob(::grpc::ServerContext*,
                           const masterplan::services::v1::GetJobRequest*,
                           ::grpc::ServerWriter<masterplan::release::v1::JobState>*) override;

  ::grpc::Status ListJobs(::grpc::ServerContext*,
                          const masterplan::services::v1::ListJobsRequest*,
                          masterplan::services::v1::ListJobsResponse*) override;

  ::grpc::Status CancelJob(::grpc::ServerContext*,
                           const masterplan::services::v1::CancelJobRequest*,
                           masterplan::release::v1::JobState*) override;

  ::grpc::Status ListReleases(::grpc::ServerContext*,
                              const masterplan::services::v1::ListReleasesRequest*,
                              masterplan::services::v1::ListReleasesResponse*) override;

  ::grpc::Status GetCurrentRelease(::grpc::ServerContext*,
                                   const masterplan::services::v1::GetCurrentReleaseRequest*,
                                   masterplan::release::v1::ReleaseSummary*) override;

  ::grpc::Status Rollback(::grpc::ServerContext*,
                          const masterplan::services::v1::RollbackRequest*,
                          masterplan::release::v1::ReleaseSummary*) override;

private:
  std::shared_ptr<masterplan::service::PublishService> service_;
};

}
