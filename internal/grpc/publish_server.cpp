#include "publish_server.hpp"

#include "grpc_error.hpp"
#include "masterplan/release/v1.hpp"

namespace masterplan::grpc {

using namespace masterplan::release::v1;

PublishServer::PublishServer(std::shared_ptr<masterplan::service::PublishService> svc) : service_(std::move(svc)) {
}

::grpc::Status PublishServer::StartPublish(::grpc::ServerContext*, const StartPublishRequest* req, StartJobResponse* resp) {
  try {
    *resp = service_->StartPublish(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status PublishServer::StartTileGeneration(::grpc::ServerContext*, const StartTileGenerationRequest* req, StartJobResponse* resp) {
  try {
    *resp = service_->StartTileGeneration(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status PublishServer::ValidatePublish(::grpc::ServerContext*, const ValidatePublishRequest* req, ValidatePublishResponse* resp) {
  try {
    *resp = service_->ValidatePublish(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status PublishServer::GetJob(::grpc::ServerContext*, const GetJobRequest* req, JobState* resp) {
  try {
    *resp = service_->GetJob(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status PublishServer::StreamJob(::grpc::ServerContext* ctx, const GetJobRequest* req, ::grpc::ServerWriter<JobState>* writer) {
  try {
    service_->StreamJob(
        *req, [&](const JobState& state) { return !ctx->IsCancelled() && writer->Write(state); }, [ctx] { return !ctx->IsCancelled(); });
    if (ctx->IsCancelled()) {
      return {::grpc::StatusCode::CANCELLED, "client went away"};
    }
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status PublishServer::ListJobs(::grpc::ServerContext*, const ListJobsRequest* req, ListJobsResponse* resp) {
  try {
    *resp = service_->ListJobs(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status PublishServer::CancelJob(::grpc::ServerContext*, const CancelJobRequest* req, JobState* resp) {
  try {
    *resp = service_->CancelJob(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status PublishServer::ListReleases(::grpc::ServerContext*, const ListReleasesRequest* req, ListReleasesResponse* resp) {
  try {
    *resp = service_->ListReleases(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status PublishServer::GetCurrentRelease(::grpc::ServerContext*, const GetCurrentReleaseRequest* req, ReleaseSummary* resp) {
  try {
    *resp = service_->GetCurrentRelease(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status PublishServer::Rollback(::grpc::ServerContext*, const RollbackRequest* req, ReleaseSummary* resp) {
  try {
    *resp = service_->Rollback(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace masterplan::grpc
