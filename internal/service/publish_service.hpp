#pragma once

#include <chrono>
#include <functional>

#include "masterplan/release/v1.hpp"
#include "service_context.hpp"

namespace masterplan::service {

class PublishService {
 public:
  // Returns false when the receiver has gone away.
  using JobSink = std::function<bool(const masterplan::release::v1::JobState&)>;
  // Polled while the job is quiet; false ends the stream.
  using StreamAlive = std::function<bool()>;

  explicit PublishService(ServiceContext ctx, std::chrono::milliseconds stream_poll = std::chrono::seconds(1));

  masterplan::release::v1::StartJobResponse StartPublish(const masterplan::release::v1::StartPublishRequest& req);
  masterplan::release::v1::StartJobResponse StartTileGeneration(const masterplan::release::v1::StartTileGenerationRequest& req);
  masterplan::release::v1::ValidatePublishResponse ValidatePublish(const masterplan::release::v1::ValidatePublishRequest& req);

  masterplan::release::v1::JobState GetJob(const masterplan::release::v1::GetJobRequest& req);

  /*
    Sends the current state, then every later state in sequence order.
    Returns once a terminal state has been sent, the sink refuses, or
    `alive` reports the receiver gone between updates.
  */
  void StreamJob(const masterplan::release::v1::GetJobRequest& req, const JobSink& sink, const StreamAlive& alive = {});

  masterplan::release::v1::ListJobsResponse ListJobs(const masterplan::release::v1::ListJobsRequest& req);
  masterplan::release::v1::JobState         CancelJob(const masterplan::release::v1::CancelJobRequest& req);

  masterplan::release::v1::ListReleasesResponse ListReleases(const masterplan::release::v1::ListReleasesRequest& req);
  masterplan::release::v1::ReleaseSummary       GetCurrentRelease(const masterplan::release::v1::GetCurrentReleaseRequest& req);
  masterplan::release::v1::ReleaseSummary       Rollback(const masterplan::release::v1::RollbackRequest& req);

 private:
  ServiceContext            ctx_;
  std::chrono::milliseconds stream_poll_;
};

} // namespace masterplan::service
