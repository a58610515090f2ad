#include "publish_service.hpp"

#include <chrono>
#include <type_traits>

#include "internal/core/job_store.hpp"
#include "internal/core/publish_orchestrator.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/release/release_assembler.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace masterplan::service {

using namespace masterplan::release::v1;
using observability::StringField;

namespace {

template <typename Fn>
auto ObserveRpc(std::string_view route, Fn&& fn) {
  observability::SpanScope span(route);

  const auto started_at = std::chrono::steady_clock::now();
  const auto elapsed_ms = [&] {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count();
  };
  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      MASTERPLAN_LOG_DEBUG("RPC ok", {StringField("route", route), observability::DoubleField("elapsed_ms", elapsed_ms())});
      return;
    } else {
      auto result = fn();
      MASTERPLAN_LOG_DEBUG("RPC ok", {StringField("route", route), observability::DoubleField("elapsed_ms", elapsed_ms())});
      return result;
    }
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    MASTERPLAN_LOG_ERROR("RPC failed",
                         {StringField("route", route), StringField("error", ex.what()), observability::DoubleField("elapsed_ms", elapsed_ms())});
    throw;
  }
}

void RequireDraft(const DraftRef& draft) {
  std::vector<std::string> errors;
  if (draft.project_slug().empty()) errors.emplace_back("draft.project_slug is required");
  if (draft.draft_id().empty()) errors.emplace_back("draft.draft_id is required");
  if (!errors.empty()) throw util::ValidationError(std::move(errors));
}

ReleaseSummary ToSummary(const db::model::ReleaseRecord& record, const std::string& current_id) {
  ReleaseSummary summary;
  summary.set_release_id(record.release_id);
  summary.set_project_slug(record.project_slug);
  summary.set_draft_id(record.draft_id);
  summary.set_manifest_key(record.manifest_key);
  summary.set_checksum(record.checksum);
  summary.set_overlay_count(record.overlay_count);
  summary.set_tile_count(record.tile_count);
  *summary.mutable_published_at() = util::ToProto(util::FromUnixMillis(record.published_at_ms));
  summary.set_is_current(record.release_id == current_id);
  return summary;
}

StartJobResponse ToStartResponse(const JobState& state) {
  StartJobResponse resp;
  resp.set_job_id(state.id());
  resp.set_status(state.status());
  return resp;
}

} // namespace

PublishService::PublishService(ServiceContext ctx, std::chrono::milliseconds stream_poll) : ctx_(std::move(ctx)), stream_poll_(stream_poll) {
}

StartJobResponse PublishService::StartPublish(const StartPublishRequest& req) {
  return ObserveRpc("PublishService.StartPublish", [&] {
    RequireDraft(req.draft());
    return ToStartResponse(ctx_.orchestrator->StartPublish(req.draft().project_slug(), req.draft().draft_id(), req.published_by()));
  });
}

StartJobResponse PublishService::StartTileGeneration(const StartTileGenerationRequest& req) {
  return ObserveRpc("PublishService.StartTileGeneration", [&] {
    RequireDraft(req.draft());
    return ToStartResponse(ctx_.orchestrator->StartTileGeneration(req.draft().project_slug(), req.draft().draft_id()));
  });
}

ValidatePublishResponse PublishService::ValidatePublish(const ValidatePublishRequest& req) {
  return ObserveRpc("PublishService.ValidatePublish", [&] {
    RequireDraft(req.draft());
    ValidatePublishResponse resp;
    for (const auto& error : ctx_.orchestrator->ValidatePublish(req.draft().project_slug(), req.draft().draft_id())) {
      resp.add_errors(error);
    }
    resp.set_valid(resp.errors_size() == 0);
    return resp;
  });
}

JobState PublishService::GetJob(const GetJobRequest& req) {
  return ObserveRpc("PublishService.GetJob", [&] {
    if (req.job_id().empty()) throw util::ValidationError("job_id is required");
    return ctx_.jobs->Get(req.job_id());
  });
}

void PublishService::StreamJob(const GetJobRequest& req, const JobSink& sink, const StreamAlive& alive) {
  ObserveRpc("PublishService.StreamJob", [&] {
    if (req.job_id().empty()) throw util::ValidationError("job_id is required");

    auto state = ctx_.jobs->Get(req.job_id());
    if (!sink(state)) return;

    while (!core::IsTerminal(state.status())) {
      auto next = ctx_.jobs->WaitForUpdate(req.job_id(), state.sequence(), stream_poll_);
      if (next.sequence() == state.sequence()) {
        if (alive && !alive()) return;
        continue;
      }
      state = std::move(next);
      if (!sink(state)) return;
    }
  });
}

ListJobsResponse PublishService::ListJobs(const ListJobsRequest& req) {
  return ObserveRpc("PublishService.ListJobs", [&] {
    db::JobFilter filter;
    filter.project_slug = req.project_slug();
    if (req.status() != JOB_STATUS_UNSPECIFIED) filter.status = req.status();
    if (req.limit() != 0) filter.limit = req.limit();

    ListJobsResponse resp;
    for (auto& job : ctx_.jobs->List(filter)) {
      *resp.add_jobs() = std::move(job);
    }
    return resp;
  });
}

JobState PublishService::CancelJob(const CancelJobRequest& req) {
  return ObserveRpc("PublishService.CancelJob", [&] {
    if (req.job_id().empty()) throw util::ValidationError("job_id is required");
    return ctx_.orchestrator->Cancel(req.job_id());
  });
}

ListReleasesResponse PublishService::ListReleases(const ListReleasesRequest& req) {
  return ObserveRpc("PublishService.ListReleases", [&] {
    const auto  current    = ctx_.releases->CurrentRelease(req.project_slug());
    const auto& current_id = current ? current->release_id : std::string();

    ListReleasesResponse resp;
    resp.set_current_release_id(current_id);
    for (const auto& record : ctx_.releases->ListReleases(req.project_slug())) {
      *resp.add_releases() = ToSummary(record, current_id);
    }
    return resp;
  });
}

ReleaseSummary PublishService::GetCurrentRelease(const GetCurrentReleaseRequest& req) {
  return ObserveRpc("PublishService.GetCurrentRelease", [&] {
    const auto current = ctx_.releases->CurrentRelease(req.project_slug());
    if (!current) {
      throw util::NotFound("project " + req.project_slug() + " has no published release");
    }
    return ToSummary(*current, current->release_id);
  });
}

ReleaseSummary PublishService::Rollback(const RollbackRequest& req) {
  return ObserveRpc("PublishService.Rollback", [&] {
    const auto record = ctx_.releases->Rollback(req.project_slug(), req.release_id());
    return ToSummary(record, record.release_id);
  });
}

} // namespace masterplan::service
