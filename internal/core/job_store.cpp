#include "job_store.hpp"

#include <google/protobuf/util/json_util.h>

#include <algorithm>
#include <stdexcept>
#include <utility>

#include "internal/db/api/result.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/release_id.hpp"
#include "internal/util/time.hpp"

namespace masterplan::core {

using namespace masterplan::release::v1;

namespace {

void SetTime(uint64_t millis, google::protobuf::Timestamp* out) {
  if (millis != 0) {
    *out = util::ToProto(util::FromUnixMillis(millis));
  }
}

std::string EncodeResult(const JobResult& result) {
  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(result, &json, options);
  if (!status.ok()) {
    throw util::InvalidState("job result encode failed: " + std::string(status.message()));
  }
  return json;
}

JobState ToState(const db::model::JobRecord& record, const std::vector<db::model::JobLogRecord>& logs) {
  JobState state;
  state.set_id(record.id);
  state.set_type(record.type);
  state.set_project_slug(record.project_slug);
  state.set_draft_id(record.draft_id);
  state.set_status(record.status);
  state.set_progress(record.progress);
  state.set_message(record.message);
  state.set_error(record.error);
  state.set_sequence(record.sequence);
  SetTime(record.created_at_ms, state.mutable_created_at());
  SetTime(record.started_at_ms, state.mutable_started_at());
  SetTime(record.completed_at_ms, state.mutable_completed_at());

  if (!record.result_json.empty()) {
    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = true;
    auto status = google::protobuf::util::JsonStringToMessage(record.result_json, state.mutable_result(), options);
    if (!status.ok()) {
      MASTERPLAN_LOG_WARN("unreadable job result", {observability::StringField("job_id", record.id),
                                                    observability::StringField("error", std::string(status.message()))});
      state.clear_result();
    }
  }

  for (const auto& log : logs) {
    auto* entry = state.add_logs();
    entry->set_timestamp(util::ToIso8601(util::FromUnixMillis(log.timestamp_ms)));
    entry->set_level(log.level);
    entry->set_message(log.message);
  }
  return state;
}

} // namespace

bool IsTerminal(JobStatus status) {
  return status == JOB_STATUS_COMPLETED || status == JOB_STATUS_FAILED || status == JOB_STATUS_CANCELLED;
}

JobStore::JobStore(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
  if (!repository_) {
    throw std::invalid_argument("JobStore: repository is required");
  }
}

JobState JobStore::Create(JobType type, const std::string& project_slug, const std::string& draft_id) {
  db::model::JobRecord record;
  record.id            = util::GenerateJobId();
  record.type          = type;
  record.status        = JOB_STATUS_QUEUED;
  record.project_slug  = project_slug;
  record.draft_id      = draft_id;
  record.message       = "Queued";
  record.created_at_ms = util::ToUnixMillis(util::Now());
  record.sequence      = 1;

  {
    auto tx = repository_->Begin();
    if (auto active = repository_->FindActiveJob(*tx, project_slug, draft_id, type)) {
      throw util::ConcurrencyError("job " + active->id + " is already in flight for draft " + project_slug + "/" + draft_id);
    }
    // tile generation stages into the project-wide uploads/tiles prefix
    if (type == JOB_TYPE_TILE_GENERATION) {
      if (auto active = repository_->FindActiveJob(*tx, project_slug, "", type)) {
        throw util::ConcurrencyError("job " + active->id + " is already generating tiles for project " + project_slug);
      }
    }
    db::ThrowIfDbError(repository_->InsertJob(*tx, record), "create job");

    db::model::JobLogRecord log{record.id, 0, record.created_at_ms, "info", "Job queued"};
    db::ThrowIfDbError(repository_->AppendJobLog(*tx, log), "create job: log");
    tx->Commit();
  }
  Notify();

  MASTERPLAN_LOG_INFO("job created", {observability::StringField("job_id", record.id), observability::StringField("project", project_slug),
                                      observability::StringField("draft_id", draft_id), observability::IntField("type", type)});
  return Get(record.id);
}

JobState JobStore::Start(const std::string& job_id) {
  Mutate(
      job_id, "start job",
      [](db::model::JobRecord& record) {
        if (record.status != JOB_STATUS_QUEUED) {
          throw util::InvalidState("start job: job " + record.id + " is " + JobStatus_Name(record.status));
        }
        record.status        = JOB_STATUS_RUNNING;
        record.started_at_ms = util::ToUnixMillis(util::Now());
        record.message       = "Running";
      },
      "info", "Job started");
  return Get(job_id);
}

void JobStore::UpdateProgress(const std::string& job_id, int progress, const std::string& message) {
  Mutate(
      job_id, "update progress",
      [&](db::model::JobRecord& record) {
        if (record.status != JOB_STATUS_RUNNING) {
          throw util::InvalidState("update progress: job " + record.id + " is " + JobStatus_Name(record.status));
        }
        record.progress = std::max(record.progress, std::clamp(progress, 0, 100));
        if (!message.empty()) {
          record.message = message;
        }
      },
      message.empty() ? std::string() : "info", message);
}

void JobStore::AppendLog(const std::string& job_id, const std::string& level, const std::string& message) {
  Mutate(job_id, "append log", [](db::model::JobRecord&) {}, level, message);
}

JobState JobStore::Complete(const std::string& job_id, const JobResult& result) {
  const auto json = EncodeResult(result);
  return Finish(
      job_id, JOB_STATUS_COMPLETED,
      [&](db::model::JobRecord& record) {
        if (record.status != JOB_STATUS_RUNNING) {
          throw util::InvalidState("complete job: job " + record.id + " is " + JobStatus_Name(record.status));
        }
        record.progress    = 100;
        record.message     = "Completed";
        record.result_json = json;
      },
      "info", "Job completed");
}

JobState JobStore::Fail(const std::string& job_id, const std::string& error) {
  return Finish(
      job_id, JOB_STATUS_FAILED,
      [&](db::model::JobRecord& record) {
        record.message = "Failed";
        record.error   = error;
      },
      "error", error);
}

JobState JobStore::Cancel(const std::string& job_id, const std::string& reason) {
  return Finish(
      job_id, JOB_STATUS_CANCELLED, [](db::model::JobRecord& record) { record.message = "Cancelled"; }, "warn",
      reason.empty() ? std::string("Job cancelled") : reason);
}

bool JobStore::CancelIfQueued(const std::string& job_id) {
  bool cancelled = false;
  {
    auto tx     = repository_->Begin();
    auto record = repository_->GetJob(*tx, job_id);
    if (!record) {
      throw util::NotFound("cancel job: job " + job_id + " not found");
    }
    if (record->status == JOB_STATUS_QUEUED) {
      const auto now          = util::ToUnixMillis(util::Now());
      record->status          = JOB_STATUS_CANCELLED;
      record->message         = "Cancelled";
      record->completed_at_ms = now;
      record->sequence += 1;
      db::ThrowIfDbError(repository_->UpdateJob(*tx, *record), "cancel job");

      db::model::JobLogRecord log{job_id, 0, now, "warn", "Job cancelled before start"};
      db::ThrowIfDbError(repository_->AppendJobLog(*tx, log), "cancel job: log");
      cancelled = true;
    }
    tx->Commit();
  }
  if (cancelled) {
    Notify();
  }
  return cancelled;
}

JobState JobStore::Get(const std::string& job_id) {
  auto tx     = repository_->Begin();
  auto record = repository_->GetJob(*tx, job_id);
  if (!record) {
    throw util::NotFound("job " + job_id + " not found");
  }
  auto logs = repository_->ListJobLogs(*tx, job_id);
  tx->Commit();
  return ToState(*record, logs);
}

std::vector<JobState> JobStore::List(const db::JobFilter& filter) {
  auto tx      = repository_->Begin();
  auto records = repository_->ListJobs(*tx, filter);
  tx->Commit();

  std::vector<JobState> out;
  out.reserve(records.size());
  for (const auto& record : records) {
    out.push_back(ToState(record, {}));
  }
  return out;
}

JobState JobStore::WaitForUpdate(const std::string& job_id, uint64_t after_sequence, std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (true) {
    uint64_t observed = 0;
    {
      std::lock_guard lock(notify_mutex_);
      observed = version_;
    }

    // read after sampling the version so a commit in between is not missed
    auto state = Get(job_id);
    if (state.sequence() > after_sequence || IsTerminal(state.status()) || std::chrono::steady_clock::now() >= deadline) {
      return state;
    }

    std::unique_lock lock(notify_mutex_);
    notify_cv_.wait_until(lock, deadline, [&] { return version_ != observed; });
  }
}

size_t JobStore::RecoverInterrupted() {
  std::vector<std::string> stale;
  for (auto status : {JOB_STATUS_QUEUED, JOB_STATUS_RUNNING}) {
    db::JobFilter filter;
    filter.status = status;
    filter.limit  = 0;
    for (const auto& job : List(filter)) {
      stale.push_back(job.id());
    }
  }
  for (const auto& id : stale) {
    Fail(id, "interrupted by service restart");
  }
  if (!stale.empty()) {
    MASTERPLAN_LOG_WARN("failed interrupted jobs", {observability::IntField("count", static_cast<int64_t>(stale.size()))});
  }
  return stale.size();
}

db::model::JobRecord JobStore::Mutate(const std::string& job_id, const char* what, const Mutation& mutate, const std::string& log_level,
                                      const std::string& log_message) {
  db::model::JobRecord record;
  {
    auto tx    = repository_->Begin();
    auto found = repository_->GetJob(*tx, job_id);
    if (!found) {
      throw util::NotFound(std::string(what) + ": job " + job_id + " not found");
    }
    record = std::move(*found);
    if (IsTerminal(record.status)) {
      throw util::InvalidState(std::string(what) + ": job " + job_id + " is already " + JobStatus_Name(record.status));
    }

    mutate(record);
    record.sequence += 1;
    db::ThrowIfDbError(repository_->UpdateJob(*tx, record), what);

    if (!log_message.empty()) {
      db::model::JobLogRecord log{job_id, 0, util::ToUnixMillis(util::Now()), log_level.empty() ? "info" : log_level, log_message};
      db::ThrowIfDbError(repository_->AppendJobLog(*tx, log), std::string(what) + ": log");
    }
    tx->Commit();
  }
  Notify();
  return record;
}

JobState JobStore::Finish(const std::string& job_id, JobStatus status, const Mutation& mutate, const std::string& log_level,
                          const std::string& log_message) {
  const auto record = Mutate(
      job_id, "finish job",
      [&](db::model::JobRecord& r) {
        mutate(r);
        r.status          = status;
        r.completed_at_ms = util::ToUnixMillis(util::Now());
      },
      log_level, log_message);

  MASTERPLAN_LOG_INFO("job finished", {observability::StringField("job_id", job_id), observability::StringField("status", JobStatus_Name(status)),
                                       observability::IntField("progress", record.progress)});
  return Get(job_id);
}

void JobStore::Notify() {
  {
    std::lock_guard lock(notify_mutex_);
    ++version_;
  }
  notify_cv_.notify_all();
}

} // namespace masterplan::core
