#include <cassert>
#include <chrono>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/model/job_log_record.hpp"
#include "internal/db/model/job_record.hpp"
#include "internal/db/model/release_record.hpp"

#if MASTERPLAN_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

namespace {

using masterplan::db::ErrorCode;
using masterplan::db::JobFilter;
using masterplan::db::Repository;
using masterplan::db::memory::MemoryRepository;
using masterplan::db::model::CurrentReleaseRecord;
using masterplan::db::model::JobLogRecord;
using masterplan::db::model::JobRecord;
using masterplan::db::model::ReleaseRecord;
using namespace masterplan::release::v1;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
};

JobRecord MakeJob(const std::string& id, const std::string& draft_id, JobStatus status = JOB_STATUS_QUEUED) {
  JobRecord job;
  job.id            = id;
  job.type          = JOB_TYPE_PUBLISH;
  job.status        = status;
  job.project_slug  = "harbour-view";
  job.draft_id      = draft_id;
  job.message       = "Queued";
  job.created_at_ms = NowMs();
  job.sequence      = 1;
  return job;
}

ReleaseRecord MakeRelease(const std::string& release_id, uint64_t published_at_ms) {
  return ReleaseRecord{
      .release_id      = release_id,
      .project_slug    = "harbour-view",
      .draft_id        = "draft-1",
      .manifest_key    = "harbour-view/releases/" + release_id + "/release.json",
      .checksum        = "sha256:" + std::string(64, 'a'),
      .published_by    = "planner@example.com",
      .overlay_count   = 12,
      .tile_count      = 341,
      .published_at_ms = published_at_ms,
  };
}

void VerifyJobRoundTrip(Repository& repo) {
  {
    auto tx = repo.Begin();
    assert(repo.InsertJob(*tx, MakeJob("job-a", "draft-1")));
    auto dup = repo.InsertJob(*tx, MakeJob("job-a", "draft-1"));
    assert(!dup && dup.code == ErrorCode::AlreadyExists);
    tx->Commit();
  }

  {
    auto tx  = repo.Begin();
    auto job = repo.GetJob(*tx, "job-a");
    assert(job.has_value());
    assert(job->status == JOB_STATUS_QUEUED);
    assert(job->started_at_ms == 0);

    job->status          = JOB_STATUS_COMPLETED;
    job->progress        = 100;
    job->result_json     = R"({"release_id":"rel_x"})";
    job->started_at_ms   = job->created_at_ms + 5;
    job->completed_at_ms = job->created_at_ms + 10;
    job->sequence        = 7;
    assert(repo.UpdateJob(*tx, *job));

    auto missing = repo.UpdateJob(*tx, MakeJob("job-missing", "draft-1"));
    assert(!missing && missing.code == ErrorCode::NotFound);
    tx->Commit();
  }

  auto tx  = repo.Begin();
  auto job = repo.GetJob(*tx, "job-a");
  assert(job.has_value());
  assert(job->status == JOB_STATUS_COMPLETED);
  assert(job->progress == 100);
  assert(job->result_json == R"({"release_id":"rel_x"})");
  assert(job->completed_at_ms == job->created_at_ms + 10);
  assert(job->sequence == 7);
  assert(!repo.GetJob(*tx, "job-missing").has_value());
  tx->Commit();
}

void VerifyListAndActiveLookup(Repository& repo) {
  {
    auto tx = repo.Begin();
    assert(repo.InsertJob(*tx, MakeJob("job-1", "draft-1", JOB_STATUS_FAILED)));
    assert(repo.InsertJob(*tx, MakeJob("job-2", "draft-1", JOB_STATUS_RUNNING)));
    auto other         = MakeJob("job-3", "draft-2");
    other.project_slug = "old-town";
    assert(repo.InsertJob(*tx, other));
    tx->Commit();
  }

  auto tx = repo.Begin();

  const auto all = repo.ListJobs(*tx, JobFilter{});
  assert(all.size() == 3);
  assert(all[0].id == "job-3");
  assert(all[2].id == "job-1");

  JobFilter by_project;
  by_project.project_slug = "harbour-view";
  assert(repo.ListJobs(*tx, by_project).size() == 2);

  JobFilter by_status;
  by_status.status = JOB_STATUS_RUNNING;
  const auto running = repo.ListJobs(*tx, by_status);
  assert(running.size() == 1 && running[0].id == "job-2");

  JobFilter limited;
  limited.limit = 2;
  assert(repo.ListJobs(*tx, limited).size() == 2);
  limited.limit = 0;
  assert(repo.ListJobs(*tx, limited).size() == 3);

  auto active = repo.FindActiveJob(*tx, "harbour-view", "draft-1", JOB_TYPE_PUBLISH);
  assert(active && active->id == "job-2");
  assert(!repo.FindActiveJob(*tx, "harbour-view", "draft-1", JOB_TYPE_TILE_GENERATION));
  assert(!repo.FindActiveJob(*tx, "harbour-view", "draft-9", JOB_TYPE_PUBLISH));
  assert(repo.FindActiveJob(*tx, "old-town", "draft-2", JOB_TYPE_PUBLISH));
  auto any_draft = repo.FindActiveJob(*tx, "harbour-view", "", JOB_TYPE_PUBLISH);
  assert(any_draft && any_draft->project_slug == "harbour-view");
  assert(!repo.FindActiveJob(*tx, "nowhere", "", JOB_TYPE_PUBLISH));
  tx->Commit();
}

void VerifyLogPositions(Repository& repo) {
  {
    auto tx = repo.Begin();
    assert(repo.InsertJob(*tx, MakeJob("job-log", "draft-1")));
    for (const char* message : {"Job queued", "Job started", "Generating tiles"}) {
      JobLogRecord log{"job-log", 99, NowMs(), "info", message};
      assert(repo.AppendJobLog(*tx, log));
    }
    tx->Commit();
  }
  {
    auto         tx = repo.Begin();
    JobLogRecord log{"job-log", 0, NowMs(), "warn", "Skipped element 'x'"};
    assert(repo.AppendJobLog(*tx, log));
    assert(log.position == 3);

    JobLogRecord orphan{"job-none", 0, NowMs(), "info", "nobody"};
    auto         result = repo.AppendJobLog(*tx, orphan);
    assert(!result && result.code == ErrorCode::NotFound);
    tx->Commit();
  }

  auto       tx   = repo.Begin();
  const auto logs = repo.ListJobLogs(*tx, "job-log");
  assert(logs.size() == 4);
  for (size_t i = 0; i < logs.size(); ++i) {
    assert(logs[i].position == i);
  }
  assert(logs[2].message == "Generating tiles");
  assert(logs[3].level == "warn");
  assert(repo.ListJobLogs(*tx, "job-none").empty());
  tx->Commit();
}

void VerifyReleasesAndCurrentPointer(Repository& repo) {
  const auto now = NowMs();
  {
    auto tx = repo.Begin();
    assert(!repo.GetCurrentRelease(*tx, "harbour-view").has_value());
    assert(repo.InsertRelease(*tx, MakeRelease("rel_20240501120000_00000001", now)));
    assert(repo.InsertRelease(*tx, MakeRelease("rel_20240501130000_00000002", now + 1)));
    auto dup = repo.InsertRelease(*tx, MakeRelease("rel_20240501120000_00000001", now));
    assert(!dup && dup.code == ErrorCode::AlreadyExists);
    assert(repo.SetCurrentRelease(*tx, CurrentReleaseRecord{"harbour-view", "rel_20240501130000_00000002", now + 1}));
    tx->Commit();
  }

  {
    auto       tx      = repo.Begin();
    const auto history = repo.ListReleases(*tx, "harbour-view");
    assert(history.size() == 2);
    assert(history[0].release_id == "rel_20240501130000_00000002");
    assert(history[1].published_by == "planner@example.com");
    assert(history[1].tile_count == 341);
    assert(repo.ListReleases(*tx, "old-town").empty());

    auto one = repo.GetRelease(*tx, "harbour-view", "rel_20240501120000_00000001");
    assert(one && one->overlay_count == 12);
    assert(!repo.GetRelease(*tx, "old-town", "rel_20240501120000_00000001"));

    // rollback only moves the pointer
    assert(repo.SetCurrentRelease(*tx, CurrentReleaseRecord{"harbour-view", "rel_20240501120000_00000001", now + 2}));
    tx->Commit();
  }

  auto tx      = repo.Begin();
  auto current = repo.GetCurrentRelease(*tx, "harbour-view");
  assert(current && current->release_id == "rel_20240501120000_00000001");
  assert(current->updated_at_ms == now + 2);
  assert(repo.ListReleases(*tx, "harbour-view").size() == 2);
  tx->Commit();
}

void VerifyUncommittedWritesAreDiscarded(Repository& repo) {
  {
    auto tx = repo.Begin();
    assert(repo.InsertJob(*tx, MakeJob("job-rolled-back", "draft-1")));
    assert(repo.GetJob(*tx, "job-rolled-back").has_value());
    tx->Rollback();
  }
  {
    // destructor without Commit also rolls back
    auto tx = repo.Begin();
    assert(repo.InsertRelease(*tx, MakeRelease("rel_20240501140000_00000003", NowMs())));
  }

  auto tx = repo.Begin();
  assert(!repo.GetJob(*tx, "job-rolled-back").has_value());
  assert(!repo.GetRelease(*tx, "harbour-view", "rel_20240501140000_00000003").has_value());
  tx->Commit();
}

void VerifyRestartDurability(BackendFactory& backend) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo = backend.make_repository();
  {
    auto tx  = repo->Begin();
    auto job = MakeJob("job-durable", "draft-1", JOB_STATUS_RUNNING);
    assert(repo->InsertJob(*tx, job));
    JobLogRecord log{"job-durable", 0, NowMs(), "info", "Job started"};
    assert(repo->AppendJobLog(*tx, log));
    assert(repo->InsertRelease(*tx, MakeRelease("rel_20240501150000_00000004", NowMs())));
    assert(repo->SetCurrentRelease(*tx, CurrentReleaseRecord{"harbour-view", "rel_20240501150000_00000004", NowMs()}));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx  = repo->Begin();
  auto job = repo->GetJob(*tx, "job-durable");
  assert(job && job->status == JOB_STATUS_RUNNING);
  assert(repo->ListJobLogs(*tx, "job-durable").size() == 1);
  auto current = repo->GetCurrentRelease(*tx, "harbour-view");
  assert(current && current->release_id == "rel_20240501150000_00000004");

  // a restarted service finds the interrupted job
  JobFilter running;
  running.status = JOB_STATUS_RUNNING;
  assert(repo->ListJobs(*tx, running).size() >= 1);
  tx->Commit();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_repository  = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<Repository>&) {},
      .cleanup          = []() {},
  };
}

#if MASTERPLAN_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("masterplan_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() {
    auto db = std::make_shared<masterplan::db::sqlite::SqliteDB>(db_path);
    db->Configure();
    db->BootstrapSchema();
    return std::make_shared<masterplan::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) {
        repo.reset();
        repo = make_repo();
      },
      .cleanup = [db_path]() {
        std::filesystem::remove(db_path);
        std::filesystem::remove(db_path + "-wal");
        std::filesystem::remove(db_path + "-shm");
      },
  };
}
#endif

void RunBackend(BackendFactory backend) {
  {
    auto repo = backend.make_repository();
    VerifyJobRoundTrip(*repo);
  }
  backend.cleanup();
  {
    auto repo = backend.make_repository();
    VerifyListAndActiveLookup(*repo);
    VerifyLogPositions(*repo);
    VerifyReleasesAndCurrentPointer(*repo);
    VerifyUncommittedWritesAreDiscarded(*repo);
  }
  backend.cleanup();

  VerifyRestartDurability(backend);
  backend.cleanup();

  std::cout << "  " << backend.name << ": ok\n";
}

} // namespace

int main() {
  RunBackend(MakeMemoryFactory());
#if MASTERPLAN_DB_SQLITE
  RunBackend(MakeSqliteFactory());
#endif

  std::cout << "masterplan_integration_repository_parity: pass\n";
  return 0;
}
