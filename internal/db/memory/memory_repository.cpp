#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace masterplan::db::memory {

using masterplan::release::v1::JOB_STATUS_QUEUED;
using masterplan::release::v1::JOB_STATUS_RUNNING;

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Jobs
// ------------------------------------------------------------------

Result MemoryRepository::InsertJob(Transaction& t, const model::JobRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.jobs.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "job " + r.id);
  s.jobs[r.id] = r;
  s.job_order.push_back(r.id);
  return Result::Ok();
}

Result MemoryRepository::UpdateJob(Transaction& t, const model::JobRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  it = s.jobs.find(r.id);
  if (it == s.jobs.end()) return Result::Err(ErrorCode::NotFound, "job " + r.id);
  it->second = r;
  return Result::Ok();
}

std::optional<model::JobRecord> MemoryRepository::GetJob(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.jobs.find(id);
  if (it == s.jobs.end()) return std::nullopt;
  return it->second;
}

std::vector<model::JobRecord> MemoryRepository::ListJobs(Transaction& t, const JobFilter& filter) {
  const auto&                   s = TX(t).View();
  std::vector<model::JobRecord> out;
  for (auto it = s.job_order.rbegin(); it != s.job_order.rend() && (filter.limit == 0 || out.size() < filter.limit); ++it) {
    const auto& job = s.jobs.at(*it);
    if (!filter.project_slug.empty() && job.project_slug != filter.project_slug) continue;
    if (filter.status && job.status != *filter.status) continue;
    out.push_back(job);
  }
  return out;
}

std::optional<model::JobRecord> MemoryRepository::FindActiveJob(Transaction& t, const std::string& project_slug, const std::string& draft_id,
                                                                masterplan::release::v1::JobType type) {
  for (const auto& [_, job] : TX(t).View().jobs) {
    if (job.project_slug == project_slug && (draft_id.empty() || job.draft_id == draft_id) && job.type == type &&
        (job.status == JOB_STATUS_QUEUED || job.status == JOB_STATUS_RUNNING)) {
      return job;
    }
  }
  return std::nullopt;
}

Result MemoryRepository::AppendJobLog(Transaction& t, model::JobLogRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.jobs.contains(r.job_id)) return Result::Err(ErrorCode::NotFound, "job " + r.job_id);
  auto& logs = s.job_logs[r.job_id];
  r.position = logs.size();
  logs.push_back(r);
  return Result::Ok();
}

std::vector<model::JobLogRecord> MemoryRepository::ListJobLogs(Transaction& t, const std::string& job_id) {
  const auto& s  = TX(t).View();
  auto        it = s.job_logs.find(job_id);
  if (it == s.job_logs.end()) return {};
  return it->second;
}

// ------------------------------------------------------------------
// Releases
// ------------------------------------------------------------------

Result MemoryRepository::InsertRelease(Transaction& t, const model::ReleaseRecord& r) {
  auto& project = TX(t).Mutable().releases[r.project_slug];
  for (const auto& existing : project) {
    if (existing.release_id == r.release_id) return Result::Err(ErrorCode::AlreadyExists, "release " + r.release_id);
  }
  project.push_back(r);
  return Result::Ok();
}

std::optional<model::ReleaseRecord> MemoryRepository::GetRelease(Transaction& t, const std::string& project_slug, const std::string& release_id) {
  const auto& s  = TX(t).View();
  auto        it = s.releases.find(project_slug);
  if (it == s.releases.end()) return std::nullopt;
  for (const auto& r : it->second)
    if (r.release_id == release_id) return r;
  return std::nullopt;
}

std::vector<model::ReleaseRecord> MemoryRepository::ListReleases(Transaction& t, const std::string& project_slug) {
  const auto& s  = TX(t).View();
  auto        it = s.releases.find(project_slug);
  if (it == s.releases.end()) return {};
  return std::vector<model::ReleaseRecord>(it->second.rbegin(), it->second.rend());
}

Result MemoryRepository::SetCurrentRelease(Transaction& t, const model::CurrentReleaseRecord& r) {
  TX(t).Mutable().current[r.project_slug] = r;
  return Result::Ok();
}

std::optional<model::CurrentReleaseRecord> MemoryRepository::GetCurrentRelease(Transaction& t, const std::string& project_slug) {
  const auto& s  = TX(t).View();
  auto        it = s.current.find(project_slug);
  if (it == s.current.end()) return std::nullopt;
  return it->second;
}

} // namespace masterplan::db::memory
