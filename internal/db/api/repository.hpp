#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/job_log_record.hpp"
#include "internal/db/model/job_record.hpp"
#include "internal/db/model/release_record.hpp"

namespace masterplan::db {

struct JobFilter {
  std::string                                       project_slug; // empty = any
  std::optional<masterplan::release::v1::JobStatus> status;
  size_t                                            limit = 100; // 0 = unlimited
};

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - Job log positions are assigned atomically and never reused

  The DB is the source of truth for:
    job state and logs
    release history
    the current release pointer
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Jobs
  // ---------------------------------------------------------------------

  virtual Result InsertJob(Transaction&, const model::JobRecord&) = 0;

  virtual Result UpdateJob(Transaction&, const model::JobRecord&) = 0;

  virtual std::optional<model::JobRecord> GetJob(Transaction&, const std::string& id) = 0;

  // Newest first.
  virtual std::vector<model::JobRecord> ListJobs(Transaction&, const JobFilter& filter) = 0;

  // A queued or running job of the given type for the draft, if any.
  // An empty draft_id matches every draft of the project.
  virtual std::optional<model::JobRecord> FindActiveJob(Transaction&, const std::string& project_slug, const std::string& draft_id,
                                                        masterplan::release::v1::JobType type) = 0;

  // Assigns record.position.
  virtual Result AppendJobLog(Transaction&, model::JobLogRecord& record) = 0;

  virtual std::vector<model::JobLogRecord> ListJobLogs(Transaction&, const std::string& job_id) = 0;

  // ---------------------------------------------------------------------
  // Releases
  // ---------------------------------------------------------------------

  virtual Result InsertRelease(Transaction&, const model::ReleaseRecord&) = 0;

  virtual std::optional<model::ReleaseRecord> GetRelease(Transaction&, const std::string& project_slug, const std::string& release_id) = 0;

  // Newest first.
  virtual std::vector<model::ReleaseRecord> ListReleases(Transaction&, const std::string& project_slug) = 0;

  virtual Result SetCurrentRelease(Transaction&, const model::CurrentReleaseRecord&) = 0;

  virtual std::optional<model::CurrentReleaseRecord> GetCurrentRelease(Transaction&, const std::string& project_slug) = 0;
};

} // namespace masterplan::db
