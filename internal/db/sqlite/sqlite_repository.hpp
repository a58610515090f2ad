#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace masterplan::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result InsertJob(Transaction&, const model::JobRecord&) override;
  Result UpdateJob(Transaction&, const model::JobRecord&) override;
  std::optional<model::JobRecord> GetJob(Transaction&, const std::string&) override;
  std::vector<model::JobRecord> ListJobs(Transaction&, const JobFilter&) override;
  std::optional<model::JobRecord> FindActiveJob(Transaction&, const std::string& project_slug,
                                                const std::string& draft_id,
                                                masterplan::release::v1::JobType type) override;
  Result AppendJobLog(Transaction&, model::JobLogRecord&) override;
  std::vector<model::JobLogRecord> ListJobLogs(Transaction&, const std::string& job_id) override;

  Result InsertRelease(Transaction&, const model::ReleaseRecord&) override;
  std::optional<model::ReleaseRecord> GetRelease(Transaction&, const std::string& project_slug,
                                                 const std::string& release_id) override;
  std::vector<model::ReleaseRecord> ListReleases(Transaction&, const std::string& project_slug) override;
  Result SetCurrentRelease(Transaction&, const model::CurrentReleaseRecord&) override;
  std::optional<model::CurrentReleaseRecord> GetCurrentRelease(Transaction&, const std::string& project_slug) override;

private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
