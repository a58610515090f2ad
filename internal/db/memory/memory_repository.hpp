#pragma once

#include <mutex>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace masterplan::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

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
  friend class MemoryTransaction;

  struct State {
    std::unordered_map<std::string, model::JobRecord> jobs;
    std::vector<std::string> job_order; // insertion order
    std::unordered_map<std::string, std::vector<model::JobLogRecord>> job_logs;

    std::unordered_map<std::string, std::vector<model::ReleaseRecord>> releases; // by project, insertion order
    std::unordered_map<std::string, model::CurrentReleaseRecord> current;
  };

  // held for the lifetime of a transaction
  std::mutex tx_mutex_;

  std::mutex mutex_;
  State      committed_;
  uint64_t   committed_version_ = 0;
};

}
