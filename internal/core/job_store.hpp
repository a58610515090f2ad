#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "masterplan/release/v1.hpp"

namespace masterplan::core {

bool IsTerminal(masterplan::release::v1::JobStatus status);

/*
  Owner of all job state.

  Every mutation is one repository transaction that also bumps the job's
  sequence number; waiters are woken only after the commit, so anything
  a watcher observes is already durable.

  Status moves queued → running → {completed | failed | cancelled}, or
  queued → {failed | cancelled}. Terminal jobs never change again and
  progress never goes backwards.
*/
class JobStore {
 public:
  explicit JobStore(std::shared_ptr<db::Repository> repository);

  /*
    Creates a queued job. Throws util::ConcurrencyError when a queued or
    running job of the same type already exists for the draft.
  */
  masterplan::release::v1::JobState Create(masterplan::release::v1::JobType type, const std::string& project_slug, const std::string& draft_id);

  // queued → running. Throws util::InvalidState otherwise.
  masterplan::release::v1::JobState Start(const std::string& job_id);

  // Clamped to [0, 100] and never below the stored value.
  void UpdateProgress(const std::string& job_id, int progress, const std::string& message);

  void AppendLog(const std::string& job_id, const std::string& level, const std::string& message);

  masterplan::release::v1::JobState Complete(const std::string& job_id, const masterplan::release::v1::JobResult& result);
  masterplan::release::v1::JobState Fail(const std::string& job_id, const std::string& error);
  masterplan::release::v1::JobState Cancel(const std::string& job_id, const std::string& reason);

  // Cancels only while still queued; returns false if the job has left that state.
  bool CancelIfQueued(const std::string& job_id);

  // Throws util::NotFound.
  masterplan::release::v1::JobState Get(const std::string& job_id);

  // Newest first, without log lines.
  std::vector<masterplan::release::v1::JobState> List(const db::JobFilter& filter);

  /*
    Returns as soon as the job's sequence exceeds after_sequence, the job
    is terminal, or the timeout passes, whichever is first.
  */
  masterplan::release::v1::JobState WaitForUpdate(const std::string& job_id, uint64_t after_sequence, std::chrono::milliseconds timeout);

  // Fails queued/running jobs left behind by a previous process.
  size_t RecoverInterrupted();

 private:
  using Mutation = std::function<void(db::model::JobRecord&)>;

  // Loads, checks `from`, mutates, bumps sequence, logs a line, commits, notifies.
  db::model::JobRecord Mutate(const std::string& job_id, const char* what, const Mutation& mutate, const std::string& log_level = {},
                              const std::string& log_message = {});

  masterplan::release::v1::JobState Finish(const std::string& job_id, masterplan::release::v1::JobStatus status, const Mutation& mutate,
                                           const std::string& log_level, const std::string& log_message);

  void Notify();

  std::shared_ptr<db::Repository> repository_;

  std::mutex              notify_mutex_;
  std::condition_variable notify_cv_;
  uint64_t                version_ = 0;
};

} // namespace masterplan::core
