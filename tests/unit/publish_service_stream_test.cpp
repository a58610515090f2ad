#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "internal/core/job_store.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/service/publish_service.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace masterplan::release::v1;
using masterplan::core::JobStore;
using masterplan::service::PublishService;

struct Fixture {
  std::shared_ptr<JobStore> jobs = std::make_shared<JobStore>(std::make_shared<masterplan::db::memory::MemoryRepository>());
  PublishService            service{masterplan::service::ServiceContext{nullptr, jobs, nullptr}, std::chrono::milliseconds(20)};
};

void TestStreamFollowsJobToCompletion() {
  Fixture f;
  const auto job = f.jobs->Create(JOB_TYPE_PUBLISH, "harbour-view", "draft-1");

  std::thread driver([&] {
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    f.jobs->Start(job.id());
    for (int p : {10, 40, 80}) {
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
      f.jobs->UpdateProgress(job.id(), p, "step " + std::to_string(p));
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
    f.jobs->Complete(job.id(), JobResult{});
  });

  std::vector<JobState> seen;
  GetJobRequest         req;
  req.set_job_id(job.id());
  f.service.StreamJob(req, [&](const JobState& state) {
    seen.push_back(state);
    return true;
  });
  driver.join();

  assert(seen.size() >= 2);
  assert(seen.front().status() == JOB_STATUS_QUEUED);
  assert(seen.back().status() == JOB_STATUS_COMPLETED);
  assert(seen.back().progress() == 100);
  for (size_t i = 1; i < seen.size(); ++i) {
    assert(seen[i].sequence() > seen[i - 1].sequence());
    assert(seen[i].progress() >= seen[i - 1].progress());
  }
}

void TestStreamOfFinishedJobSendsOneState() {
  Fixture f;
  const auto job = f.jobs->Create(JOB_TYPE_PUBLISH, "harbour-view", "draft-1");
  f.jobs->Cancel(job.id(), "");

  int           calls = 0;
  GetJobRequest req;
  req.set_job_id(job.id());
  f.service.StreamJob(req, [&](const JobState& state) {
    ++calls;
    assert(state.status() == JOB_STATUS_CANCELLED);
    return true;
  });
  assert(calls == 1);
}

void TestStreamStopsWhenReceiverGoes() {
  Fixture f;
  const auto job = f.jobs->Create(JOB_TYPE_PUBLISH, "harbour-view", "draft-1");

  int           calls = 0;
  GetJobRequest req;
  req.set_job_id(job.id());
  // job never moves; returning false must end the stream right away
  f.service.StreamJob(req, [&](const JobState&) {
    ++calls;
    return false;
  });
  assert(calls == 1);
}

void TestQuietStreamEndsWhenReceiverGoes() {
  Fixture f;
  const auto job = f.jobs->Create(JOB_TYPE_PUBLISH, "harbour-view", "draft-1");
  f.jobs->Start(job.id());

  // the job never changes again; only the liveness check can end the stream
  std::atomic<bool> connected{true};
  std::thread       disconnect([&] {
    std::this_thread::sleep_for(std::chrono::milliseconds(60));
    connected = false;
  });

  int           sent   = 0;
  int           polled = 0;
  GetJobRequest req;
  req.set_job_id(job.id());
  f.service.StreamJob(
      req,
      [&](const JobState&) {
        ++sent;
        return true;
      },
      [&] {
        ++polled;
        return connected.load();
      });
  disconnect.join();

  assert(sent == 1);
  assert(polled >= 2);
  assert(!connected);
  assert(f.jobs->Get(job.id()).status() == JOB_STATUS_RUNNING);
}

void TestStreamRejectsBadRequests() {
  Fixture f;

  bool threw = false;
  try {
    f.service.StreamJob(GetJobRequest{}, [](const JobState&) { return true; });
  } catch (const masterplan::util::ValidationError&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  GetJobRequest req;
  req.set_job_id("missing");
  try {
    f.service.StreamJob(req, [](const JobState&) { return true; });
  } catch (const masterplan::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestListJobsAppliesFilters() {
  Fixture f;
  f.jobs->Create(JOB_TYPE_PUBLISH, "harbour-view", "draft-1");
  const auto running = f.jobs->Create(JOB_TYPE_PUBLISH, "harbour-view", "draft-2");
  f.jobs->Create(JOB_TYPE_PUBLISH, "old-town", "draft-1");
  f.jobs->Start(running.id());

  ListJobsRequest req;
  assert(f.service.ListJobs(req).jobs_size() == 3);

  req.set_project_slug("harbour-view");
  assert(f.service.ListJobs(req).jobs_size() == 2);

  req.set_status(JOB_STATUS_RUNNING);
  const auto resp = f.service.ListJobs(req);
  assert(resp.jobs_size() == 1);
  assert(resp.jobs(0).id() == running.id());

  ListJobsRequest limited;
  limited.set_limit(2);
  assert(f.service.ListJobs(limited).jobs_size() == 2);
}

} // namespace

int main() {
  TestStreamFollowsJobToCompletion();
  TestStreamOfFinishedJobSendsOneState();
  TestStreamStopsWhenReceiverGoes();
  TestQuietStreamEndsWhenReceiverGoes();
  TestStreamRejectsBadRequests();
  TestListJobsAppliesFilters();

  std::cout << "masterplan_unit_publish_service_stream: pass\n";
  return 0;
}
