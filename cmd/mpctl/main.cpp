#include <grpcpp/grpcpp.h>

#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include "masterplan/release/v1.hpp"

using namespace masterplan::release::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  mpctl <addr> validate <project> <draft>\n"
            << "  mpctl <addr> publish <project> <draft> [published_by]\n"
            << "  mpctl <addr> tiles <project> <draft>\n"
            << "  mpctl <addr> job <job_id>\n"
            << "  mpctl <addr> watch <job_id>\n"
            << "  mpctl <addr> jobs [project] [status=queued|running|completed|failed|cancelled]\n"
            << "  mpctl <addr> cancel <job_id>\n"
            << "  mpctl <addr> releases <project>\n"
            << "  mpctl <addr> current <project>\n"
            << "  mpctl <addr> rollback <project> <release_id>\n";
}

static std::optional<JobStatus> ParseStatus(const std::string& value) {
  if (value == "queued") return JOB_STATUS_QUEUED;
  if (value == "running") return JOB_STATUS_RUNNING;
  if (value == "completed") return JOB_STATUS_COMPLETED;
  if (value == "failed") return JOB_STATUS_FAILED;
  if (value == "cancelled") return JOB_STATUS_CANCELLED;
  return std::nullopt;
}

static DraftRef MakeDraft(const std::string& project, const std::string& draft_id) {
  DraftRef ref;
  ref.set_project_slug(project);
  ref.set_draft_id(draft_id);
  return ref;
}

static void PrintJob(const JobState& job) {
  std::cout << "job=" << job.id() << " status=" << JobStatus_Name(job.status()) << " progress=" << job.progress() << " message=\""
            << job.message() << "\"\n";
  if (!job.error().empty()) {
    std::cout << "error=" << job.error() << "\n";
  }
  if (job.status() == JOB_STATUS_COMPLETED) {
    const auto& r = job.result();
    if (!r.release_id().empty()) std::cout << "release_id=" << r.release_id() << "\n";
    if (!r.manifest_key().empty()) std::cout << "manifest=" << r.manifest_key() << "\n";
    if (!r.checksum().empty()) std::cout << "checksum=" << r.checksum() << "\n";
    std::cout << "tiles=" << r.tile_count() << " levels=" << r.levels() << " size=" << r.width() << "x" << r.height() << "\n";
    for (const auto& issue : r.geometry_errors()) {
      std::cout << "geometry_error " << issue.element_id() << ": " << issue.message() << "\n";
    }
  }
}

static void PrintRelease(const ReleaseSummary& release) {
  std::cout << (release.is_current() ? "* " : "  ") << release.release_id() << " draft=" << release.draft_id()
            << " overlays=" << release.overlay_count() << " tiles=" << release.tile_count() << " checksum=" << release.checksum() << "\n";
}

static int Fail(const grpc::Status& status) {
  std::cerr << status.error_message() << "\n";
  return 2;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());
  auto stub    = PublishService::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------

  if (cmd == "validate") {
    if (argc < 5) return 1;

    ValidatePublishRequest req;
    *req.mutable_draft() = MakeDraft(argv[3], argv[4]);

    ValidatePublishResponse resp;
    auto status = stub->ValidatePublish(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "valid=" << (resp.valid() ? "true" : "false") << "\n";
    for (const auto& error : resp.errors()) {
      std::cout << "error: " << error << "\n";
    }
    return resp.valid() ? 0 : 3;
  }

  // ------------------------------------------------------------

  if (cmd == "publish") {
    if (argc < 5) return 1;

    StartPublishRequest req;
    *req.mutable_draft() = MakeDraft(argv[3], argv[4]);
    if (argc >= 6) req.set_published_by(argv[5]);

    StartJobResponse resp;
    auto status = stub->StartPublish(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "job=" << resp.job_id() << " status=" << JobStatus_Name(resp.status()) << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "tiles") {
    if (argc < 5) return 1;

    StartTileGenerationRequest req;
    *req.mutable_draft() = MakeDraft(argv[3], argv[4]);

    StartJobResponse resp;
    auto status = stub->StartTileGeneration(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "job=" << resp.job_id() << " status=" << JobStatus_Name(resp.status()) << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "job") {
    if (argc < 4) return 1;

    GetJobRequest req;
    req.set_job_id(argv[3]);

    JobState resp;
    auto status = stub->GetJob(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintJob(resp);
    for (const auto& log : resp.logs()) {
      std::cout << log.timestamp() << " [" << log.level() << "] " << log.message() << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "watch") {
    if (argc < 4) return 1;

    GetJobRequest req;
    req.set_job_id(argv[3]);

    auto reader = stub->StreamJob(&ctx, req);

    JobState state;
    int      printed_logs = 0;
    while (reader->Read(&state)) {
      for (int i = printed_logs; i < state.logs_size(); ++i) {
        const auto& log = state.logs(i);
        std::cout << log.timestamp() << " [" << log.level() << "] " << log.message() << "\n";
      }
      printed_logs = state.logs_size();
      std::cout << "progress=" << state.progress() << "\n";
    }

    auto status = reader->Finish();
    if (!status.ok()) return Fail(status);

    PrintJob(state);
    return state.status() == JOB_STATUS_COMPLETED ? 0 : 3;
  }

  // ------------------------------------------------------------

  if (cmd == "jobs") {
    ListJobsRequest req;
    if (argc >= 4) req.set_project_slug(argv[3]);
    if (argc >= 5) {
      auto parsed = ParseStatus(argv[4]);
      if (!parsed.has_value()) {
        std::cerr << "unsupported status: " << argv[4] << "\n";
        return 1;
      }
      req.set_status(parsed.value());
    }

    ListJobsResponse resp;
    auto status = stub->ListJobs(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& job : resp.jobs()) {
      std::cout << job.id() << " " << JobType_Name(job.type()) << " " << job.project_slug() << "/" << job.draft_id() << " "
                << JobStatus_Name(job.status()) << " " << job.progress() << "%\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "cancel") {
    if (argc < 4) return 1;

    CancelJobRequest req;
    req.set_job_id(argv[3]);

    JobState resp;
    auto status = stub->CancelJob(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintJob(resp);
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "releases") {
    if (argc < 4) return 1;

    ListReleasesRequest req;
    req.set_project_slug(argv[3]);

    ListReleasesResponse resp;
    auto status = stub->ListReleases(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& release : resp.releases()) {
      PrintRelease(release);
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "current") {
    if (argc < 4) return 1;

    GetCurrentReleaseRequest req;
    req.set_project_slug(argv[3]);

    ReleaseSummary resp;
    auto status = stub->GetCurrentRelease(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintRelease(resp);
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "rollback") {
    if (argc < 5) return 1;

    RollbackRequest req;
    req.set_project_slug(argv[3]);
    req.set_release_id(argv[4]);

    ReleaseSummary resp;
    auto status = stub->Rollback(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "current=" << resp.release_id() << "\n";
    return 0;
  }

  Usage();
  return 1;
}
