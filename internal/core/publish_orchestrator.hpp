#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/core/draft_catalog.hpp"
#include "internal/core/job_store.hpp"
#include "internal/geometry/geometry_importer.hpp"
#include "internal/release/release_assembler.hpp"
#include "internal/runtime/cancellation.hpp"
#include "internal/runtime/worker_pool.hpp"
#include "internal/storage/blob_store.hpp"
#include "internal/tiling/tile_pyramid.hpp"
#include "masterplan/release/v1.hpp"

namespace masterplan::core {

/*
  Drives publish and tile-generation jobs.

  Publish pipeline and its progress slices:

      validate              0 → 10
      tiles  ∥  geometry   10 → 80   (tiles on the job thread, SVG import
                                      on the encode pool)
      assemble + upload    80 → 100

  Jobs run on the job pool; each owns a CancellationToken that is checked
  between stages and at tile-level boundaries. Pyramid output goes to
  scratch under jobs/{job_id}/ and is always removed when the job ends.

  JobStore is written only from here (and from Cancel for queued jobs).
*/
class PublishOrchestrator {
 public:
  struct Options {
    tiling::TileOptions tile_defaults;
    double              label_precision      = 1.0;
    double              curve_tolerance      = 0.5;
    bool                write_dzi_descriptor = true;
    std::string         default_published_by = "system";
  };

  PublishOrchestrator(std::shared_ptr<JobStore> jobs, std::shared_ptr<DraftCatalog> drafts, std::shared_ptr<release::ReleaseAssembler> assembler,
                      storage::BlobStorePtr assets, storage::BlobStorePtr scratch, runtime::WorkerPool& job_pool,
                      runtime::WorkerPool& encode_pool, Options options);

  /*
    Queues a publish of the draft. Throws util::NotFound for an unknown
    draft and util::ConcurrencyError while another publish of the same
    draft is queued or running; no job is created in either case.
  */
  masterplan::release::v1::JobState StartPublish(const std::string& project_slug, const std::string& draft_id, const std::string& published_by);

  // Builds the pyramid into {project}/uploads/tiles without publishing.
  masterplan::release::v1::JobState StartTileGeneration(const std::string& project_slug, const std::string& draft_id);

  // Same checks as the validate stage; no side effects.
  std::vector<std::string> ValidatePublish(const std::string& project_slug, const std::string& draft_id);

  // Throws util::InvalidState for a job that already finished.
  masterplan::release::v1::JobState Cancel(const std::string& job_id);

  // Cancels every live job; used on shutdown before the pools drain.
  void CancelAll();

 private:
  using JobBody = std::function<masterplan::release::v1::JobResult(const std::string& job_id, const runtime::CancellationToken& cancel)>;

  masterplan::release::v1::JobState Launch(masterplan::release::v1::JobType type, const std::string& project_slug, const std::string& draft_id,
                                           JobBody body);

  void Execute(const std::string& job_id, const std::shared_ptr<runtime::CancellationToken>& token, const JobBody& body);

  masterplan::release::v1::JobResult RunPublish(const std::string& job_id, const masterplan::release::v1::Draft& draft,
                                                const std::string& published_by, const runtime::CancellationToken& cancel);

  masterplan::release::v1::JobResult RunTileGeneration(const std::string& job_id, const masterplan::release::v1::Draft& draft,
                                                       const runtime::CancellationToken& cancel);

  geometry::ImportResult ImportGeometry(const std::string& job_id, const masterplan::release::v1::Draft& draft);

  std::vector<std::string> Preflight(const masterplan::release::v1::Draft& draft, bool for_publish);

  tiling::TileOptions ResolveTileOptions(const masterplan::release::v1::Draft& draft) const;

  std::shared_ptr<arrow::Buffer> ReadAsset(const std::string& project_slug, const std::string& key, const char* what);

  std::shared_ptr<JobStore>                  jobs_;
  std::shared_ptr<DraftCatalog>              drafts_;
  std::shared_ptr<release::ReleaseAssembler> assembler_;
  storage::BlobStorePtr                      assets_;
  storage::BlobStorePtr                      scratch_;
  runtime::WorkerPool&                       job_pool_;
  runtime::WorkerPool&                       encode_pool_;
  Options                                    options_;

  std::mutex                                                                  active_mutex_;
  std::unordered_map<std::string, std::shared_ptr<runtime::CancellationToken>> active_;
};

} // namespace masterplan::core
