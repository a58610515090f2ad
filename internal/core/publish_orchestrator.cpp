#include "publish_orchestrator.hpp"

#include <cstdint>
#include <future>
#include <optional>
#include <regex>
#include <set>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/tiling/dzi.hpp"
#include "internal/tiling/tile_pyramid_generator.hpp"
#include "internal/util/errors.hpp"

namespace masterplan::core {

using namespace masterplan::release::v1;
using observability::IntField;
using observability::StringField;

namespace {

// Removes a job's scratch prefix when the pipeline leaves scope.
class ScratchCleanup {
 public:
  ScratchCleanup(storage::BlobStore& scratch, std::string prefix) : scratch_(scratch), prefix_(std::move(prefix)) {
  }

  ~ScratchCleanup() {
    try {
      scratch_.RemovePrefix(prefix_);
    } catch (const std::exception& e) {
      MASTERPLAN_LOG_WARN("scratch cleanup failed", {StringField("prefix", prefix_), StringField("error", e.what())});
    }
  }

  ScratchCleanup(const ScratchCleanup&)            = delete;
  ScratchCleanup& operator=(const ScratchCleanup&) = delete;

 private:
  storage::BlobStore& scratch_;
  std::string         prefix_;
};

// Maps a 0-100 stage percentage into [from, to].
int Slice(int percent, int from, int to) {
  return from + percent * (to - from) / 100;
}

} // namespace

PublishOrchestrator::PublishOrchestrator(std::shared_ptr<JobStore> jobs, std::shared_ptr<DraftCatalog> drafts,
                                         std::shared_ptr<release::ReleaseAssembler> assembler, storage::BlobStorePtr assets,
                                         storage::BlobStorePtr scratch, runtime::WorkerPool& job_pool, runtime::WorkerPool& encode_pool,
                                         Options options)
    : jobs_(std::move(jobs)),
      drafts_(std::move(drafts)),
      assembler_(std::move(assembler)),
      assets_(std::move(assets)),
      scratch_(std::move(scratch)),
      job_pool_(job_pool),
      encode_pool_(encode_pool),
      options_(std::move(options)) {
}

// ---------------------------------------------------------------------
// Entry points
// ---------------------------------------------------------------------

JobState PublishOrchestrator::StartPublish(const std::string& project_slug, const std::string& draft_id, const std::string& published_by) {
  auto       draft     = drafts_->Load(project_slug, draft_id);
  const auto publisher = published_by.empty() ? options_.default_published_by : published_by;
  return Launch(JOB_TYPE_PUBLISH, project_slug, draft_id, [this, draft = std::move(draft), publisher](const std::string& job_id, const runtime::CancellationToken& cancel) {
    return RunPublish(job_id, draft, publisher, cancel);
  });
}

JobState PublishOrchestrator::StartTileGeneration(const std::string& project_slug, const std::string& draft_id) {
  auto draft = drafts_->Load(project_slug, draft_id);
  return Launch(JOB_TYPE_TILE_GENERATION, project_slug, draft_id,
                [this, draft = std::move(draft)](const std::string& job_id, const runtime::CancellationToken& cancel) {
                  return RunTileGeneration(job_id, draft, cancel);
                });
}

std::vector<std::string> PublishOrchestrator::ValidatePublish(const std::string& project_slug, const std::string& draft_id) {
  return Preflight(drafts_->Load(project_slug, draft_id), true);
}

JobState PublishOrchestrator::Cancel(const std::string& job_id) {
  auto state = jobs_->Get(job_id);
  if (IsTerminal(state.status())) {
    throw util::InvalidState("cancel job: job " + job_id + " is already " + JobStatus_Name(state.status()));
  }

  std::shared_ptr<runtime::CancellationToken> token;
  {
    std::lock_guard lock(active_mutex_);
    auto            it = active_.find(job_id);
    if (it != active_.end()) token = it->second;
  }

  if (token) {
    // a running job notices at its next checkpoint and records the cancel itself
    token->Cancel();
    jobs_->CancelIfQueued(job_id);
  } else {
    // no worker owns it, e.g. left behind by a crash
    jobs_->Cancel(job_id, "Job cancelled");
  }

  MASTERPLAN_LOG_INFO("job cancel requested", {StringField("job_id", job_id)});
  return jobs_->Get(job_id);
}

void PublishOrchestrator::CancelAll() {
  std::lock_guard lock(active_mutex_);
  for (auto& [id, token] : active_) {
    token->Cancel();
  }
}

// ---------------------------------------------------------------------
// Job execution
// ---------------------------------------------------------------------

JobState PublishOrchestrator::Launch(JobType type, const std::string& project_slug, const std::string& draft_id, JobBody body) {
  auto state = jobs_->Create(type, project_slug, draft_id);
  auto token = std::make_shared<runtime::CancellationToken>();
  {
    std::lock_guard lock(active_mutex_);
    active_[state.id()] = token;
  }

  try {
    job_pool_.Submit([this, job_id = state.id(), token, body = std::move(body)] { Execute(job_id, token, body); });
  } catch (const std::exception& e) {
    {
      std::lock_guard lock(active_mutex_);
      active_.erase(state.id());
    }
    jobs_->Fail(state.id(), std::string("could not schedule job: ") + e.what());
    throw;
  }
  return state;
}

void PublishOrchestrator::Execute(const std::string& job_id, const std::shared_ptr<runtime::CancellationToken>& token, const JobBody& body) {
  try {
    jobs_->Start(job_id);
  } catch (const util::InvalidState& e) {
    // cancelled while queued
    MASTERPLAN_LOG_INFO("skipping job", {StringField("job_id", job_id), StringField("reason", e.what())});
    std::lock_guard lock(active_mutex_);
    active_.erase(job_id);
    return;
  } catch (const std::exception& e) {
    MASTERPLAN_LOG_ERROR("job start failed", {StringField("job_id", job_id), StringField("error", e.what())});
    std::lock_guard lock(active_mutex_);
    active_.erase(job_id);
    return;
  }

  observability::SpanScope span("PublishOrchestrator.Job");
  span.SetAttribute("job.id", job_id);

  try {
    try {
      auto result = body(job_id, *token);
      jobs_->Complete(job_id, result);
      span.SetAttribute("job.tile_count", static_cast<std::int64_t>(result.tile_count()));
    } catch (const util::Cancelled& e) {
      span.AddEvent("cancelled");
      jobs_->Cancel(job_id, std::string("Job cancelled: ") + e.what());
    } catch (const util::ValidationError& e) {
      span.RecordException(e.what());
      for (const auto& error : e.errors()) {
        jobs_->AppendLog(job_id, "error", error);
      }
      jobs_->Fail(job_id, std::string("validation failed: ") + e.what());
    } catch (const std::exception& e) {
      span.RecordException(e.what());
      MASTERPLAN_LOG_ERROR("job failed", {StringField("job_id", job_id), StringField("error", e.what())});
      jobs_->Fail(job_id, e.what());
    }
  } catch (const std::exception& e) {
    // the terminal write itself failed; RecoverInterrupted picks it up on restart
    MASTERPLAN_LOG_ERROR("job state write failed", {StringField("job_id", job_id), StringField("error", e.what())});
  }

  std::lock_guard lock(active_mutex_);
  active_.erase(job_id);
}

JobResult PublishOrchestrator::RunPublish(const std::string& job_id, const Draft& draft, const std::string& published_by,
                                          const runtime::CancellationToken& cancel) {
  // validate: 0 → 10
  jobs_->UpdateProgress(job_id, 0, "Validating draft");
  auto errors = Preflight(draft, true);
  if (!errors.empty()) {
    throw util::ValidationError(std::move(errors));
  }
  const auto tile_options = ResolveTileOptions(draft);
  jobs_->UpdateProgress(job_id, 10, "Draft validated");
  cancel.ThrowIfCancelled("validation");

  // tiles ∥ geometry: 10 → 80
  const auto     scratch_prefix = "jobs/" + job_id + "/tiles";
  ScratchCleanup cleanup(*scratch_, scratch_prefix);

  std::optional<std::future<geometry::ImportResult>> imported;
  if (!draft.vector_import().document_key().empty()) {
    imported = encode_pool_.Submit([this, &job_id, &draft] { return ImportGeometry(job_id, draft); });
  }

  tiling::TilePyramid pyramid;
  try {
    jobs_->UpdateProgress(job_id, 10, "Generating tiles");
    const auto                   source = ReadAsset(draft.project_slug(), draft.source_image_key(), "source image");
    tiling::TilePyramidGenerator generator(encode_pool_);
    pyramid = generator.Generate(
        *source, tile_options, *scratch_, scratch_prefix,
        [&](int percent) { jobs_->UpdateProgress(job_id, Slice(percent, 10, 80), "Generating tiles (" + std::to_string(percent) + "%)"); }, &cancel);
  } catch (...) {
    // the import task references draft and job_id
    if (imported) imported->wait();
    throw;
  }
  jobs_->AppendLog(job_id, "info",
                   "Generated " + std::to_string(pyramid.tile_count) + " tiles in " + std::to_string(pyramid.plan.LevelCount()) + " levels");

  geometry::ImportResult import;
  if (imported) {
    import = imported->get();
  }
  cancel.ThrowIfCancelled("geometry import");

  // curated overlays win over imported ones with the same (type, ref)
  std::vector<ReleaseOverlay>                   overlays(draft.overlays().begin(), draft.overlays().end());
  std::set<std::pair<std::string, std::string>> curated;
  for (const auto& overlay : overlays) {
    curated.emplace(overlay.overlay_type(), overlay.ref());
  }
  for (auto& overlay : import.overlays) {
    if (curated.count({overlay.overlay_type(), overlay.ref()})) {
      jobs_->AppendLog(job_id, "warn", "Curated overlay " + overlay.overlay_type() + " '" + overlay.ref() + "' replaces imported geometry");
      continue;
    }
    overlays.push_back(std::move(overlay));
  }
  for (const auto& issue : import.errors) {
    jobs_->AppendLog(job_id, "warn", "Skipped element '" + issue.element_id() + "': " + issue.message());
  }

  ReleaseConfig config = draft.config();
  if (config.default_view_box().empty() && import.view_box) {
    config.set_default_view_box(*import.view_box);
  }

  // assemble + upload: 80 → 100
  jobs_->UpdateProgress(job_id, 80, "Assembling manifest");
  const auto manifest = assembler_->Assemble(draft, pyramid, std::move(overlays), config, published_by);
  jobs_->AppendLog(job_id, "info", "Release ID: " + manifest.release_id());
  cancel.ThrowIfCancelled("assembly");

  jobs_->UpdateProgress(job_id, 80, "Uploading release");
  const auto manifest_key = assembler_->Publish(
      manifest, pyramid, *scratch_, [&](int percent) { jobs_->UpdateProgress(job_id, Slice(percent, 80, 99), "Uploading release"); }, &cancel);

  JobResult result;
  result.set_release_id(manifest.release_id());
  result.set_manifest_key(manifest_key);
  result.set_checksum(manifest.checksum());
  result.set_overlay_count(manifest.overlays_size());
  result.set_tile_count(pyramid.tile_count);
  result.set_levels(pyramid.plan.LevelCount());
  result.set_width(pyramid.plan.width);
  result.set_height(pyramid.plan.height);
  result.set_tiles_prefix(storage::common::ReleaseTilesPrefix(draft.project_slug(), manifest.release_id()));
  for (const auto& issue : import.errors) {
    *result.add_geometry_errors() = issue;
  }
  return result;
}

JobResult PublishOrchestrator::RunTileGeneration(const std::string& job_id, const Draft& draft, const runtime::CancellationToken& cancel) {
  jobs_->UpdateProgress(job_id, 0, "Validating draft");
  auto errors = Preflight(draft, false);
  if (!errors.empty()) {
    throw util::ValidationError(std::move(errors));
  }
  const auto tile_options = ResolveTileOptions(draft);
  jobs_->UpdateProgress(job_id, 10, "Draft validated");
  cancel.ThrowIfCancelled("validation");

  const auto source = ReadAsset(draft.project_slug(), draft.source_image_key(), "source image");
  const auto prefix = storage::common::UploadsTilesPrefix(draft.project_slug());

  // staging is mutable: replace whatever an earlier run left
  assets_->RemovePrefix(prefix);

  tiling::TilePyramidGenerator generator(encode_pool_);
  const auto                   pyramid = generator.Generate(
      *source, tile_options, *assets_, prefix,
      [&](int percent) { jobs_->UpdateProgress(job_id, Slice(percent, 10, 95), "Generating tiles (" + std::to_string(percent) + "%)"); }, &cancel);

  if (options_.write_dzi_descriptor) {
    assets_->Put(prefix + ".dzi", storage::common::BufferFromString(tiling::BuildDziDescriptor(pyramid)));
  }
  jobs_->AppendLog(job_id, "info",
                   "Generated " + std::to_string(pyramid.tile_count) + " tiles in " + std::to_string(pyramid.plan.LevelCount()) + " levels");

  JobResult result;
  result.set_tile_count(pyramid.tile_count);
  result.set_levels(pyramid.plan.LevelCount());
  result.set_width(pyramid.plan.width);
  result.set_height(pyramid.plan.height);
  result.set_tiles_prefix(prefix);
  return result;
}

geometry::ImportResult PublishOrchestrator::ImportGeometry(const std::string& job_id, const Draft& draft) {
  const auto& spec   = draft.vector_import();
  const auto  buffer = ReadAsset(draft.project_slug(), spec.document_key(), "vector document");

  geometry::ImportOptions options;
  options.id_pattern      = spec.id_pattern();
  options.group_by_parent = spec.group_by_parent();
  options.layer           = spec.layer();
  if (!spec.overlay_type().empty()) options.overlay_type = spec.overlay_type();
  if (!draft.config().default_locale().empty()) options.default_locale = draft.config().default_locale();
  options.precision       = options_.label_precision;
  options.curve_tolerance = options_.curve_tolerance;

  auto result = geometry::GeometryImporter(options).Import(storage::common::ToStringView(*buffer));
  jobs_->AppendLog(job_id, "info",
                   "Imported " + std::to_string(result.overlays.size()) + " overlays from " + spec.document_key() + " (" +
                       std::to_string(result.errors.size()) + " skipped)");
  return result;
}

// ---------------------------------------------------------------------
// Validation helpers
// ---------------------------------------------------------------------

std::vector<std::string> PublishOrchestrator::Preflight(const Draft& draft, bool for_publish) {
  std::vector<std::string> errors;

  const auto check_asset = [&](const std::string& key, const std::string& what) {
    if (key.empty()) {
      errors.push_back(what + " is not set");
      return;
    }
    try {
      storage::common::ValidateUploadKey(draft.project_slug(), key);
      if (!assets_->Exists(key)) {
        errors.push_back(what + " '" + key + "' does not exist");
      }
    } catch (const util::ValidationError& e) {
      errors.insert(errors.end(), e.errors().begin(), e.errors().end());
    }
  };

  check_asset(draft.source_image_key(), "source image");

  try {
    tiling::TilePyramidGenerator::ValidateOptions(ResolveTileOptions(draft));
  } catch (const util::ValidationError& e) {
    errors.insert(errors.end(), e.errors().begin(), e.errors().end());
  }

  if (!for_publish) {
    return errors;
  }

  if (!draft.has_config()) {
    errors.emplace_back("release configuration is missing");
  }

  const bool has_import = !draft.vector_import().document_key().empty();
  if (has_import) {
    check_asset(draft.vector_import().document_key(), "vector document");
    if (!draft.vector_import().id_pattern().empty()) {
      try {
        std::regex probe(draft.vector_import().id_pattern());
      } catch (const std::regex_error& e) {
        errors.push_back("invalid id pattern '" + draft.vector_import().id_pattern() + "': " + e.what());
      }
    }
  } else if (draft.overlays_size() == 0) {
    errors.emplace_back("at least one overlay is required");
  }

  const std::vector<ReleaseOverlay> curated(draft.overlays().begin(), draft.overlays().end());
  auto                              overlay_errors = release::ReleaseAssembler::ValidateOverlays(curated);
  errors.insert(errors.end(), overlay_errors.begin(), overlay_errors.end());
  return errors;
}

tiling::TileOptions PublishOrchestrator::ResolveTileOptions(const Draft& draft) const {
  auto        options = options_.tile_defaults;
  const auto& tiles   = draft.tiles();
  if (tiles.tile_size() != 0) options.tile_size = tiles.tile_size();
  if (tiles.overlap() != 0) options.overlap = tiles.overlap();
  if (tiles.quality() != 0) options.quality = tiles.quality();
  if (!tiles.format().empty()) {
    auto format = imaging::ParseTileFormat(tiles.format());
    if (!format) {
      throw util::ValidationError("unsupported tile format '" + tiles.format() + "'");
    }
    options.format = *format;
  }
  return options;
}

std::shared_ptr<arrow::Buffer> PublishOrchestrator::ReadAsset(const std::string& project_slug, const std::string& key, const char* what) {
  storage::common::ValidateUploadKey(project_slug, key);
  try {
    return assets_->Read(key);
  } catch (const util::NotFound&) {
    throw util::SourceAssetError(std::string(what) + " '" + key + "' not found");
  }
}

} // namespace masterplan::core
