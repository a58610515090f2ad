#include "release_assembler.hpp"

#include <algorithm>
#include <set>
#include <utility>

#include "internal/db/api/result.hpp"
#include "internal/geometry/geometry.hpp"
#include "internal/observability/logging.hpp"
#include "internal/release/manifest_codec.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/tiling/dzi.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/release_id.hpp"

namespace masterplan::release {

namespace v1 = masterplan::release::v1;

namespace {

void ApplyConfigDefaults(v1::ReleaseConfig* config, const tiling::TilePyramid& pyramid) {
  if (config->default_view_box().empty()) {
    config->set_default_view_box("0 0 " + std::to_string(pyramid.plan.width) + " " + std::to_string(pyramid.plan.height));
  }
  auto* zoom = config->mutable_default_zoom();
  if (zoom->min() <= 0.0) zoom->set_min(0.5);
  if (zoom->max() <= 0.0) zoom->set_max(4.0);
  if (zoom->default_() <= 0.0) zoom->set_default_(1.0);
  if (config->default_locale().empty()) {
    config->set_default_locale("en");
  }
  if (config->supported_locales_size() == 0) {
    config->add_supported_locales(config->default_locale());
  }
}

} // namespace

ReleaseAssembler::ReleaseAssembler(storage::BlobStorePtr releases, std::shared_ptr<db::Repository> repository, Options options)
    : releases_(std::move(releases)), repository_(std::move(repository)), options_(options) {
}

std::vector<std::string> ReleaseAssembler::Validate(const tiling::TilePyramid* pyramid, const std::vector<v1::ReleaseOverlay>& overlays,
                                                    const v1::ReleaseConfig* config) {
  std::vector<std::string> errors;

  if (!pyramid) {
    errors.emplace_back("tile pyramid is missing");
  } else if (pyramid->plan.LevelCount() <= 0 || pyramid->tile_count <= 0) {
    errors.emplace_back("tile pyramid is empty");
  }

  if (overlays.empty()) {
    errors.emplace_back("at least one overlay is required");
  }

  if (!config) {
    errors.emplace_back("release configuration is missing");
  } else {
    const auto& zoom = config->default_zoom();
    if (zoom.min() > 0.0 && zoom.max() > 0.0 && zoom.min() > zoom.max()) {
      errors.emplace_back("default zoom min exceeds max");
    }
  }

  auto overlay_errors = ValidateOverlays(overlays);
  errors.insert(errors.end(), overlay_errors.begin(), overlay_errors.end());
  return errors;
}

std::vector<std::string> ReleaseAssembler::ValidateOverlays(const std::vector<v1::ReleaseOverlay>& overlays) {
  std::vector<std::string> errors;
  std::set<std::pair<std::string, std::string>> seen;
  for (const auto& overlay : overlays) {
    const std::string name = overlay.overlay_type() + " '" + overlay.ref() + "'";
    if (overlay.ref().empty() || overlay.overlay_type().empty()) {
      errors.push_back("overlay " + name + " needs a type and a ref");
    }
    if (!seen.emplace(overlay.overlay_type(), overlay.ref()).second) {
      errors.push_back("duplicate overlay " + name);
    }
    if (overlay.geometry().shape_case() == v1::Geometry::SHAPE_NOT_SET) {
      errors.push_back("overlay " + name + " has no geometry");
    }
    if (overlay.label_position_size() != 0 && overlay.label_position_size() != 2) {
      errors.push_back("overlay " + name + " label_position must be [x, y]");
    }
  }

  return errors;
}

v1::ReleaseManifest ReleaseAssembler::Assemble(const v1::Draft& draft, const tiling::TilePyramid& pyramid, std::vector<v1::ReleaseOverlay> overlays,
                                               const v1::ReleaseConfig& config, const std::string& published_by, util::TimePoint now) const {
  auto errors = Validate(&pyramid, overlays, &config);

  for (auto& overlay : overlays) {
    if (overlay.label_position_size() == 2 || overlay.geometry().shape_case() == v1::Geometry::SHAPE_NOT_SET) {
      continue;
    }
    try {
      const auto path = geometry::Analyze(geometry::FromProto(overlay.geometry()), options_.curve_tolerance, options_.label_precision);
      overlay.add_label_position(path.anchor.x);
      overlay.add_label_position(path.anchor.y);
    } catch (const util::GeometryError& e) {
      errors.push_back("overlay " + overlay.overlay_type() + " '" + overlay.ref() + "': " + e.what());
    }
  }
  if (!errors.empty()) {
    throw util::ValidationError(std::move(errors));
  }

  std::stable_sort(overlays.begin(), overlays.end(), [](const v1::ReleaseOverlay& a, const v1::ReleaseOverlay& b) {
    if (a.sort_order() != b.sort_order()) return a.sort_order() < b.sort_order();
    return a.ref() < b.ref();
  });

  v1::ReleaseManifest manifest;
  manifest.set_version(kManifestVersion);
  manifest.set_release_id(util::GenerateReleaseId(now));
  manifest.set_project_slug(draft.project_slug());
  manifest.set_draft_id(draft.draft_id());
  manifest.set_published_at(util::ToIso8601(now));
  manifest.set_published_by(published_by);

  *manifest.mutable_config() = config;
  ApplyConfigDefaults(manifest.mutable_config(), pyramid);

  *manifest.mutable_tiles() = pyramid.ToTileConfig();
  manifest.mutable_tiles()->set_base_url("tiles");

  for (auto& overlay : overlays) {
    *manifest.add_overlays() = std::move(overlay);
  }

  manifest.set_checksum(ComputeChecksum(manifest));
  return manifest;
}

bool ReleaseAssembler::VerifyChecksum(const v1::ReleaseManifest& manifest) {
  return !manifest.checksum().empty() && manifest.checksum() == ComputeChecksum(manifest);
}

std::string ReleaseAssembler::Publish(const v1::ReleaseManifest& manifest, const tiling::TilePyramid& pyramid, storage::BlobStore& tile_source,
                                      const ProgressCallback& progress, const runtime::CancellationToken* cancel) {
  if (!VerifyChecksum(manifest)) {
    throw util::InvalidState("publish: manifest checksum does not match its content");
  }

  const auto& project      = manifest.project_slug();
  const auto& release_id   = manifest.release_id();
  const auto  prefix       = storage::common::ReleasePrefix(project, release_id);
  const auto  tiles_prefix = storage::common::ReleaseTilesPrefix(project, release_id);
  const auto  manifest_key = storage::common::ReleaseManifestKey(project, release_id);

  if (!releases_->List(prefix).empty()) {
    throw util::StorageError("publish: release path " + prefix + " already holds data");
  }

  const auto tiles = tile_source.List(pyramid.prefix);
  if (static_cast<int64_t>(tiles.size()) != pyramid.tile_count) {
    throw util::StorageError("publish: expected " + std::to_string(pyramid.tile_count) + " tiles under " + pyramid.prefix + ", found " +
                             std::to_string(tiles.size()));
  }

  try {
    int last_percent = -1;
    for (size_t i = 0; i < tiles.size(); ++i) {
      if (cancel) cancel->ThrowIfCancelled("tile upload");

      const auto relative = tiles[i].substr(pyramid.prefix.size() + 1);
      releases_->Write(storage::common::JoinKey(tiles_prefix, relative), tile_source.Read(tiles[i]));

      const int percent = static_cast<int>((i + 1) * 90 / tiles.size());
      if (progress && percent != last_percent) {
        progress(percent);
        last_percent = percent;
      }
    }

    if (options_.write_dzi_descriptor) {
      releases_->Write(storage::common::ReleaseDziKey(project, release_id),
                       storage::common::BufferFromString(tiling::BuildDziDescriptor(pyramid)));
    }

    if (cancel) cancel->ThrowIfCancelled("manifest upload");

    // release.json goes last: its presence marks a complete release
    releases_->Write(manifest_key, storage::common::BufferFromString(ManifestToJson(manifest)));

    if (!releases_->Exists(manifest_key) ||
        (options_.write_dzi_descriptor && !releases_->Exists(storage::common::ReleaseDziKey(project, release_id))) ||
        static_cast<int64_t>(releases_->List(tiles_prefix).size()) != pyramid.tile_count) {
      throw util::StorageError("publish: release " + release_id + " is incomplete after upload");
    }

    db::model::ReleaseRecord record;
    record.release_id      = release_id;
    record.project_slug    = project;
    record.draft_id        = manifest.draft_id();
    record.manifest_key    = manifest_key;
    record.checksum        = manifest.checksum();
    record.published_by    = manifest.published_by();
    record.overlay_count   = manifest.overlays_size();
    record.tile_count      = pyramid.tile_count;
    record.published_at_ms = util::ToUnixMillis(util::Now());
    Link(record);
  } catch (...) {
    // not linked yet, so nobody can be reading it
    MASTERPLAN_LOG_WARN("removing unlinked release",
                        {observability::StringField("project", project), observability::StringField("release_id", release_id)});
    try {
      releases_->RemovePrefix(prefix);
    } catch (const std::exception& e) {
      MASTERPLAN_LOG_ERROR("failed to remove unlinked release", {observability::StringField("prefix", prefix), observability::StringField("error", e.what())});
    }
    throw;
  }

  if (progress) progress(100);

  MASTERPLAN_LOG_INFO("release published", {observability::StringField("project", project), observability::StringField("release_id", release_id),
                                            observability::IntField("tiles", pyramid.tile_count),
                                            observability::IntField("overlays", manifest.overlays_size())});
  return manifest_key;
}

void ReleaseAssembler::Link(const db::model::ReleaseRecord& record) {
  std::lock_guard project_lock(*ProjectMutex(record.project_slug));

  auto tx = repository_->Begin();
  db::ThrowIfDbError(repository_->InsertRelease(*tx, record), "publish: record release");

  db::model::CurrentReleaseRecord current;
  current.project_slug  = record.project_slug;
  current.release_id    = record.release_id;
  current.updated_at_ms = record.published_at_ms;
  db::ThrowIfDbError(repository_->SetCurrentRelease(*tx, current), "publish: set current release");
  tx->Commit();
}

std::vector<db::model::ReleaseRecord> ReleaseAssembler::ListReleases(const std::string& project_slug) {
  storage::common::ValidateSegment(project_slug, "project slug");
  auto tx       = repository_->Begin();
  auto releases = repository_->ListReleases(*tx, project_slug);
  tx->Commit();
  return releases;
}

std::optional<db::model::ReleaseRecord> ReleaseAssembler::CurrentRelease(const std::string& project_slug) {
  storage::common::ValidateSegment(project_slug, "project slug");
  auto tx      = repository_->Begin();
  auto current = repository_->GetCurrentRelease(*tx, project_slug);
  std::optional<db::model::ReleaseRecord> record;
  if (current) {
    record = repository_->GetRelease(*tx, project_slug, current->release_id);
  }
  tx->Commit();
  return record;
}

db::model::ReleaseRecord ReleaseAssembler::Rollback(const std::string& project_slug, const std::string& release_id) {
  storage::common::ValidateSegment(project_slug, "project slug");
  if (!util::IsReleaseId(release_id)) {
    throw util::ValidationError("rollback: '" + release_id + "' is not a release id");
  }

  std::lock_guard project_lock(*ProjectMutex(project_slug));

  auto tx     = repository_->Begin();
  auto record = repository_->GetRelease(*tx, project_slug, release_id);
  if (!record) {
    throw util::NotFound("rollback: release " + release_id + " not found in " + project_slug);
  }
  if (!releases_->Exists(record->manifest_key)) {
    throw util::InvalidState("rollback: manifest " + record->manifest_key + " is missing");
  }

  db::model::CurrentReleaseRecord current;
  current.project_slug  = project_slug;
  current.release_id    = release_id;
  current.updated_at_ms = util::ToUnixMillis(util::Now());
  db::ThrowIfDbError(repository_->SetCurrentRelease(*tx, current), "rollback: set current release");
  tx->Commit();

  MASTERPLAN_LOG_INFO("release rolled back", {observability::StringField("project", project_slug), observability::StringField("release_id", release_id)});
  return *record;
}

v1::ReleaseManifest ReleaseAssembler::LoadManifest(const std::string& project_slug, const std::string& release_id) {
  const auto buffer = releases_->Read(storage::common::ReleaseManifestKey(project_slug, release_id));
  return ManifestFromJson(storage::common::ToStringView(*buffer));
}

std::shared_ptr<std::mutex> ReleaseAssembler::ProjectMutex(const std::string& project_slug) {
  std::lock_guard lock(project_mutexes_guard_);
  auto&           mutex = project_mutexes_[project_slug];
  if (!mutex) {
    mutex = std::make_shared<std::mutex>();
  }
  return mutex;
}

} // namespace masterplan::release
