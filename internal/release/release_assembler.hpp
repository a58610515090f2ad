#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/runtime/cancellation.hpp"
#include "internal/storage/blob_store.hpp"
#include "internal/tiling/tile_pyramid.hpp"
#include "internal/util/time.hpp"
#include "masterplan/release/v1.hpp"

namespace masterplan::release {

using ProgressCallback = std::function<void(int percent)>;

/*
  Turns a finished tile pyramid plus overlays into an immutable release.

      Validate  → list of problems, no side effects
      Assemble  → manifest with release id, timestamp and checksum
      Publish   → tiles, tiles.dzi, release.json (last), then history row
                  and current pointer in one transaction

  Nothing under {project}/releases/{release_id}/ is ever rewritten. The
  current-release pointer is the only mutable record and it is written
  under a per-project lock.
*/
class ReleaseAssembler {
 public:
  struct Options {
    bool        write_dzi_descriptor = true;
    double      label_precision      = 1.0;
    double      curve_tolerance      = 0.5;
  };

  ReleaseAssembler(storage::BlobStorePtr releases, std::shared_ptr<db::Repository> repository, Options options);

  /*
    Null pyramid or config means that input is missing. Returns every
    violated rule; empty means publishable.
  */
  static std::vector<std::string> Validate(const tiling::TilePyramid*                                   pyramid,
                                           const std::vector<masterplan::release::v1::ReleaseOverlay>& overlays,
                                           const masterplan::release::v1::ReleaseConfig*               config);

  // Overlay rules only: type/ref present and unique, geometry set.
  static std::vector<std::string> ValidateOverlays(const std::vector<masterplan::release::v1::ReleaseOverlay>& overlays);

  /*
    Builds the manifest. Overlays are ordered by (sort_order, ref) and
    missing label positions are computed. A fresh release id is drawn on
    every call.

    Throws util::ValidationError when Validate reports anything.
  */
  masterplan::release::v1::ReleaseManifest Assemble(const masterplan::release::v1::Draft& draft, const tiling::TilePyramid& pyramid,
                                                    std::vector<masterplan::release::v1::ReleaseOverlay> overlays,
                                                    const masterplan::release::v1::ReleaseConfig& config, const std::string& published_by,
                                                    util::TimePoint now = util::Now()) const;

  static bool VerifyChecksum(const masterplan::release::v1::ReleaseManifest& manifest);

  /*
    Copies the pyramid tiles from tile_source (under pyramid.prefix) into
    the release, writes the descriptor and manifest, then links the
    release as current. Returns the manifest key.

    A release that fails or is cancelled before linking is removed again.
  */
  std::string Publish(const masterplan::release::v1::ReleaseManifest& manifest, const tiling::TilePyramid& pyramid, storage::BlobStore& tile_source,
                      const ProgressCallback& progress = {}, const runtime::CancellationToken* cancel = nullptr);

  std::vector<db::model::ReleaseRecord> ListReleases(const std::string& project_slug);

  std::optional<db::model::ReleaseRecord> CurrentRelease(const std::string& project_slug);

  // Repoints current to an existing release. Nothing is copied or deleted.
  db::model::ReleaseRecord Rollback(const std::string& project_slug, const std::string& release_id);

  masterplan::release::v1::ReleaseManifest LoadManifest(const std::string& project_slug, const std::string& release_id);

 private:
  std::shared_ptr<std::mutex> ProjectMutex(const std::string& project_slug);

  void Link(const db::model::ReleaseRecord& record);

  storage::BlobStorePtr           releases_;
  std::shared_ptr<db::Repository> repository_;
  Options                         options_;

  std::mutex                                                   project_mutexes_guard_;
  std::unordered_map<std::string, std::shared_ptr<std::mutex>> project_mutexes_;
};

} // namespace masterplan::release
