#include "storage_factory.hpp"

#include "common/arrow_utils.hpp"
#include "internal/observability/logging.hpp"
#include "object/arrow_blob_store.hpp"

namespace masterplan::storage {

StorageFactory::Stores StorageFactory::Build(const masterplan::runtime::config::StorageConfig& cfg) {
  Stores stores;

  auto [release_fs, release_root] = common::Unwrap(common::ResolveFileSystem(cfg.root_uri()));
  MASTERPLAN_LOG_INFO("storage root resolved",
                      {observability::StringField("filesystem", release_fs->type_name()), observability::StringField("root", release_root)});
  stores.releases = std::make_shared<ArrowBlobStore>(std::move(release_fs), std::move(release_root));

  auto [scratch_fs, scratch_root] = common::Unwrap(common::ResolveFileSystem(cfg.scratch_dir()));
  if (scratch_fs->type_name() != "local") {
    throw util::ValidationError("storage.scratch_dir must be a local path");
  }
  stores.scratch = std::make_shared<ArrowBlobStore>(std::move(scratch_fs), std::move(scratch_root));

  return stores;
}

} // namespace masterplan::storage
