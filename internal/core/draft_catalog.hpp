#pragma once

#include <string>

#include "internal/storage/blob_store.hpp"
#include "masterplan/release/v1.hpp"

namespace masterplan::core {

/*
  Reads draft descriptors from {project}/uploads/drafts/{draft_id}.json.

  Drafts are written by the project-configuration side; this service
  only reads them (Save exists for tooling and tests).
*/
class DraftCatalog {
 public:
  explicit DraftCatalog(storage::BlobStorePtr store);

  // Throws util::NotFound, or util::ValidationError for unparseable JSON.
  masterplan::release::v1::Draft Load(const std::string& project_slug, const std::string& draft_id);

  void Save(const masterplan::release::v1::Draft& draft);

 private:
  storage::BlobStorePtr store_;
};

} // namespace masterplan::core
