#include "draft_catalog.hpp"

#include <google/protobuf/util/json_util.h>

#include <utility>

#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/util/errors.hpp"

namespace masterplan::core {

namespace v1 = masterplan::release::v1;

DraftCatalog::DraftCatalog(storage::BlobStorePtr store) : store_(std::move(store)) {
}

v1::Draft DraftCatalog::Load(const std::string& project_slug, const std::string& draft_id) {
  const auto key = storage::common::DraftKey(project_slug, draft_id);

  std::shared_ptr<arrow::Buffer> buffer;
  try {
    buffer = store_->Read(key);
  } catch (const util::NotFound&) {
    throw util::NotFound("draft " + project_slug + "/" + draft_id + " not found");
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  v1::Draft draft;
  auto status = google::protobuf::util::JsonStringToMessage(std::string(storage::common::ToStringView(*buffer)), &draft, options);
  if (!status.ok()) {
    throw util::ValidationError("draft " + key + " is not valid: " + std::string(status.message()));
  }

  // the key is authoritative; a descriptor naming another draft is rejected
  if (!draft.project_slug().empty() && draft.project_slug() != project_slug) {
    throw util::ValidationError("draft " + key + " belongs to project '" + draft.project_slug() + "'");
  }
  if (!draft.draft_id().empty() && draft.draft_id() != draft_id) {
    throw util::ValidationError("draft " + key + " has id '" + draft.draft_id() + "'");
  }
  draft.set_project_slug(project_slug);
  draft.set_draft_id(draft_id);
  return draft;
}

void DraftCatalog::Save(const v1::Draft& draft) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace             = true;
  options.preserve_proto_field_names = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(draft, &json, options);
  if (!status.ok()) {
    throw util::InvalidState("draft encode failed: " + std::string(status.message()));
  }
  store_->Put(storage::common::DraftKey(draft.project_slug(), draft.draft_id()), storage::common::BufferFromString(std::move(json)));
}

} // namespace masterplan::core
