#pragma once

#include <cstdint>
#include <string>

#include "masterplan/release/v1.hpp"

namespace masterplan::db::model {

/*
  Persistent job row.

  - status/type hold the proto enum values.
  - result_json is the JobResult message in proto JSON form.
  - sequence increases by one on every write, so watchers can tell
    whether they have seen the latest state.
*/

struct JobRecord {
  std::string id;

  masterplan::release::v1::JobType   type   = masterplan::release::v1::JOB_TYPE_UNSPECIFIED;
  masterplan::release::v1::JobStatus status = masterplan::release::v1::JOB_STATUS_UNSPECIFIED;

  std::string project_slug;
  std::string draft_id;

  int32_t     progress = 0;
  std::string message;
  std::string result_json;
  std::string error;

  uint64_t created_at_ms   = 0;
  uint64_t started_at_ms   = 0; // 0 = not started
  uint64_t completed_at_ms = 0; // 0 = not finished

  uint64_t sequence = 0;
};

} // namespace masterplan::db::model
