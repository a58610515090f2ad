#pragma once

#include <cstdint>
#include <string>

namespace masterplan::db::model {

// Append-only log line of a job. position is contiguous per job.
struct JobLogRecord {
  std::string job_id;
  uint64_t    position     = 0;
  uint64_t    timestamp_ms = 0;
  std::string level;
  std::string message;
};

} // namespace masterplan::db::model
