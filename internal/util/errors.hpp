#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace masterplan::util {

/*
  Central error types.

  Pipeline stages throw these; the orchestrator turns them into a failed
  job and the gRPC layer translates them to status codes.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

/*
  A precondition on a draft or on stage options does not hold.
  Carries every violated rule, not only the first one.
*/
class ValidationError : public std::runtime_error {
 public:
  explicit ValidationError(std::vector<std::string> errors)
      : std::runtime_error(Join(errors)), errors_(std::move(errors)) {
  }

  explicit ValidationError(const std::string& msg) : ValidationError(std::vector<std::string>{msg}) {
  }

  const std::vector<std::string>& errors() const {
    return errors_;
  }

 private:
  static std::string Join(const std::vector<std::string>& errors) {
    std::string out;
    for (const auto& e : errors) {
      if (!out.empty()) out += "; ";
      out += e;
    }
    return out;
  }

  std::vector<std::string> errors_;
};

// Source image or vector document missing, unreadable or undecodable.
class SourceAssetError : public std::runtime_error {
 public:
  explicit SourceAssetError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Import produced no usable geometry.
class GeometryError : public std::runtime_error {
 public:
  explicit GeometryError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class StorageError : public std::runtime_error {
 public:
  explicit StorageError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Another publish for the same draft is already in flight.
class ConcurrencyError : public std::runtime_error {
 public:
  explicit ConcurrencyError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Raised at a stage checkpoint once the job has been cancelled.
class Cancelled : public std::runtime_error {
 public:
  explicit Cancelled(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace masterplan::util
