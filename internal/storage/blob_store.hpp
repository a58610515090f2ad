#pragma once

#include <arrow/buffer.h>

#include <memory>
#include <string>
#include <vector>

namespace masterplan::storage {

/*
  Key/value blob storage for project artifacts.

  Keys are relative, '/'-separated paths such as
  "{project}/releases/{release_id}/release.json".

  Every artifact is an Arrow Buffer; callers never see raw file handles.

  Implementations:
    ARROW  → arrow::fs::FileSystem (local disk, S3)
    RAM    → in-memory Arrow buffers (tests, scratch)

  Errors: missing keys raise util::NotFound, everything else
  util::StorageError.
*/

class BlobStore {
 public:
  virtual ~BlobStore() = default;

  // ------------------------------------------------------------------
  // Read
  // ------------------------------------------------------------------
  virtual std::shared_ptr<arrow::Buffer> Read(const std::string& key) = 0;

  // ------------------------------------------------------------------
  // Write
  // ------------------------------------------------------------------
  /*
    Create-only write. Fails with StorageError when the key already
    holds data; release artifacts are never rewritten.
  */
  virtual void Write(const std::string& key, const std::shared_ptr<arrow::Buffer>& buffer) = 0;

  /*
    Create-or-replace. Only used under the mutable uploads/ prefix and
    for scratch output.
  */
  virtual void Put(const std::string& key, const std::shared_ptr<arrow::Buffer>& buffer) = 0;

  virtual bool Exists(const std::string& key) = 0;

  // All keys below prefix, sorted.
  virtual std::vector<std::string> List(const std::string& prefix) = 0;

  // ------------------------------------------------------------------
  // Delete
  // ------------------------------------------------------------------
  virtual void Remove(const std::string& key) = 0;

  virtual void RemovePrefix(const std::string& prefix) = 0;
};

using BlobStorePtr = std::shared_ptr<BlobStore>;

} // namespace masterplan::storage
