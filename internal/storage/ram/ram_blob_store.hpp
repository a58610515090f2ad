#pragma once

#include <map>
#include <memory>
#include <shared_mutex>

#include <arrow/buffer.h>

#include "internal/storage/blob_store.hpp"

namespace masterplan::storage {

/*
  RAM blob storage.

  Backed by Arrow buffers stored in-memory.
  Provides zero-copy reads to callers.

  Thread safety:
    - shared reads
    - exclusive writes
*/

class RamBlobStore final : public BlobStore {
public:
  RamBlobStore() = default;
  ~RamBlobStore() override = default;

  std::shared_ptr<arrow::Buffer> Read(const std::string& key) override;

  void Write(const std::string& key, const std::shared_ptr<arrow::Buffer>& buffer) override;
  void Put(const std::string& key, const std::shared_ptr<arrow::Buffer>& buffer) override;

  bool Exists(const std::string& key) override;
  std::vector<std::string> List(const std::string& prefix) override;

  void Remove(const std::string& key) override;
  void RemovePrefix(const std::string& prefix) override;

  size_t Size() const;

private:
  mutable std::shared_mutex mutex_;
  // ordered so List() comes out sorted
  std::map<std::string, std::shared_ptr<arrow::Buffer>> buffers_;
};

} // namespace masterplan::storage
