#pragma once

#include <arrow/filesystem/filesystem.h>

#include <atomic>
#include <memory>
#include <mutex>
#include <string>

#include "internal/storage/blob_store.hpp"

namespace masterplan::storage {

/*
  Blob storage over an Arrow filesystem.

  Object key layout:

      <root_path>/<key>

  Local filesystems get atomic writes (tmp → rename); object stores are
  atomic per PUT and are written directly.
*/

class ArrowBlobStore final : public BlobStore {
public:
  ArrowBlobStore(std::shared_ptr<arrow::fs::FileSystem> fs, std::string root_path);

  std::shared_ptr<arrow::Buffer> Read(const std::string& key) override;

  void Write(const std::string& key, const std::shared_ptr<arrow::Buffer>& buffer) override;
  void Put(const std::string& key, const std::shared_ptr<arrow::Buffer>& buffer) override;

  bool Exists(const std::string& key) override;
  std::vector<std::string> List(const std::string& prefix) override;

  void Remove(const std::string& key) override;
  void RemovePrefix(const std::string& prefix) override;

  const std::string& RootPath() const { return root_path_; }

private:
  std::string Path(const std::string& key) const;
  std::string ParentDir(const std::string& path) const;

  void WriteObject(const std::string& path, const std::shared_ptr<arrow::Buffer>& buffer, bool create_only);

  std::shared_ptr<arrow::fs::FileSystem> fs_;
  std::string root_path_;
  bool local_;

  // serializes the exists-check + rename of create-only writes
  std::mutex create_mutex_;
  std::atomic<uint64_t> tmp_counter_{0};
};

}
