#include "ram_blob_store.hpp"

#include <mutex>

#include "internal/storage/common/path_utils.hpp"
#include "internal/util/errors.hpp"

namespace masterplan::storage {

namespace {

bool HasPrefix(const std::string& key, const std::string& prefix) {
  if (prefix.empty()) return true;
  return key.size() > prefix.size() && key.compare(0, prefix.size(), prefix) == 0 && key[prefix.size()] == '/';
}

} // namespace

/*
  Zero-copy read.
*/
std::shared_ptr<arrow::Buffer> RamBlobStore::Read(const std::string& key) {
  common::ValidateKey(key);
  std::shared_lock lock(mutex_);

  auto it = buffers_.find(key);
  if (it == buffers_.end()) throw util::NotFound("blob not found: " + key);

  return it->second;
}

void RamBlobStore::Write(const std::string& key, const std::shared_ptr<arrow::Buffer>& buffer) {
  common::ValidateKey(key);
  std::unique_lock lock(mutex_);
  if (!buffers_.emplace(key, buffer).second) {
    throw util::StorageError("refusing to overwrite " + key);
  }
}

void RamBlobStore::Put(const std::string& key, const std::shared_ptr<arrow::Buffer>& buffer) {
  common::ValidateKey(key);
  std::unique_lock lock(mutex_);
  buffers_[key] = buffer;
}

bool RamBlobStore::Exists(const std::string& key) {
  common::ValidateKey(key);
  std::shared_lock lock(mutex_);
  return buffers_.contains(key);
}

std::vector<std::string> RamBlobStore::List(const std::string& prefix) {
  std::shared_lock         lock(mutex_);
  std::vector<std::string> keys;
  for (auto it = buffers_.lower_bound(prefix); it != buffers_.end(); ++it) {
    if (!HasPrefix(it->first, prefix)) {
      if (it->first.compare(0, prefix.size(), prefix) != 0) break;
      continue;
    }
    keys.push_back(it->first);
  }
  return keys;
}

void RamBlobStore::Remove(const std::string& key) {
  std::unique_lock lock(mutex_);
  buffers_.erase(key);
}

void RamBlobStore::RemovePrefix(const std::string& prefix) {
  std::unique_lock lock(mutex_);
  for (auto it = buffers_.lower_bound(prefix); it != buffers_.end();) {
    if (it->first.compare(0, prefix.size(), prefix) != 0) break;
    if (it->first == prefix || HasPrefix(it->first, prefix)) {
      it = buffers_.erase(it);
    } else {
      ++it;
    }
  }
}

size_t RamBlobStore::Size() const {
  std::shared_lock lock(mutex_);
  return buffers_.size();
}

} // namespace masterplan::storage
