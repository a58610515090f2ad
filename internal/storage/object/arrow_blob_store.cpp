#include "arrow_blob_store.hpp"

#include <arrow/io/interfaces.h>
#include <arrow/result.h>

#include <algorithm>

#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/common/path_utils.hpp"

namespace masterplan::storage {

using namespace masterplan::storage::common;

namespace {

constexpr const char* kPartialMarker = ".partial-";

} // namespace

ArrowBlobStore::ArrowBlobStore(std::shared_ptr<arrow::fs::FileSystem> fs, std::string root_path)
    : fs_(std::move(fs)), root_path_(std::move(root_path)), local_(fs_->type_name() == "local") {
  while (root_path_.size() > 1 && root_path_.back() == '/') {
    root_path_.pop_back();
  }
  if (local_ && !root_path_.empty()) {
    Unwrap(fs_->CreateDir(root_path_, /*recursive=*/true));
  }
}

std::string ArrowBlobStore::Path(const std::string& key) const {
  ValidateKey(key);
  if (root_path_.empty()) {
    return key;
  }
  return root_path_ + "/" + key;
}

std::string ArrowBlobStore::ParentDir(const std::string& path) const {
  auto slash = path.rfind('/');
  return slash == std::string::npos ? std::string{} : path.substr(0, slash);
}

/*
  Download full object
*/
std::shared_ptr<arrow::Buffer> ArrowBlobStore::Read(const std::string& key) {
  const auto path = Path(key);
  auto       info = Unwrap(fs_->GetFileInfo(path));
  if (info.type() != arrow::fs::FileType::File) {
    throw util::NotFound("blob not found: " + key);
  }
  return ReadAll(Unwrap(fs_->OpenInputFile(path)));
}

void ArrowBlobStore::WriteObject(const std::string& path, const std::shared_ptr<arrow::Buffer>& buffer, bool create_only) {
  if (!local_) {
    if (create_only && Unwrap(fs_->GetFileInfo(path)).type() != arrow::fs::FileType::NotFound) {
      throw util::StorageError("refusing to overwrite " + path);
    }
    auto out = Unwrap(fs_->OpenOutputStream(path));
    Unwrap(out->Write(buffer->data(), buffer->size()));
    Unwrap(out->Close());
    return;
  }

  const auto parent = ParentDir(path);
  if (!parent.empty()) {
    Unwrap(fs_->CreateDir(parent, /*recursive=*/true));
  }

  const auto tmp_path = path + kPartialMarker + std::to_string(tmp_counter_.fetch_add(1));
  {
    auto out = Unwrap(fs_->OpenOutputStream(tmp_path));
    Unwrap(out->Write(buffer->data(), buffer->size()));
    Unwrap(out->Flush());
    Unwrap(out->Close());
  }

  std::lock_guard lock(create_mutex_);
  if (create_only && Unwrap(fs_->GetFileInfo(path)).type() != arrow::fs::FileType::NotFound) {
    Unwrap(fs_->DeleteFile(tmp_path));
    throw util::StorageError("refusing to overwrite " + path);
  }
  Unwrap(fs_->Move(tmp_path, path));
}

void ArrowBlobStore::Write(const std::string& key, const std::shared_ptr<arrow::Buffer>& buffer) {
  WriteObject(Path(key), buffer, /*create_only=*/true);
}

void ArrowBlobStore::Put(const std::string& key, const std::shared_ptr<arrow::Buffer>& buffer) {
  WriteObject(Path(key), buffer, /*create_only=*/false);
}

bool ArrowBlobStore::Exists(const std::string& key) {
  return Unwrap(fs_->GetFileInfo(Path(key))).type() == arrow::fs::FileType::File;
}

std::vector<std::string> ArrowBlobStore::List(const std::string& prefix) {
  arrow::fs::FileSelector selector;
  selector.base_dir        = prefix.empty() ? root_path_ : Path(prefix);
  selector.recursive       = true;
  selector.allow_not_found = true;

  const auto strip = root_path_.empty() ? 0 : root_path_.size() + 1;

  std::vector<std::string> keys;
  for (const auto& info : Unwrap(fs_->GetFileInfo(selector))) {
    if (info.type() != arrow::fs::FileType::File) continue;
    const auto& path = info.path();
    if (path.find(kPartialMarker) != std::string::npos) continue;
    keys.push_back(path.substr(strip));
  }
  std::sort(keys.begin(), keys.end());
  return keys;
}

/*
  Delete object
*/
void ArrowBlobStore::Remove(const std::string& key) {
  const auto path = Path(key);
  if (Unwrap(fs_->GetFileInfo(path)).type() == arrow::fs::FileType::NotFound) {
    return;
  }
  Unwrap(fs_->DeleteFile(path));
}

void ArrowBlobStore::RemovePrefix(const std::string& prefix) {
  const auto path = Path(prefix);
  switch (Unwrap(fs_->GetFileInfo(path)).type()) {
    case arrow::fs::FileType::Directory:
      Unwrap(fs_->DeleteDir(path));
      break;
    case arrow::fs::FileType::File:
      Unwrap(fs_->DeleteFile(path));
      break;
    default:
      break;
  }
}

} // namespace masterplan::storage
