#include "arrow_utils.hpp"

#include <arrow/filesystem/localfs.h>

#include <filesystem>

namespace masterplan::storage::common {

std::shared_ptr<arrow::Buffer> BufferFromString(std::string data) {
  return arrow::Buffer::FromString(std::move(data));
}

arrow::Result<std::pair<std::shared_ptr<arrow::fs::FileSystem>, std::string>> ResolveFileSystem(const std::string& uri) {
  std::string resolved_path;

  // plain relative paths are not accepted by FileSystemFromUriOrPath
  if (uri.find("://") == std::string::npos) {
    std::error_code ec;
    auto            absolute = std::filesystem::absolute(uri, ec);
    if (ec) {
      return arrow::Status::IOError("cannot resolve storage root '", uri, "': ", ec.message());
    }
    resolved_path = absolute.lexically_normal().generic_string();
    if (resolved_path.size() > 1 && resolved_path.back() == '/') {
      resolved_path.pop_back();
    }
    return std::make_pair(std::static_pointer_cast<arrow::fs::FileSystem>(std::make_shared<arrow::fs::LocalFileSystem>()), resolved_path);
  }

  ARROW_ASSIGN_OR_RAISE(auto fs, arrow::fs::FileSystemFromUriOrPath(uri, &resolved_path));
  return std::make_pair(std::move(fs), resolved_path);
}

} // namespace masterplan::storage::common
