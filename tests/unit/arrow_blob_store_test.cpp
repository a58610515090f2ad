#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/storage_factory.hpp"
#include "internal/util/errors.hpp"

namespace {

using masterplan::storage::StorageFactory;
using masterplan::storage::common::BufferFromString;
using masterplan::storage::common::ToStringView;

template <typename Error, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

struct TempRoot {
  std::filesystem::path path;

  TempRoot() {
    const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    path             = std::filesystem::temp_directory_path() / ("masterplan_arrow_blob_store_" + std::to_string(stamp));
  }
  ~TempRoot() {
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
  }
};

StorageFactory::Stores BuildStores(const TempRoot& root) {
  masterplan::runtime::config::StorageConfig cfg;
  cfg.set_root_uri((root.path / "data").string());
  cfg.set_scratch_dir((root.path / "scratch").string());
  return StorageFactory::Build(cfg);
}

void TestReleaseArtifactsAreNeverRewritten() {
  TempRoot root;
  auto     stores = BuildStores(root);
  auto&    store  = *stores.releases;

  const std::string key = "harbour-view/releases/rel_20240501123000_0a1b2c3d/release.json";
  store.Write(key, BufferFromString("{\"version\": 3}"));
  assert(store.Exists(key));
  assert(Throws<masterplan::util::StorageError>([&] { store.Write(key, BufferFromString("{}")); }));
  assert(ToStringView(*store.Read(key)) == "{\"version\": 3}");
  assert(std::filesystem::exists(root.path / "data" / key));

  // no partial files are left behind
  assert(store.List("harbour-view").size() == 1);
}

void TestUploadsCanBeReplaced() {
  TempRoot root;
  auto     stores = BuildStores(root);
  auto&    store  = *stores.releases;

  store.Put("harbour-view/uploads/drafts/draft-1.json", BufferFromString("a"));
  store.Put("harbour-view/uploads/drafts/draft-1.json", BufferFromString("b"));
  assert(ToStringView(*store.Read("harbour-view/uploads/drafts/draft-1.json")) == "b");
  assert(Throws<masterplan::util::NotFound>([&] { (void)store.Read("harbour-view/uploads/drafts/draft-2.json"); }));
}

void TestListAndRemovePrefix() {
  TempRoot root;
  auto     stores  = BuildStores(root);
  auto&    scratch = *stores.scratch;

  scratch.Put("jobs/j1/tiles/1/0_0.png", BufferFromString("x"));
  scratch.Put("jobs/j1/tiles/0/0_0.png", BufferFromString("x"));
  scratch.Put("jobs/j10/tiles/0/0_0.png", BufferFromString("x"));

  const auto keys = scratch.List("jobs/j1");
  assert((keys == std::vector<std::string>{"jobs/j1/tiles/0/0_0.png", "jobs/j1/tiles/1/0_0.png"}));
  assert(scratch.List("jobs/none").empty());

  scratch.RemovePrefix("jobs/j1");
  assert(scratch.List("jobs/j1").empty());
  assert(scratch.Exists("jobs/j10/tiles/0/0_0.png"));

  scratch.RemovePrefix("jobs/j1");
  scratch.Remove("jobs/j10/tiles/0/0_0.png");
  assert(!scratch.Exists("jobs/j10/tiles/0/0_0.png"));
}

void TestKeysMayNotEscapeTheRoot() {
  TempRoot root;
  auto     stores = BuildStores(root);
  assert(Throws<masterplan::util::ValidationError>([&] { stores.releases->Put("../outside", BufferFromString("x")); }));
  assert(Throws<masterplan::util::ValidationError>([&] { (void)stores.releases->Read("/etc/passwd"); }));
}

} // namespace

int main() {
  TestReleaseArtifactsAreNeverRewritten();
  TestUploadsCanBeReplaced();
  TestListAndRemovePrefix();
  TestKeysMayNotEscapeTheRoot();

  std::cout << "masterplan_unit_arrow_blob_store: pass\n";
  return 0;
}
