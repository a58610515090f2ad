#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/ram/ram_blob_store.hpp"
#include "internal/util/errors.hpp"

namespace {

using masterplan::storage::RamBlobStore;
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

void TestWriteIsCreateOnly() {
  RamBlobStore store;
  store.Write("p/releases/r1/release.json", BufferFromString("v1"));
  assert(Throws<masterplan::util::StorageError>([&] { store.Write("p/releases/r1/release.json", BufferFromString("v2")); }));
  assert(ToStringView(*store.Read("p/releases/r1/release.json")) == "v1");

  store.Put("p/uploads/plan.png", BufferFromString("a"));
  store.Put("p/uploads/plan.png", BufferFromString("b"));
  assert(ToStringView(*store.Read("p/uploads/plan.png")) == "b");
  assert(store.Size() == 2);
}

void TestReadsAreZeroCopy() {
  RamBlobStore store;
  auto         buffer = BufferFromString("tile");
  store.Put("p/tiles/0/0_0.png", buffer);
  assert(store.Read("p/tiles/0/0_0.png").get() == buffer.get());
}

void TestListStopsAtSegmentBoundary() {
  RamBlobStore store;
  store.Put("p/tiles/0/0_0.png", BufferFromString("x"));
  store.Put("p/tiles/1/0_0.png", BufferFromString("x"));
  store.Put("p/tiles.dzi", BufferFromString("x"));
  store.Put("p/tilesets/a", BufferFromString("x"));
  store.Put("q/tiles/0/0_0.png", BufferFromString("x"));

  const auto keys = store.List("p/tiles");
  assert((keys == std::vector<std::string>{"p/tiles/0/0_0.png", "p/tiles/1/0_0.png"}));
  assert(store.List("").size() == 5);
  assert(store.List("p/none").empty());
}

void TestRemovePrefixKeepsSiblings() {
  RamBlobStore store;
  store.Put("jobs/j1/tiles/0/0_0.png", BufferFromString("x"));
  store.Put("jobs/j1/tiles/1/0_0.png", BufferFromString("x"));
  store.Put("jobs/j10/tiles/0/0_0.png", BufferFromString("x"));

  store.RemovePrefix("jobs/j1");
  assert(store.Size() == 1);
  assert(store.Exists("jobs/j10/tiles/0/0_0.png"));

  // missing keys are not an error
  store.RemovePrefix("jobs/j1");
  store.Remove("jobs/j1/tiles/0/0_0.png");
  assert(store.Size() == 1);
}

void TestMissingAndInvalidKeys() {
  RamBlobStore store;
  assert(Throws<masterplan::util::NotFound>([&] { (void)store.Read("p/missing"); }));
  assert(!store.Exists("p/missing"));

  for (const std::string key : {"", "/abs", "trailing/", "a//b", "a/../b", "a/./b"}) {
    assert(Throws<masterplan::util::ValidationError>([&] { store.Put(key, BufferFromString("x")); }));
  }
  assert(store.Size() == 0);
}

} // namespace

int main() {
  TestWriteIsCreateOnly();
  TestReadsAreZeroCopy();
  TestListStopsAtSegmentBoundary();
  TestRemovePrefixKeepsSiblings();
  TestMissingAndInvalidKeys();

  std::cout << "masterplan_unit_ram_blob_store: pass\n";
  return 0;
}
