// Pseudo-directory listing and content operations of the object store pane.

#include "test_harness.h"

#include "MemoryObjectStore.h"
#include "ObjectStorePane.h"

#include <stdexcept>

#include <wx/init.h>

namespace {

std::shared_ptr<MemoryObjectStore> SampleStore() {
  auto store = std::make_shared<MemoryObjectStore>();
  store->Seed("a/b.txt", "bee");
  store->Seed("a/c/d.txt", "dee");
  store->Seed("a/e.txt", "eee");
  store->Seed("top.txt", "top");
  return store;
}

void MoveCursorTo(StoragePane& pane, const std::string& name) {
  const auto entries = pane.GetEntries();
  for (std::size_t i = 0; i < entries.size(); i++) {
    pane.Next();
    if (entries[*pane.GetCursor()].name == name) return;
  }
  throw std::runtime_error("entry not found: " + name);
}

std::vector<std::string> Names(const std::vector<Entry>& entries) {
  std::vector<std::string> out;
  for (const auto& e : entries) out.push_back(e.name);
  return out;
}

class UnsizedStream final : public ByteStream {
public:
  std::optional<std::uint64_t> Size() const override { return std::nullopt; }
  OpResult Read(std::vector<char>& chunk, std::size_t) override {
    chunk.clear();
    return Success();
  }
};

}  // namespace

TEST(lists_direct_children_of_prefix) {
  const std::vector<ObjectInfo> objects = {
      {.key = "a/b.txt", .size = 3},
      {.key = "a/c/d.txt", .size = 3},
      {.key = "a/e.txt", .size = 3},
  };
  const auto entries = ObjectStorePane::TopLevelEntries("a/", objects);
  ASSERT_EQ(entries.size(), 3u);
  ASSERT_EQ(entries[0].name, "b.txt");
  ASSERT_EQ(entries[0].kind, EntryKind::File);
  ASSERT_EQ(entries[1].name, "c/");
  ASSERT_EQ(entries[1].kind, EntryKind::Directory);
  ASSERT_EQ(entries[2].name, "e.txt");
  ASSERT_EQ(entries[2].kind, EntryKind::File);
}

TEST(directory_marker_and_children_collapse) {
  const std::vector<ObjectInfo> objects = {
      {.key = "a/"},
      {.key = "a/c/"},
      {.key = "a/c/d.txt", .size = 1},
      {.key = "a/c/x/y.txt", .size = 1},
  };
  const auto entries = ObjectStorePane::TopLevelEntries("a/", objects);
  ASSERT_EQ(entries.size(), 1u);
  ASSERT_EQ(entries[0].name, "c/");
  ASSERT_EQ(entries[0].kind, EntryKind::Directory);
}

TEST(file_metadata_carried) {
  const std::vector<ObjectInfo> objects = {{.key = "f.bin", .size = 42, .lastModified = 1700000000}};
  const auto entries = ObjectStorePane::TopLevelEntries("", objects);
  ASSERT_EQ(entries.size(), 1u);
  ASSERT_EQ(entries[0].size, std::optional<std::uint64_t>(42));
  ASSERT_EQ(entries[0].modified, std::optional<std::int64_t>(1700000000));
}

TEST(prefix_arithmetic) {
  ASSERT_EQ(ObjectStorePane::ChildPrefix("a/", "c/"), std::optional<std::string>("a/c/"));
  ASSERT_EQ(ObjectStorePane::ChildPrefix("", "a/"), std::optional<std::string>("a/"));
  ASSERT_FALSE(ObjectStorePane::ChildPrefix("a/", "b.txt").has_value());

  ASSERT_EQ(ObjectStorePane::ParentPrefix("a/c/"), std::optional<std::string>("a/"));
  ASSERT_EQ(ObjectStorePane::ParentPrefix("a/"), std::optional<std::string>(""));
  ASSERT_FALSE(ObjectStorePane::ParentPrefix("").has_value());
}

TEST(refresh_lists_bucket_root) {
  ObjectStorePane pane(SampleStore());
  ASSERT_TRUE(pane.Refresh().ok);
  ASSERT_EQ(Names(pane.GetEntries()), (std::vector<std::string>{"a/", "top.txt"}));
  ASSERT_EQ(pane.Snapshot().Title(), "test-bucket@S3:");
}

TEST(into_then_out_restores_prefix) {
  ObjectStorePane pane(SampleStore(), "a/");
  ASSERT_TRUE(pane.Refresh().ok);
  MoveCursorTo(pane, "c/");

  ASSERT_EQ(pane.NavigateIntoSelected(), std::optional<std::string>("a/"));
  ASSERT_EQ(pane.GetCurrentLocation(), "a/c/");
  ASSERT_TRUE(pane.Refresh().ok);
  ASSERT_EQ(Names(pane.GetEntries()), (std::vector<std::string>{"d.txt"}));

  ASSERT_EQ(pane.NavigateOut(), std::optional<std::string>("a/c/"));
  ASSERT_EQ(pane.GetCurrentLocation(), "a/");
  ASSERT_FALSE(pane.GetCursor().has_value());
}

TEST(navigate_into_file_is_noop) {
  ObjectStorePane pane(SampleStore(), "a/");
  ASSERT_TRUE(pane.Refresh().ok);
  MoveCursorTo(pane, "b.txt");
  ASSERT_FALSE(pane.NavigateIntoSelected().has_value());
  ASSERT_EQ(pane.GetCurrentLocation(), "a/");
}

TEST(navigate_out_at_root_is_noop) {
  ObjectStorePane pane(SampleStore());
  ASSERT_FALSE(pane.NavigateOut().has_value());
  ASSERT_EQ(pane.GetCurrentLocation(), "");
}

TEST(failed_refresh_keeps_entries) {
  auto store = SampleStore();
  ObjectStorePane pane(store, "a/");
  ASSERT_TRUE(pane.Refresh().ok);
  const auto before = pane.GetEntries();

  store->FailList("a/");
  const auto res = pane.Refresh();
  ASSERT_FALSE(res.ok);
  ASSERT_EQ(res.error.kind, ErrorKind::NotFound);
  ASSERT_EQ(res.error.message, "(File: a/) injected failure");
  ASSERT_EQ(pane.GetEntries(), before);
}

TEST(put_and_delete_patch_entries) {
  auto store = SampleStore();
  ObjectStorePane pane(store, "a/");
  ASSERT_TRUE(pane.Refresh().ok);

  MemoryByteStream body("new content");
  ASSERT_TRUE(pane.PutFile("new.txt", body).ok);
  ASSERT_EQ(store->Content("a/new.txt"), "new content");
  ASSERT_EQ(pane.GetEntries().back().name, "new.txt");
  ASSERT_EQ(pane.GetEntries().back().selection, SelectionState::Unselected);

  ASSERT_TRUE(pane.DeleteFile("b.txt").ok);
  ASSERT_FALSE(store->Contains("a/b.txt"));
  ASSERT_EQ(Names(pane.GetEntries()), (std::vector<std::string>{"c/", "e.txt", "new.txt"}));
}

TEST(put_into_other_location_leaves_entries) {
  auto store = SampleStore();
  ObjectStorePane pane(store, "a/");
  ASSERT_TRUE(pane.Refresh().ok);
  const auto before = pane.GetEntries();

  MemoryByteStream body("x");
  ASSERT_TRUE(pane.PutFile("other/", "x.txt", body).ok);
  ASSERT_TRUE(store->Contains("other/x.txt"));
  ASSERT_EQ(pane.GetEntries(), before);
}

TEST(get_stream_reads_object) {
  ObjectStorePane pane(SampleStore(), "a/");
  auto opened = pane.GetFileStream("e.txt");
  ASSERT_TRUE(opened.status.ok);
  std::string content;
  ASSERT_TRUE(ReadAll(*opened.stream, content).ok);
  ASSERT_EQ(content, "eee");
}

TEST(errors_name_the_key) {
  auto store = SampleStore();
  store->FailDelete("a/e.txt");
  ObjectStorePane pane(store, "a/");

  const auto missing = pane.GetFileStream("nope.txt");
  ASSERT_FALSE(missing.status.ok);
  ASSERT_EQ(missing.status.error.code, "NoSuchKey");
  ASSERT_EQ(missing.status.error.message, "(File: a/nope.txt) injected failure");

  const auto denied = pane.DeleteFile("e.txt");
  ASSERT_FALSE(denied.ok);
  ASSERT_EQ(denied.error.kind, ErrorKind::PermissionDenied);
}

TEST(put_requires_known_size) {
  ObjectStorePane pane(SampleStore(), "a/");
  UnsizedStream body;
  bool threw = false;
  try {
    (void)pane.PutFile("x.txt", body);
  } catch (const std::logic_error&) {
    threw = true;
  }
  ASSERT_TRUE(threw);
}

TEST(selection_over_pseudo_directories) {
  ObjectStorePane pane(SampleStore(), "a/");
  ASSERT_TRUE(pane.Refresh().ok);

  MoveCursorTo(pane, "c/");
  pane.ToggleSelected(SelectionState::ToDelete);
  MoveCursorTo(pane, "e.txt");
  pane.ToggleSelected(SelectionState::ToDelete);

  ASSERT_EQ(pane.GetSelected(SelectionState::ToDelete), (std::vector<std::string>{"e.txt"}));
}

int main() {
  wxInitializer init;
  if (!init.IsOk()) return 1;
  return test_harness::RunAllTests() == 0 ? 0 : 1;
}
