// Entry selection, list cursor and error stack behaviour.

#include "test_harness.h"

#include "Entry.h"
#include "ErrorStack.h"
#include "ListCursor.h"
#include "util.h"

#include <wx/init.h>
#include <wx/log.h>

namespace {
Entry File(const std::string& name) { return Entry{.name = name, .kind = EntryKind::File}; }
Entry Dir(const std::string& name) { return Entry{.name = name, .kind = EntryKind::Directory}; }
}  // namespace

TEST(toggle_marks_and_unmarks_file) {
  auto e = File("a.txt");
  e.Toggle(SelectionState::ToMove);
  ASSERT_EQ(e.selection, SelectionState::ToMove);
  e.Toggle(SelectionState::ToMove);
  ASSERT_EQ(e.selection, SelectionState::Unselected);
}

TEST(toggle_other_mark_clears_existing_mark) {
  auto e = File("a.txt");
  e.Toggle(SelectionState::ToCopy);
  e.Toggle(SelectionState::ToDelete);
  ASSERT_EQ(e.selection, SelectionState::Unselected);
}

TEST(processing_is_forced_and_idempotent) {
  auto e = File("a.txt");
  e.Toggle(SelectionState::ToDelete);
  e.Toggle(SelectionState::Processing);
  ASSERT_EQ(e.selection, SelectionState::Processing);
  e.Toggle(SelectionState::Processing);
  ASSERT_EQ(e.selection, SelectionState::Processing);

  auto d = Dir("photos/");
  d.Toggle(SelectionState::Processing);
  ASSERT_EQ(d.selection, SelectionState::Processing);
}

TEST(directory_rejects_marks) {
  auto d = Dir("photos/");
  d.Toggle(SelectionState::ToDelete);
  ASSERT_EQ(d.selection, SelectionState::Unselected);
  d.Toggle(SelectionState::ToMove);
  ASSERT_EQ(d.selection, SelectionState::Unselected);

  Entry unknown{.name = "socket", .kind = EntryKind::Unknown};
  unknown.Toggle(SelectionState::ToCopy);
  ASSERT_EQ(unknown.selection, SelectionState::Unselected);
}

TEST(selection_markers) {
  ASSERT_EQ(std::string(SelectionMarker(SelectionState::ToMove)), " [M]");
  ASSERT_EQ(std::string(SelectionMarker(SelectionState::ToCopy)), " [C]");
  ASSERT_EQ(std::string(SelectionMarker(SelectionState::ToDelete)), " [D]");
  ASSERT_EQ(std::string(SelectionMarker(SelectionState::Processing)), " [/]");
  ASSERT_EQ(std::string(SelectionMarker(SelectionState::Unselected)), "");
}

TEST(cursor_starts_at_zero_and_wraps) {
  ListCursor c;
  ASSERT_FALSE(c.Get().has_value());
  c.Next(3);
  ASSERT_EQ(c.Get(), std::optional<std::size_t>(0));
  c.Previous(3);
  ASSERT_EQ(c.Get(), std::optional<std::size_t>(2));
  c.Next(3);
  ASSERT_EQ(c.Get(), std::optional<std::size_t>(0));
}

TEST(cursor_full_cycle_returns_to_start) {
  for (std::size_t len = 1; len <= 5; len++) {
    ListCursor c;
    c.Next(len);
    c.Next(len);
    const auto start = c.Get();
    for (std::size_t i = 0; i < len; i++) c.Next(len);
    ASSERT_EQ(c.Get(), start);
    for (std::size_t i = 0; i < len; i++) c.Previous(len);
    ASSERT_EQ(c.Get(), start);
  }
}

TEST(cursor_noop_on_empty_list) {
  ListCursor c;
  c.Next(0);
  c.Previous(0);
  ASSERT_FALSE(c.Get().has_value());
}

TEST(cursor_follows_removals) {
  ListCursor c;
  c.Next(5);
  c.Next(5);
  c.Next(5);  // at 2
  c.OnRemoved(0);
  ASSERT_EQ(c.Get(), std::optional<std::size_t>(1));
  c.OnRemoved(3);
  ASSERT_EQ(c.Get(), std::optional<std::size_t>(1));
  c.OnRemoved(1);
  ASSERT_FALSE(c.Get().has_value());
}

TEST(cursor_clamps_to_shorter_list) {
  ListCursor c;
  c.Previous(4);
  c.Previous(4);  // at 3
  c.Clamp(2);
  ASSERT_EQ(c.Get(), std::optional<std::size_t>(1));
  c.Clamp(0);
  ASSERT_FALSE(c.Get().has_value());
}

TEST(error_stack_keeps_order_until_cleared) {
  ErrorStack errors;
  ASSERT_TRUE(errors.Empty());
  errors.Push(ErrorRecord{.domain = "S3", .kind = ErrorKind::NotFound, .code = "NoSuchKey", .message = "a"});
  errors.PushIfFailed(Success());
  errors.PushIfFailed(Failure("Local Filesystem", ErrorKind::Unsupported, "Unsupported", "b"));

  const auto records = errors.Snapshot();
  ASSERT_EQ(records.size(), 2u);
  ASSERT_EQ(records[0].message, "a");
  ASSERT_EQ(records[1].message, "b");

  errors.Clear();
  ASSERT_TRUE(errors.Empty());
}

TEST(error_record_line_format) {
  const ErrorRecord r{.domain = "S3", .kind = ErrorKind::NotFound, .code = "NoSuchKey", .message = "gone"};
  ASSERT_EQ(FormatErrorRecord(r), "S3 Err: NoSuchKey - gone");
}

TEST(log_output_moves_off_dialogs) {
  delete wxLog::SetActiveTarget(new wxLogBuffer());
  LogToStderr();
  auto* first = wxLog::GetActiveTarget();
  ASSERT_TRUE(dynamic_cast<wxLogStderr*>(first) != nullptr);

  // A second call keeps the installed target.
  LogToStderr();
  ASSERT_EQ(wxLog::GetActiveTarget(), first);

  ErrorStack errors;
  errors.Push(ErrorRecord{.domain = "S3", .code = "X", .message = "logged, not shown"});
  ASSERT_EQ(wxLog::GetActiveTarget(), first);
}

TEST(path_join) {
  ASSERT_EQ(AppendPathToDir("", "a.txt"), "a.txt");
  ASSERT_EQ(AppendPathToDir("photos/", "a.txt"), "photos/a.txt");
  ASSERT_EQ(AppendPathToDir("/tmp", "a.txt"), "/tmp/a.txt");
}

int main() {
  wxInitializer init;
  if (!init.IsOk()) return 1;
  return test_harness::RunAllTests() == 0 ? 0 : 1;
}
