#pragma once

#include "ByteStream.h"
#include "Entry.h"
#include "ListCursor.h"
#include "util.h"

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// Everything the renderer needs from one pane, copied under the pane lock.
struct PaneSnapshot {
  std::vector<Entry> entries{};
  std::optional<std::size_t> cursor{};
  std::string location{};
  std::string resourceLabel{};
  std::string providerLabel{};

  // "<resource>@<provider>:<location>"
  std::string Title() const;

  bool operator==(const PaneSnapshot&) const = default;
};

// One side of the dual-pane view bound to a storage backend. Navigation,
// cursor and selection live here; concrete backends supply listing,
// location arithmetic and content operations.
//
// Entries and cursor are guarded by one mutex so transfer tasks running on
// worker threads can patch the list while the UI thread reads it.
class StoragePane {
public:
  virtual ~StoragePane() = default;

  StoragePane(const StoragePane&) = delete;
  StoragePane& operator=(const StoragePane&) = delete;

  // Re-lists the current location. On failure entries, cursor and location
  // are left untouched.
  OpResult Refresh();

  // Proposes a new location without listing it; callers refresh afterwards
  // and roll back on failure. Both return the location that was left, or
  // nothing when the pane did not move (cursor not on a directory, already
  // at the root).
  std::optional<std::string> NavigateIntoSelected();
  std::optional<std::string> NavigateOut();
  void RestoreLocation(const std::string& location);

  std::string GetCurrentLocation() const;

  void Next();
  void Previous();
  void ClearCursor();
  std::optional<std::size_t> GetCursor() const;

  // Applies a selection key to the entry under the cursor.
  void ToggleSelected(SelectionState requested);
  // Names holding exactly `state`, in list order.
  std::vector<std::string> GetSelected(SelectionState state) const;

  void MarkProcessing(const std::string& name);
  void ClearProcessing(const std::string& name);

  std::vector<Entry> GetEntries() const;
  PaneSnapshot Snapshot() const;

  // Content operations. The single-argument forms resolve `name` against
  // the current location; transfer tasks pass the directory captured when
  // they were issued.
  StreamResult GetFileStream(const std::string& name);
  StreamResult GetFileStream(const std::string& dir, const std::string& name);
  OpResult PutFile(const std::string& name, ByteStream& stream);
  OpResult PutFile(const std::string& dir, const std::string& name, ByteStream& stream);
  OpResult DeleteFile(const std::string& name);
  OpResult DeleteFile(const std::string& dir, const std::string& name);

  virtual std::string ResourceLabel() const = 0;
  virtual std::string ProviderLabel() const = 0;

protected:
  explicit StoragePane(std::string location);

  virtual OpResult ListLocation(const std::string& location, std::vector<Entry>& out) = 0;
  virtual std::optional<std::string> ChildLocation(const std::string& location,
                                                   const Entry& entry) const = 0;
  virtual std::optional<std::string> ParentLocation(const std::string& location) const = 0;

  virtual StreamResult OpenRead(const std::string& dir, const std::string& name) = 0;
  virtual OpResult Write(const std::string& dir, const std::string& name, ByteStream& stream) = 0;
  virtual OpResult Remove(const std::string& dir, const std::string& name) = 0;

private:
  // Entry patches applied after a successful put/delete, skipped when the
  // pane has since moved elsewhere.
  void InsertEntry(const std::string& dir, const std::string& name, std::optional<std::uint64_t> size);
  void RemoveEntry(const std::string& dir, const std::string& name);

  Entry* FindLocked(const std::string& name);

  mutable std::mutex mu_{};
  std::string location_;
  std::vector<Entry> entries_{};
  ListCursor cursor_{};
};
