#include "StoragePane.h"

#include <algorithm>
#include <utility>

#include <wx/log.h>

std::string PaneSnapshot::Title() const {
  return resourceLabel + "@" + providerLabel + ":" + location;
}

StoragePane::StoragePane(std::string location) : location_(std::move(location)) {}

OpResult StoragePane::Refresh() {
  const auto location = GetCurrentLocation();

  std::vector<Entry> listed;
  auto res = ListLocation(location, listed);
  if (!res.ok) return res;

  std::lock_guard<std::mutex> lock(mu_);
  if (location_ != location) {
    // Navigated while listing; the newer location gets its own refresh.
    return Success();
  }
  entries_ = std::move(listed);
  cursor_.Clamp(entries_.size());
  return Success();
}

std::optional<std::string> StoragePane::NavigateIntoSelected() {
  std::lock_guard<std::mutex> lock(mu_);
  const auto index = cursor_.Get();
  if (!index || *index >= entries_.size()) return std::nullopt;

  const auto& entry = entries_[*index];
  if (entry.kind != EntryKind::Directory) return std::nullopt;

  auto child = ChildLocation(location_, entry);
  if (!child) return std::nullopt;

  auto previous = std::exchange(location_, std::move(*child));
  cursor_.Clear();
  return previous;
}

std::optional<std::string> StoragePane::NavigateOut() {
  std::lock_guard<std::mutex> lock(mu_);
  auto parent = ParentLocation(location_);
  if (!parent) return std::nullopt;

  auto previous = std::exchange(location_, std::move(*parent));
  cursor_.Clear();
  return previous;
}

void StoragePane::RestoreLocation(const std::string& location) {
  std::lock_guard<std::mutex> lock(mu_);
  location_ = location;
  cursor_.Clear();
}

std::string StoragePane::GetCurrentLocation() const {
  std::lock_guard<std::mutex> lock(mu_);
  return location_;
}

void StoragePane::Next() {
  std::lock_guard<std::mutex> lock(mu_);
  cursor_.Next(entries_.size());
}

void StoragePane::Previous() {
  std::lock_guard<std::mutex> lock(mu_);
  cursor_.Previous(entries_.size());
}

void StoragePane::ClearCursor() {
  std::lock_guard<std::mutex> lock(mu_);
  cursor_.Clear();
}

std::optional<std::size_t> StoragePane::GetCursor() const {
  std::lock_guard<std::mutex> lock(mu_);
  return cursor_.Get();
}

void StoragePane::ToggleSelected(SelectionState requested) {
  std::lock_guard<std::mutex> lock(mu_);
  const auto index = cursor_.Get();
  if (!index || *index >= entries_.size()) return;
  entries_[*index].Toggle(requested);
}

std::vector<std::string> StoragePane::GetSelected(SelectionState state) const {
  std::lock_guard<std::mutex> lock(mu_);
  std::vector<std::string> names;
  for (const auto& e : entries_) {
    if (e.selection == state) names.push_back(e.name);
  }
  return names;
}

void StoragePane::MarkProcessing(const std::string& name) {
  std::lock_guard<std::mutex> lock(mu_);
  if (auto* e = FindLocked(name)) e->Toggle(SelectionState::Processing);
}

void StoragePane::ClearProcessing(const std::string& name) {
  std::lock_guard<std::mutex> lock(mu_);
  auto* e = FindLocked(name);
  if (e && e->selection == SelectionState::Processing) e->selection = SelectionState::Unselected;
}

std::vector<Entry> StoragePane::GetEntries() const {
  std::lock_guard<std::mutex> lock(mu_);
  return entries_;
}

PaneSnapshot StoragePane::Snapshot() const {
  PaneSnapshot snap;
  {
    std::lock_guard<std::mutex> lock(mu_);
    snap.entries = entries_;
    snap.cursor = cursor_.Get();
    snap.location = location_;
  }
  snap.resourceLabel = ResourceLabel();
  snap.providerLabel = ProviderLabel();
  return snap;
}

StreamResult StoragePane::GetFileStream(const std::string& name) {
  return GetFileStream(GetCurrentLocation(), name);
}

StreamResult StoragePane::GetFileStream(const std::string& dir, const std::string& name) {
  return OpenRead(dir, name);
}

OpResult StoragePane::PutFile(const std::string& name, ByteStream& stream) {
  return PutFile(GetCurrentLocation(), name, stream);
}

OpResult StoragePane::PutFile(const std::string& dir, const std::string& name, ByteStream& stream) {
  const auto size = stream.Size();
  auto res = Write(dir, name, stream);
  if (!res.ok) return res;
  InsertEntry(dir, name, size);
  return res;
}

OpResult StoragePane::DeleteFile(const std::string& name) {
  return DeleteFile(GetCurrentLocation(), name);
}

OpResult StoragePane::DeleteFile(const std::string& dir, const std::string& name) {
  auto res = Remove(dir, name);
  if (!res.ok) return res;
  RemoveEntry(dir, name);
  return res;
}

void StoragePane::InsertEntry(const std::string& dir,
                              const std::string& name,
                              std::optional<std::uint64_t> size) {
  std::lock_guard<std::mutex> lock(mu_);
  if (location_ != dir) return;
  if (FindLocked(name)) return;

  entries_.push_back(Entry{
      .name = name,
      .kind = EntryKind::File,
      .selection = SelectionState::Unselected,
      .size = size,
  });
  wxLogVerbose("%s: added %s", wxString::FromUTF8(ProviderLabel()), wxString::FromUTF8(name));
}

void StoragePane::RemoveEntry(const std::string& dir, const std::string& name) {
  std::lock_guard<std::mutex> lock(mu_);
  if (location_ != dir) return;

  const auto it = std::find_if(entries_.begin(), entries_.end(),
                               [&name](const Entry& e) { return e.name == name; });
  if (it == entries_.end()) return;

  const auto index = static_cast<std::size_t>(it - entries_.begin());
  entries_.erase(it);
  cursor_.OnRemoved(index);
}

Entry* StoragePane::FindLocked(const std::string& name) {
  for (auto& e : entries_) {
    if (e.name == name) return &e;
  }
  return nullptr;
}
