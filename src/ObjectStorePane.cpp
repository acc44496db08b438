#include "ObjectStorePane.h"

#include <set>
#include <stdexcept>

namespace {
OpResult WithFile(OpResult res, const std::string& file) {
  if (!res.ok) res.error.message = "(File: " + file + ") " + res.error.message;
  return res;
}
}  // namespace

ObjectStorePane::ObjectStorePane(std::shared_ptr<ObjectStoreClient> client, std::string prefix)
    : StoragePane(std::move(prefix)), client_(std::move(client)) {}

std::vector<Entry> ObjectStorePane::TopLevelEntries(const std::string& prefix,
                                                    const std::vector<ObjectInfo>& objects) {
  // Directories come from any deeper key, not only from "<name>/" marker objects.
  std::vector<Entry> entries;
  std::set<std::string> dirs;

  for (const auto& obj : objects) {
    if (obj.key.size() <= prefix.size()) continue;
    if (obj.key.compare(0, prefix.size(), prefix) != 0) continue;

    const auto suffix = obj.key.substr(prefix.size());
    const auto delim = suffix.find(kDelimiter);
    if (delim == std::string::npos) {
      entries.push_back(Entry{
          .name = suffix,
          .kind = EntryKind::File,
          .size = obj.size,
          .modified = obj.lastModified,
      });
      continue;
    }

    auto dirName = suffix.substr(0, delim + 1);
    if (!dirs.insert(dirName).second) continue;
    entries.push_back(Entry{
        .name = std::move(dirName),
        .kind = EntryKind::Directory,
        .modified = (delim + 1 == suffix.size()) ? obj.lastModified : std::nullopt,
    });
  }
  return entries;
}

std::optional<std::string> ObjectStorePane::ChildPrefix(const std::string& prefix, const std::string& name) {
  if (!EndsWith(name, kDelimiter)) return std::nullopt;
  return AppendPathToDir(prefix, name);
}

std::optional<std::string> ObjectStorePane::ParentPrefix(const std::string& prefix) {
  if (prefix.empty()) return std::nullopt;
  if (prefix.size() < 2) return std::string();

  // Skip the trailing delimiter of the current prefix.
  const auto delim = prefix.find_last_of(kDelimiter, prefix.size() - 2);
  if (delim == std::string::npos) return std::string();
  return prefix.substr(0, delim + 1);
}

OpResult ObjectStorePane::ListLocation(const std::string& location, std::vector<Entry>& out) {
  auto listed = client_->ListObjects(location);
  if (!listed.status.ok) return WithFile(std::move(listed.status), location);

  out = TopLevelEntries(location, listed.objects);
  return Success();
}

std::optional<std::string> ObjectStorePane::ChildLocation(const std::string& location,
                                                          const Entry& entry) const {
  return ChildPrefix(location, entry.name);
}

std::optional<std::string> ObjectStorePane::ParentLocation(const std::string& location) const {
  return ParentPrefix(location);
}

StreamResult ObjectStorePane::OpenRead(const std::string& dir, const std::string& name) {
  const auto key = AppendPathToDir(dir, name);
  auto res = client_->GetObject(key);
  res.status = WithFile(std::move(res.status), key);
  return res;
}

OpResult ObjectStorePane::Write(const std::string& dir, const std::string& name, ByteStream& stream) {
  if (!stream.Size()) {
    throw std::logic_error("Stream must report its size in order to be sent to S3");
  }
  const auto key = AppendPathToDir(dir, name);
  return WithFile(client_->PutObject(key, stream), key);
}

OpResult ObjectStorePane::Remove(const std::string& dir, const std::string& name) {
  const auto key = AppendPathToDir(dir, name);
  return WithFile(client_->DeleteObject(key), key);
}
