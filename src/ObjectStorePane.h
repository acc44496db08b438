#pragma once

#include "ObjectStoreClient.h"
#include "StoragePane.h"

#include <memory>
#include <string>
#include <vector>

// Pane over an object store. The store has no directories; they are
// reconstructed from '/' inside keys. The location is a key prefix that is
// either empty (bucket root) or ends in the delimiter.
class ObjectStorePane final : public StoragePane {
public:
  static constexpr char kDelimiter = '/';

  explicit ObjectStorePane(std::shared_ptr<ObjectStoreClient> client, std::string prefix = {});

  std::string ResourceLabel() const override { return client_->BucketName(); }
  std::string ProviderLabel() const override { return "S3"; }

  // Entries directly below `prefix`: keys without a further delimiter are
  // files, keys with one become the pseudo-directory up to and including it.
  // The prefix marker object itself is dropped.
  static std::vector<Entry> TopLevelEntries(const std::string& prefix, const std::vector<ObjectInfo>& objects);

  // "a/" + "c/" -> "a/c/"; nothing for names without a trailing delimiter.
  static std::optional<std::string> ChildPrefix(const std::string& prefix, const std::string& name);
  // "a/c/" -> "a/", "a/" -> "", nothing at the root.
  static std::optional<std::string> ParentPrefix(const std::string& prefix);

protected:
  OpResult ListLocation(const std::string& location, std::vector<Entry>& out) override;
  std::optional<std::string> ChildLocation(const std::string& location,
                                           const Entry& entry) const override;
  std::optional<std::string> ParentLocation(const std::string& location) const override;

  StreamResult OpenRead(const std::string& dir, const std::string& name) override;
  // Throws std::logic_error when the stream cannot report its size.
  OpResult Write(const std::string& dir, const std::string& name, ByteStream& stream) override;
  OpResult Remove(const std::string& dir, const std::string& name) override;

private:
  std::shared_ptr<ObjectStoreClient> client_;
};
