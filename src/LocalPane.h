#pragma once

#include "StoragePane.h"

#include <string>

// Pane over the local filesystem, driven through GIO so any location GVfs
// can mount (sftp://, smb://, ...) behaves like a local directory.
// Locations are native paths, or URIs for non-native locations.
class LocalPane final : public StoragePane {
public:
  static constexpr const char* kDomain = "Local Filesystem";

  // `startLocation` may be a path or URI; empty means the working directory.
  explicit LocalPane(const std::string& startLocation);

  std::string ResourceLabel() const override;
  std::string ProviderLabel() const override { return "local"; }

protected:
  OpResult ListLocation(const std::string& location, std::vector<Entry>& out) override;
  std::optional<std::string> ChildLocation(const std::string& location,
                                           const Entry& entry) const override;
  std::optional<std::string> ParentLocation(const std::string& location) const override;

  StreamResult OpenRead(const std::string& dir, const std::string& name) override;
  OpResult Write(const std::string& dir, const std::string& name, ByteStream& stream) override;
  OpResult Remove(const std::string& dir, const std::string& name) override;
};
