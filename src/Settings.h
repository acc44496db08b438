#pragma once

#include <optional>
#include <string>

namespace settings {

enum class Provider { Filesystem, S3 };

// "fs" / "s3" (case-insensitive); nothing for anything else.
std::optional<Provider> ParseProvider(const std::string& name);
std::string ProviderName(Provider p);

struct PaneSettings {
  Provider provider{Provider::Filesystem};
  // Directory for the filesystem, key prefix for S3.
  std::string location;
};

struct Settings {
  PaneSettings left{};
  PaneSettings right{};
  std::string bucket;
  std::string region;
  std::string endpoint;
  std::string profile;
  long workers{4};
};

// Persisted defaults; missing or unparsable values keep the built-in ones.
Settings Load();
void Save(const Settings& s);

}  // namespace settings
