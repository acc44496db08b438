#pragma once

#include <optional>
#include <string>

namespace aws {

struct Credentials {
  std::string accessKeyId;
  std::string secretAccessKey;
  std::string sessionToken;  // empty unless temporary credentials
};

// `requested` when non-empty, otherwise AWS_PROFILE, otherwise "default".
std::string ResolveProfile(const std::string& requested);

// Environment first, then the shared credentials file for `profile`.
std::optional<Credentials> ResolveCredentials(const std::string& profile);

// `requested`, AWS_REGION, AWS_DEFAULT_REGION, ~/.aws/config, us-east-1.
std::string ResolveRegion(const std::string& requested, const std::string& profile);

// Reads `key` of `profile` from an INI file in the shared AWS layout.
// The config file names non-default profiles "[profile <name>]".
std::optional<std::string> ReadProfileValue(const std::string& file,
                                            const std::string& profile,
                                            const std::string& key,
                                            bool configFileLayout);

}  // namespace aws
