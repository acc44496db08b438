#include "AwsCredentials.h"

#include <wx/fileconf.h>
#include <wx/filefn.h>
#include <wx/log.h>
#include <wx/utils.h>

namespace aws {

namespace {
constexpr const char* kDefaultRegion = "us-east-1";

std::optional<std::string> Env(const char* name) {
  wxString value;
  if (!wxGetEnv(name, &value) || value.empty()) return std::nullopt;
  return value.ToStdString();
}

std::string AwsDirFile(const char* overrideVar, const char* fileName) {
  if (auto path = Env(overrideVar)) return *path;
  return (wxGetHomeDir() + "/.aws/" + fileName).ToStdString();
}
}  // namespace

std::string ResolveProfile(const std::string& requested) {
  if (!requested.empty()) return requested;
  if (auto profile = Env("AWS_PROFILE")) return *profile;
  return "default";
}

std::optional<std::string> ReadProfileValue(const std::string& file,
                                            const std::string& profile,
                                            const std::string& key,
                                            bool configFileLayout) {
  if (!wxFileExists(file)) return std::nullopt;

  wxFileConfig ini(wxEmptyString, wxEmptyString, wxString::FromUTF8(file), wxEmptyString,
                   wxCONFIG_USE_LOCAL_FILE);
  const std::string group = (configFileLayout && profile != "default") ? "profile " + profile : profile;

  wxString value;
  if (!ini.Read(wxString::FromUTF8("/" + group + "/" + key), &value)) return std::nullopt;
  value.Trim().Trim(false);
  if (value.empty()) return std::nullopt;
  return value.ToStdString();
}

std::optional<Credentials> ResolveCredentials(const std::string& profile) {
  auto envKey = Env("AWS_ACCESS_KEY_ID");
  auto envSecret = Env("AWS_SECRET_ACCESS_KEY");
  if (envKey && envSecret) {
    wxLogVerbose("Using AWS credentials from the environment");
    return Credentials{
        .accessKeyId = *envKey,
        .secretAccessKey = *envSecret,
        .sessionToken = Env("AWS_SESSION_TOKEN").value_or(""),
    };
  }

  const auto file = AwsDirFile("AWS_SHARED_CREDENTIALS_FILE", "credentials");
  auto key = ReadProfileValue(file, profile, "aws_access_key_id", false);
  auto secret = ReadProfileValue(file, profile, "aws_secret_access_key", false);
  if (!key || !secret) return std::nullopt;

  wxLogVerbose("Using AWS credentials of profile '%s' from %s", profile, file);
  return Credentials{
      .accessKeyId = *key,
      .secretAccessKey = *secret,
      .sessionToken = ReadProfileValue(file, profile, "aws_session_token", false).value_or(""),
  };
}

std::string ResolveRegion(const std::string& requested, const std::string& profile) {
  if (!requested.empty()) return requested;
  if (auto region = Env("AWS_REGION")) return *region;
  if (auto region = Env("AWS_DEFAULT_REGION")) return *region;

  const auto file = AwsDirFile("AWS_CONFIG_FILE", "config");
  if (auto region = ReadProfileValue(file, profile, "region", true)) return *region;
  return kDefaultRegion;
}

}  // namespace aws
