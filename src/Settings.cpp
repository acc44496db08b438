#include "Settings.h"

#include <cctype>

#include <wx/config.h>

namespace settings {

namespace {
constexpr const char* kAppName = "Ferry";

std::string ToLower(std::string s) {
  for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

std::string ReadString(wxConfig& cfg, const char* key, const std::string& fallback) {
  wxString value;
  if (!cfg.Read(key, &value)) return fallback;
  return value.ToStdString(wxConvUTF8);
}

void ReadPane(wxConfig& cfg, const char* side, PaneSettings& pane) {
  const auto providerKey = wxString::Format("/panes/%s/provider", side);
  const auto locationKey = wxString::Format("/panes/%s/location", side);

  wxString provider;
  if (cfg.Read(providerKey, &provider)) {
    if (auto p = ParseProvider(provider.ToStdString())) pane.provider = *p;
  }
  wxString location;
  if (cfg.Read(locationKey, &location)) pane.location = location.ToStdString(wxConvUTF8);
}

void WritePane(wxConfig& cfg, const char* side, const PaneSettings& pane) {
  cfg.Write(wxString::Format("/panes/%s/provider", side), wxString::FromUTF8(ProviderName(pane.provider)));
  cfg.Write(wxString::Format("/panes/%s/location", side), wxString::FromUTF8(pane.location));
}
}  // namespace

std::optional<Provider> ParseProvider(const std::string& name) {
  const auto s = ToLower(name);
  if (s == "fs") return Provider::Filesystem;
  if (s == "s3") return Provider::S3;
  return std::nullopt;
}

std::string ProviderName(Provider p) {
  switch (p) {
    case Provider::Filesystem: return "fs";
    case Provider::S3: return "s3";
  }
  return "fs";
}

Settings Load() {
  wxConfig cfg(kAppName);
  Settings s;

  ReadPane(cfg, "left", s.left);
  ReadPane(cfg, "right", s.right);

  s.bucket = ReadString(cfg, "/s3/bucket", s.bucket);
  s.region = ReadString(cfg, "/s3/region", s.region);
  s.endpoint = ReadString(cfg, "/s3/endpoint", s.endpoint);
  s.profile = ReadString(cfg, "/s3/profile", s.profile);

  long workers = 0;
  if (cfg.Read("/transfer/workers", &workers) && workers > 0) s.workers = workers;
  return s;
}

void Save(const Settings& s) {
  wxConfig cfg(kAppName);

  WritePane(cfg, "left", s.left);
  WritePane(cfg, "right", s.right);

  cfg.Write("/s3/bucket", wxString::FromUTF8(s.bucket));
  cfg.Write("/s3/region", wxString::FromUTF8(s.region));
  cfg.Write("/s3/endpoint", wxString::FromUTF8(s.endpoint));
  cfg.Write("/s3/profile", wxString::FromUTF8(s.profile));
  cfg.Write("/transfer/workers", s.workers);
  cfg.Flush();
}

}  // namespace settings
