#include "util.h"

#include <cstdio>
#include <ctime>
#include <utility>

OpResult Failure(std::string domain, ErrorKind kind, std::string code, std::string message) {
  return {.ok = false,
          .error = ErrorRecord{
              .domain = std::move(domain),
              .kind = kind,
              .code = std::move(code),
              .message = std::move(message),
          }};
}

const char* ErrorKindName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::NotFound: return "NotFound";
    case ErrorKind::PermissionDenied: return "PermissionDenied";
    case ErrorKind::AlreadyExists: return "AlreadyExists";
    case ErrorKind::InvalidData: return "InvalidData";
    case ErrorKind::IncompleteTransfer: return "IncompleteTransfer";
    case ErrorKind::Unsupported: return "Unsupported";
    case ErrorKind::Service: return "Service";
    case ErrorKind::Unexpected: return "Unexpected";
  }
  return "Unexpected";
}

std::string FormatErrorRecord(const ErrorRecord& record) {
  return record.domain + " Err: " + record.code + " - " + record.message;
}

std::string HumanSize(std::uintmax_t bytes) {
  static constexpr const char* units[] = {"B", "KB", "MB", "GB", "TB", "PB"};
  double value = static_cast<double>(bytes);
  int unit = 0;
  while (value >= 1024.0 && unit < 5) {
    value /= 1024.0;
    unit++;
  }
  char buf[64];
  if (unit == 0) {
    std::snprintf(buf, sizeof(buf), "%llu %s",
                  static_cast<unsigned long long>(bytes), units[unit]);
  } else {
    std::snprintf(buf, sizeof(buf), "%.1f %s", value, units[unit]);
  }
  return std::string(buf);
}

std::string FormatUnixTime(std::int64_t seconds) {
  const std::time_t tt = static_cast<std::time_t>(seconds);
  std::tm tm{};
  if (!localtime_r(&tt, &tm)) return "";

  char buf[64];
  if (std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M", &tm) == 0) return "";
  return std::string(buf);
}

std::string AppendPathToDir(const std::string& dir, const std::string& name) {
  if (dir.empty()) return name;
  if (dir.back() == '/') return dir + name;
  return dir + "/" + name;
}

bool EndsWith(const std::string& s, char c) { return !s.empty() && s.back() == c; }
