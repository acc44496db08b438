#pragma once

#include <cstdint>
#include <string>

// Failure classes shared by every backend. Raw platform and service errors
// are mapped onto these once, where they are produced.
enum class ErrorKind {
  NotFound,
  PermissionDenied,
  AlreadyExists,
  InvalidData,
  IncompleteTransfer,
  Unsupported,
  Service,
  Unexpected,
};

struct ErrorRecord {
  std::string domain;
  ErrorKind kind{ErrorKind::Unexpected};
  std::string code;
  std::string message;
};

struct OpResult {
  bool ok{false};
  ErrorRecord error{};
};

inline OpResult Success() { return {.ok = true}; }
OpResult Failure(std::string domain, ErrorKind kind, std::string code, std::string message);

const char* ErrorKindName(ErrorKind kind);

// "<domain> Err: <code> - <message>", the line shown in the error view.
std::string FormatErrorRecord(const ErrorRecord& record);

std::string HumanSize(std::uintmax_t bytes);
std::string FormatUnixTime(std::int64_t seconds);

// Joins a directory (path or key prefix) and a name with exactly one '/'.
// An empty directory yields the bare name.
std::string AppendPathToDir(const std::string& dir, const std::string& name);

bool EndsWith(const std::string& s, char c);
