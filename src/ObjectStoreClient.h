#pragma once

#include "ByteStream.h"
#include "util.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

struct ObjectInfo {
  std::string key;
  std::uint64_t size{0};
  std::optional<std::int64_t> lastModified{};
  std::string storageClass{};
};

struct ListResult {
  OpResult status{};
  std::vector<ObjectInfo> objects{};
};

// Flat key store addressed by bucket + key. Implementations report their
// failures as ready-made ErrorRecords in their own domain.
class ObjectStoreClient {
public:
  virtual ~ObjectStoreClient() = default;

  virtual std::string BucketName() const = 0;

  // Every key starting with `prefix`, in key order.
  virtual ListResult ListObjects(const std::string& prefix) = 0;
  virtual StreamResult GetObject(const std::string& key) = 0;
  // `body.Size()` must be known.
  virtual OpResult PutObject(const std::string& key, ByteStream& body) = 0;
  virtual OpResult DeleteObject(const std::string& key) = 0;
};
