#pragma once

#include "util.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

constexpr std::size_t kStreamChunkSize = 64 * 1024;

// Ordered chunks of file content produced by one backend and consumed by
// another. Read failures are reported in the producing backend's domain.
class ByteStream {
public:
  virtual ~ByteStream() = default;

  // Total byte count, when the producer knows it up front.
  virtual std::optional<std::uint64_t> Size() const = 0;

  // Replaces `chunk` with up to `maxBytes` of the next content. An empty
  // chunk on success marks the end of the stream.
  virtual OpResult Read(std::vector<char>& chunk, std::size_t maxBytes) = 0;
};

class MemoryByteStream final : public ByteStream {
public:
  explicit MemoryByteStream(std::string data) : data_(std::move(data)) {}

  std::optional<std::uint64_t> Size() const override { return data_.size(); }
  OpResult Read(std::vector<char>& chunk, std::size_t maxBytes) override;

private:
  std::string data_;
  std::size_t offset_{0};
};

struct StreamResult {
  OpResult status{};
  std::unique_ptr<ByteStream> stream{};
};

// Reads `stream` to its end into `out`.
OpResult ReadAll(ByteStream& stream, std::string& out);
