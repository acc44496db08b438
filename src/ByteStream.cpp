#include "ByteStream.h"

#include <algorithm>

OpResult MemoryByteStream::Read(std::vector<char>& chunk, std::size_t maxBytes) {
  const std::size_t n = std::min(maxBytes, data_.size() - offset_);
  chunk.assign(data_.begin() + static_cast<std::ptrdiff_t>(offset_),
               data_.begin() + static_cast<std::ptrdiff_t>(offset_ + n));
  offset_ += n;
  return Success();
}

OpResult ReadAll(ByteStream& stream, std::string& out) {
  out.clear();
  std::vector<char> chunk;
  for (;;) {
    const auto res = stream.Read(chunk, kStreamChunkSize);
    if (!res.ok) return res;
    if (chunk.empty()) break;
    out.append(chunk.data(), chunk.size());
  }
  return Success();
}
