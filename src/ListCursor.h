#pragma once

#include <cstddef>
#include <optional>

// Wraparound cursor over a list owned by someone else; callers pass the
// current element count.
class ListCursor final {
public:
  void Next(std::size_t count);
  void Previous(std::size_t count);
  void Clear() { index_.reset(); }

  std::optional<std::size_t> Get() const { return index_; }

  // Keeps the cursor valid after the list was replaced with `count` items.
  void Clamp(std::size_t count);
  // Element `removed` was erased from the list.
  void OnRemoved(std::size_t removed);

private:
  std::optional<std::size_t> index_{};
};
