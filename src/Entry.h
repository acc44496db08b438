#pragma once

#include <cstdint>
#include <optional>
#include <string>

enum class EntryKind { File, Directory, Unknown };

enum class SelectionState { Unselected, Processing, ToMove, ToDelete, ToCopy };

struct Entry {
  // Directory names carry a trailing '/'.
  std::string name;
  EntryKind kind{EntryKind::Unknown};
  SelectionState selection{SelectionState::Unselected};

  // Display-only metadata, when the backend reports it.
  std::optional<std::uint64_t> size{};
  std::optional<std::int64_t> modified{};

  // A selection key press. Processing is forced regardless of the current
  // state; any other request marks an unselected entry and clears a marked
  // one. Only files accept marks.
  void Toggle(SelectionState requested);

  bool operator==(const Entry&) const = default;
};

// List suffix for a selection state: " [M]", " [C]", " [D]", " [/]" or "".
const char* SelectionMarker(SelectionState state);
