#include "Entry.h"

void Entry::Toggle(SelectionState requested) {
  if (requested == SelectionState::Processing) {
    selection = SelectionState::Processing;
    return;
  }
  if (kind != EntryKind::File) return;

  selection = (selection == SelectionState::Unselected) ? requested : SelectionState::Unselected;
}

const char* SelectionMarker(SelectionState state) {
  switch (state) {
    case SelectionState::ToMove: return " [M]";
    case SelectionState::ToCopy: return " [C]";
    case SelectionState::ToDelete: return " [D]";
    case SelectionState::Processing: return " [/]";
    case SelectionState::Unselected: return "";
  }
  return "";
}
