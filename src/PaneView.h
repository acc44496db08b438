#pragma once

#include "StoragePane.h"

#include <optional>

#include <wx/panel.h>

class wxDataViewListCtrl;
class wxStaticText;

// Read-only rendering of one pane: a title line and the entry list with the
// cursor row selected. Never mutates the pane it renders.
class PaneView final : public wxPanel {
public:
  explicit PaneView(wxWindow* parent);

  // Redraws only when the snapshot or the focus changed since the last call.
  void Render(const PaneSnapshot& snap, bool focused);

private:
  void BuildLayout();
  void Populate(const PaneSnapshot& snap);
  void RevealCursor(const std::optional<std::size_t>& cursor);
  void UpdateActiveVisuals();

  wxStaticText* title_{nullptr};
  wxDataViewListCtrl* list_{nullptr};

  std::optional<PaneSnapshot> last_{};
  bool isActive_{false};
};
