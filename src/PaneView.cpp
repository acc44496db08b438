#include "PaneView.h"

#include "util.h"

#include <wx/artprov.h>
#include <wx/dataview.h>
#include <wx/settings.h>
#include <wx/sizer.h>
#include <wx/stattext.h>

namespace {
wxColour Blend(const wxColour& a, const wxColour& b, double t) {
  auto lerp = [t](unsigned char x, unsigned char y) -> unsigned char {
    const double v = (1.0 - t) * x + t * y;
    if (v < 0.0) return 0;
    if (v > 255.0) return 255;
    return static_cast<unsigned char>(v + 0.5);
  };
  return wxColour(lerp(a.Red(), b.Red()), lerp(a.Green(), b.Green()), lerp(a.Blue(), b.Blue()));
}

const char* KindLabel(EntryKind kind) {
  switch (kind) {
    case EntryKind::File: return "File";
    case EntryKind::Directory: return "Dir";
    case EntryKind::Unknown: return "?";
  }
  return "?";
}
}  // namespace

PaneView::PaneView(wxWindow* parent) : wxPanel(parent, wxID_ANY) { BuildLayout(); }

void PaneView::BuildLayout() {
  title_ = new wxStaticText(this, wxID_ANY, "", wxDefaultPosition, wxDefaultSize, wxST_ELLIPSIZE_START);

  list_ = new wxDataViewListCtrl(this, wxID_ANY, wxDefaultPosition, wxDefaultSize,
                                 wxDV_ROW_LINES | wxDV_VERT_RULES | wxDV_SINGLE);
  list_->AppendIconTextColumn("Name", wxDATAVIEW_CELL_INERT, 260, wxALIGN_LEFT);
  list_->AppendTextColumn("Mark", wxDATAVIEW_CELL_INERT, 50, wxALIGN_CENTER);
  list_->AppendTextColumn("Type", wxDATAVIEW_CELL_INERT, 60, wxALIGN_LEFT);
  list_->AppendTextColumn("Size", wxDATAVIEW_CELL_INERT, 90, wxALIGN_RIGHT);
  list_->AppendTextColumn("Modified", wxDATAVIEW_CELL_INERT, 150, wxALIGN_LEFT);
  // Order is the backend's; the header must not re-sort rows under the cursor.
  for (unsigned int i = 0; i < list_->GetColumnCount(); i++) {
    if (auto* col = list_->GetColumn(i)) col->SetSortable(false);
  }

  auto* sizer = new wxBoxSizer(wxVERTICAL);
  sizer->Add(title_, 0, wxEXPAND | wxALL, 6);
  sizer->Add(list_, 1, wxEXPAND | wxLEFT | wxRIGHT | wxBOTTOM, 6);
  SetSizer(sizer);
}

void PaneView::Render(const PaneSnapshot& snap, bool focused) {
  if (last_ && *last_ == snap && isActive_ == focused) return;

  if (isActive_ != focused || !last_) {
    isActive_ = focused;
    UpdateActiveVisuals();
  }

  if (!last_ || last_->entries != snap.entries) Populate(snap);
  title_->SetLabel(wxString::FromUTF8(snap.Title()));
  RevealCursor(snap.cursor);
  last_ = snap;
}

void PaneView::Populate(const PaneSnapshot& snap) {
  list_->Freeze();
  list_->DeleteAllItems();

  for (const auto& e : snap.entries) {
    const bool isDir = e.kind == EntryKind::Directory;
    const auto bundle = wxArtProvider::GetBitmapBundle(isDir ? wxART_FOLDER : wxART_NORMAL_FILE,
                                                       wxART_OTHER, wxSize(16, 16));
    wxVariant nameVar;
    nameVar << wxDataViewIconText(wxString::FromUTF8(e.name), bundle);

    wxVector<wxVariant> cols;
    cols.push_back(nameVar);
    cols.push_back(wxVariant(wxString(SelectionMarker(e.selection)).Trim(false)));
    cols.push_back(wxVariant(wxString(KindLabel(e.kind))));
    cols.push_back(wxVariant(e.size && !isDir ? wxString(HumanSize(*e.size)) : wxString()));
    cols.push_back(wxVariant(e.modified ? wxString(FormatUnixTime(*e.modified)) : wxString()));
    list_->AppendItem(cols);
  }
  list_->Thaw();
}

void PaneView::RevealCursor(const std::optional<std::size_t>& cursor) {
  if (!cursor || *cursor >= static_cast<std::size_t>(list_->GetItemCount())) {
    list_->UnselectAll();
    return;
  }
  const auto item = list_->RowToItem(static_cast<int>(*cursor));
  if (!item.IsOk()) return;
  list_->Select(item);
  list_->EnsureVisible(item);
}

void PaneView::UpdateActiveVisuals() {
  // Subtle title tint on the focused pane.
  if (isActive_) {
    const auto base = wxSystemSettings::GetColour(wxSYS_COLOUR_WINDOW);
    const auto accent = wxSystemSettings::GetColour(wxSYS_COLOUR_HIGHLIGHT);
    const bool dark = wxSystemSettings::GetAppearance().IsDark();
    title_->SetBackgroundColour(Blend(base, accent, dark ? 0.18 : 0.12));
    title_->SetFont(title_->GetFont().Bold());
  } else {
    title_->SetBackgroundColour(wxNullColour);
    title_->SetFont(GetFont());
  }
  title_->Refresh();
}
