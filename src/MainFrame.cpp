#include "MainFrame.h"

#include "util.h"

#include <wx/listbox.h>
#include <wx/log.h>
#include <wx/sizer.h>
#include <wx/splitter.h>

namespace {
constexpr int kRenderIntervalMs = 75;
constexpr const char* kKeyHelp =
    "j/k move  h/l/Tab focus  m move  c copy  d delete  Enter run  Space open  Backspace up  r refresh  Esc quit";
}  // namespace

MainFrame::MainFrame(std::unique_ptr<DualPane> panes)
    : wxFrame(nullptr, wxID_ANY, "Ferry", wxDefaultPosition, wxSize(1100, 700)),
      panes_(std::move(panes)) {
  BuildLayout();
  BindEvents();

  panes_->Start();
  RenderTick();
  timer_.SetOwner(this);
  timer_.Start(kRenderIntervalMs);
}

MainFrame::~MainFrame() {
  timer_.Stop();
  wxLogVerbose("Waiting for %lu transfer(s) to finish", static_cast<unsigned long>(panes_->PendingTransfers()));
  panes_->WaitForTransfers();
}

void MainFrame::BuildLayout() {
  split_ = new wxSplitterWindow(this, wxID_ANY, wxDefaultPosition, wxDefaultSize,
                                wxSP_LIVE_UPDATE | wxSP_3D);
  split_->SetSashGravity(0.5);
  split_->SetMinimumPaneSize(200);

  leftView_ = new PaneView(split_);
  rightView_ = new PaneView(split_);
  split_->SplitVertically(leftView_, rightView_);

  errorList_ = new wxListBox(this, wxID_ANY);
  errorList_->Hide();

  auto* sizer = new wxBoxSizer(wxVERTICAL);
  sizer->Add(split_, 1, wxEXPAND);
  sizer->Add(errorList_, 1, wxEXPAND | wxALL, 8);
  SetSizer(sizer);

  CreateStatusBar();
  SetStatusText(kKeyHelp);
}

void MainFrame::BindEvents() {
  // Every key goes through here regardless of which child has focus.
  Bind(wxEVT_CHAR_HOOK, [this](wxKeyEvent& e) {
    if (e.GetKeyCode() == WXK_ESCAPE) {
      Close();
      return;
    }
    const auto cmd = CommandForKey(e);
    if (!cmd) {
      e.Skip();
      return;
    }
    // While errors are shown only the acknowledgment is accepted.
    if (!panes_->Errors().Empty() && *cmd != PaneCommand::Execute) return;

    panes_->HandleCommand(*cmd);
    RenderTick();
  });

  Bind(wxEVT_TIMER, [this](wxTimerEvent&) { RenderTick(); });
}

std::optional<PaneCommand> MainFrame::CommandForKey(const wxKeyEvent& e) {
  if (e.ControlDown() || e.AltDown()) return std::nullopt;

  switch (e.GetKeyCode()) {
    case WXK_DOWN:
    case 'J': return PaneCommand::Next;
    case WXK_UP:
    case 'K': return PaneCommand::Previous;
    case WXK_LEFT:
    case 'H': return PaneCommand::FocusLeft;
    case WXK_RIGHT:
    case 'L': return PaneCommand::FocusRight;
    case WXK_TAB: return PaneCommand::ToggleFocus;
    case 'M': return PaneCommand::MarkMove;
    case 'C': return PaneCommand::MarkCopy;
    case 'D': return PaneCommand::MarkDelete;
    case WXK_RETURN:
    case WXK_NUMPAD_ENTER: return PaneCommand::Execute;
    case WXK_SPACE: return PaneCommand::NavigateInto;
    case WXK_BACK: return PaneCommand::NavigateOut;
    case 'R': return PaneCommand::Refresh;
    default: return std::nullopt;
  }
}

void MainFrame::RenderTick() {
  if (!panes_->Errors().Empty()) {
    RenderErrors();
    ShowErrorView(true);
    return;
  }
  ShowErrorView(false);

  const bool leftFocused = panes_->Focused() == FocusedPane::Left;
  leftView_->Render(panes_->Left().Snapshot(), leftFocused);
  rightView_->Render(panes_->Right().Snapshot(), !leftFocused);
}

void MainFrame::RenderErrors() {
  const auto records = panes_->Errors().Snapshot();
  if (showingErrors_ && records.size() == renderedErrors_) return;

  errorList_->Freeze();
  errorList_->Clear();
  for (const auto& r : records) errorList_->Append(wxString::FromUTF8(FormatErrorRecord(r)));
  errorList_->Append("");
  errorList_->Append("Press ENTER to continue");
  errorList_->Thaw();
  renderedErrors_ = records.size();
}

void MainFrame::ShowErrorView(bool show) {
  if (showingErrors_ == show) return;
  showingErrors_ = show;
  if (!show) renderedErrors_ = 0;

  split_->Show(!show);
  errorList_->Show(show);
  Layout();
}
