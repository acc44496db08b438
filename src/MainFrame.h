#pragma once

#include "DualPane.h"
#include "PaneView.h"

#include <wx/frame.h>
#include <wx/timer.h>

#include <memory>
#include <optional>

class wxListBox;
class wxSplitterWindow;

class MainFrame final : public wxFrame {
public:
  explicit MainFrame(std::unique_ptr<DualPane> panes);
  ~MainFrame() override;

private:
  void BuildLayout();
  void BindEvents();

  // Key code to orchestrator command; nothing for keys without a binding.
  static std::optional<PaneCommand> CommandForKey(const wxKeyEvent& e);

  void RenderTick();
  void RenderErrors();
  void ShowErrorView(bool show);

  std::unique_ptr<DualPane> panes_;

  wxSplitterWindow* split_{nullptr};
  PaneView* leftView_{nullptr};
  PaneView* rightView_{nullptr};
  wxListBox* errorList_{nullptr};
  wxTimer timer_{};

  bool showingErrors_{false};
  std::size_t renderedErrors_{0};
};
