#include "DualPane.h"

#include <utility>

#include <wx/log.h>

namespace {
constexpr const char* kTransferDomain = "Transfer";

// Clears the Processing mark however the task ends.
class ProcessingGuard {
public:
  ProcessingGuard(StoragePane& pane, std::string name) : pane_(pane), name_(std::move(name)) {
    pane_.MarkProcessing(name_);
  }
  ~ProcessingGuard() { pane_.ClearProcessing(name_); }

  ProcessingGuard(const ProcessingGuard&) = delete;
  ProcessingGuard& operator=(const ProcessingGuard&) = delete;

private:
  StoragePane& pane_;
  std::string name_;
};

void TransferFile(StoragePane& src,
                  const std::string& srcDir,
                  StoragePane& dst,
                  const std::string& dstDir,
                  const std::string& name,
                  bool removeSource,
                  ErrorStack& errors) {
  auto opened = src.GetFileStream(srcDir, name);
  if (!opened.status.ok) {
    errors.Push(std::move(opened.status.error));
    return;
  }

  ProcessingGuard processing(src, name);
  wxLogVerbose("%s %s -> %s", removeSource ? "Moving" : "Copying", AppendPathToDir(srcDir, name),
               AppendPathToDir(dstDir, name));

  auto res = dst.PutFile(dstDir, name, *opened.stream);
  if (res.ok && removeSource) res = src.DeleteFile(srcDir, name);
  errors.PushIfFailed(res);
  if (res.ok) wxLogVerbose("Finished %s", name);
}

// Both panes address the same storage location, so a put would overwrite
// the source it is reading from.
bool SameLocation(const StoragePane& a, const std::string& aDir, const StoragePane& b, const std::string& bDir) {
  if (aDir != bDir) return false;
  if (&a == &b) return true;
  return a.ProviderLabel() == b.ProviderLabel() && a.ResourceLabel() == b.ResourceLabel();
}

void DeleteOne(StoragePane& pane, const std::string& dir, const std::string& name, ErrorStack& errors) {
  ProcessingGuard processing(pane, name);
  wxLogVerbose("Deleting %s", AppendPathToDir(dir, name));
  errors.PushIfFailed(pane.DeleteFile(dir, name));
}

}  // namespace

DualPane::DualPane(std::shared_ptr<StoragePane> left,
                   std::shared_ptr<StoragePane> right,
                   std::shared_ptr<ErrorStack> errors,
                   std::size_t workers)
    : left_(std::move(left)),
      right_(std::move(right)),
      errors_(std::move(errors)),
      transfers_(workers) {}

void DualPane::Start() {
  focused_ = FocusedPane::Left;
  RefreshBoth();
}

void DualPane::HandleCommand(PaneCommand cmd) {
  auto& pane = *FocusedHandle();
  switch (cmd) {
    case PaneCommand::Next: pane.Next(); break;
    case PaneCommand::Previous: pane.Previous(); break;
    case PaneCommand::FocusLeft: focused_ = FocusedPane::Left; break;
    case PaneCommand::FocusRight: focused_ = FocusedPane::Right; break;
    case PaneCommand::ToggleFocus:
      focused_ = (focused_ == FocusedPane::Left) ? FocusedPane::Right : FocusedPane::Left;
      break;
    case PaneCommand::MarkMove: pane.ToggleSelected(SelectionState::ToMove); break;
    case PaneCommand::MarkCopy: pane.ToggleSelected(SelectionState::ToCopy); break;
    case PaneCommand::MarkDelete: pane.ToggleSelected(SelectionState::ToDelete); break;
    case PaneCommand::Execute: Execute(); break;
    case PaneCommand::NavigateInto: NavigateInto(); break;
    case PaneCommand::NavigateOut: NavigateOut(); break;
    case PaneCommand::Refresh: RefreshBoth(); break;
  }
}

void DualPane::Execute() {
  if (!errors_->Empty()) {
    errors_->Clear();
    return;
  }

  IssueTransfers(right_, left_, SelectionState::ToMove);
  IssueTransfers(left_, right_, SelectionState::ToMove);
  IssueTransfers(right_, left_, SelectionState::ToCopy);
  IssueTransfers(left_, right_, SelectionState::ToCopy);
  IssueDeletes(right_);
  IssueDeletes(left_);

  RefreshBoth();
}

void DualPane::IssueTransfers(const std::shared_ptr<StoragePane>& src,
                              const std::shared_ptr<StoragePane>& dst,
                              SelectionState state) {
  const bool removeSource = state == SelectionState::ToMove;
  const auto srcDir = src->GetCurrentLocation();
  const auto dstDir = dst->GetCurrentLocation();
  const bool sameLocation = SameLocation(*src, srcDir, *dst, dstDir);

  for (const auto& name : src->GetSelected(state)) {
    if (sameLocation) {
      errors_->Push(Failure(kTransferDomain, ErrorKind::AlreadyExists, "Same Location",
                            "(File: " + AppendPathToDir(srcDir, name) +
                                ") source and destination are the same location"));
      continue;
    }
    transfers_.Post([src, dst, srcDir, dstDir, name, removeSource, errors = errors_] {
      TransferFile(*src, srcDir, *dst, dstDir, name, removeSource, *errors);
    });
  }
}

void DualPane::IssueDeletes(const std::shared_ptr<StoragePane>& pane) {
  const auto dir = pane->GetCurrentLocation();
  for (const auto& name : pane->GetSelected(SelectionState::ToDelete)) {
    transfers_.Post([pane, dir, name, errors = errors_] { DeleteOne(*pane, dir, name, *errors); });
  }
}

void DualPane::NavigateInto() {
  auto& pane = *FocusedHandle();
  const auto previous = pane.NavigateIntoSelected();
  if (!previous) return;

  auto res = pane.Refresh();
  if (res.ok) return;
  pane.RestoreLocation(*previous);
  errors_->Push(std::move(res.error));
}

void DualPane::NavigateOut() {
  auto& pane = *FocusedHandle();
  const auto previous = pane.NavigateOut();
  if (!previous) return;

  auto res = pane.Refresh();
  if (res.ok) return;
  pane.RestoreLocation(*previous);
  errors_->Push(std::move(res.error));
}

void DualPane::RefreshBoth() {
  errors_->PushIfFailed(left_->Refresh());
  errors_->PushIfFailed(right_->Refresh());
}
