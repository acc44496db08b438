#pragma once

#include "ErrorStack.h"
#include "StoragePane.h"
#include "TransferQueue.h"

#include <cstddef>
#include <memory>
#include <string>

enum class FocusedPane { Left, Right };

// Input the orchestrator understands, already decoded from key events.
enum class PaneCommand {
  Next,
  Previous,
  FocusLeft,
  FocusRight,
  ToggleFocus,
  MarkMove,
  MarkCopy,
  MarkDelete,
  Execute,
  NavigateInto,
  NavigateOut,
  Refresh,
};

// Owns the two panes and turns commands into cursor, selection, navigation
// and batch-transfer operations. Called from the UI thread only; transfer
// tasks run on the worker pool and share the panes and the error stack.
class DualPane final {
public:
  DualPane(std::shared_ptr<StoragePane> left,
           std::shared_ptr<StoragePane> right,
           std::shared_ptr<ErrorStack> errors,
           std::size_t workers);

  // Initial listing of both panes; failures land on the error stack.
  void Start();

  void HandleCommand(PaneCommand cmd);

  FocusedPane Focused() const { return focused_; }
  StoragePane& Left() { return *left_; }
  StoragePane& Right() { return *right_; }
  const ErrorStack& Errors() const { return *errors_; }

  void WaitForTransfers() { transfers_.WaitIdle(); }
  std::size_t PendingTransfers() const { return transfers_.Pending(); }

private:
  std::shared_ptr<StoragePane>& FocusedHandle() { return focused_ == FocusedPane::Left ? left_ : right_; }

  void Execute();
  void NavigateInto();
  void NavigateOut();
  void RefreshBoth();

  // Queues one task per name of `src` holding `state`.
  void IssueTransfers(const std::shared_ptr<StoragePane>& src,
                      const std::shared_ptr<StoragePane>& dst,
                      SelectionState state);
  void IssueDeletes(const std::shared_ptr<StoragePane>& pane);

  std::shared_ptr<StoragePane> left_;
  std::shared_ptr<StoragePane> right_;
  std::shared_ptr<ErrorStack> errors_;
  FocusedPane focused_{FocusedPane::Left};
  // Last member: destroyed first, so queued tasks drain while the rest of
  // the orchestrator is still alive.
  TransferQueue transfers_;
};
