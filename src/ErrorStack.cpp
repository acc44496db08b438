#include "ErrorStack.h"

#include <wx/log.h>

void ErrorStack::Push(ErrorRecord record) {
  wxLogWarning("%s", wxString::FromUTF8(FormatErrorRecord(record)));
  std::lock_guard<std::mutex> lock(mu_);
  records_.push_back(std::move(record));
}

void ErrorStack::PushIfFailed(const OpResult& result) {
  if (!result.ok) Push(result.error);
}

bool ErrorStack::Empty() const {
  std::lock_guard<std::mutex> lock(mu_);
  return records_.empty();
}

std::size_t ErrorStack::Size() const {
  std::lock_guard<std::mutex> lock(mu_);
  return records_.size();
}

std::vector<ErrorRecord> ErrorStack::Snapshot() const {
  std::lock_guard<std::mutex> lock(mu_);
  return records_;
}

void ErrorStack::Clear() {
  std::lock_guard<std::mutex> lock(mu_);
  records_.clear();
}

void LogToStderr() {
  if (dynamic_cast<wxLogStderr*>(wxLog::GetActiveTarget())) return;
  delete wxLog::SetActiveTarget(new wxLogStderr());
}
