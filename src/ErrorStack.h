#pragma once

#include "util.h"

#include <cstddef>
#include <mutex>
#include <vector>

// Failures surfaced to the user. Any thread may push; only the UI clears,
// in response to the user acknowledging the list.
class ErrorStack final {
public:
  void Push(ErrorRecord record);
  // Pushes `result.error` when the result is a failure.
  void PushIfFailed(const OpResult& result);

  bool Empty() const;
  std::size_t Size() const;
  std::vector<ErrorRecord> Snapshot() const;
  void Clear();

private:
  mutable std::mutex mu_{};
  std::vector<ErrorRecord> records_{};
};

// Replaces the active wxLog target with stderr. Once the error view exists
// it is the only place failures are shown, so log output must not open
// message boxes.
void LogToStderr();
