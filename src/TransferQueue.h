#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

// Fixed pool of worker threads running per-file transfer tasks in the
// order they were posted. Destruction waits for every posted task.
class TransferQueue final {
public:
  using Task = std::function<void()>;

  explicit TransferQueue(std::size_t workers);
  ~TransferQueue();

  TransferQueue(const TransferQueue&) = delete;
  TransferQueue& operator=(const TransferQueue&) = delete;

  void Post(Task task);
  // Blocks until the queue is empty and no task is running.
  void WaitIdle();
  // Queued plus running tasks.
  std::size_t Pending() const;

private:
  void WorkerLoop();

  mutable std::mutex mu_{};
  std::condition_variable wake_{};
  std::condition_variable idle_{};
  std::deque<Task> tasks_{};
  std::size_t running_{0};
  bool stopping_{false};
  std::vector<std::thread> workers_{};
};
