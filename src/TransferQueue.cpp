#include "TransferQueue.h"

#include <exception>
#include <utility>

#include <wx/log.h>

TransferQueue::TransferQueue(std::size_t workers) {
  if (workers == 0) workers = 1;
  workers_.reserve(workers);
  for (std::size_t i = 0; i < workers; i++) workers_.emplace_back([this] { WorkerLoop(); });
}

TransferQueue::~TransferQueue() {
  {
    std::lock_guard<std::mutex> lock(mu_);
    stopping_ = true;
  }
  wake_.notify_all();
  for (auto& t : workers_) {
    if (t.joinable()) t.join();
  }
}

void TransferQueue::Post(Task task) {
  {
    std::lock_guard<std::mutex> lock(mu_);
    tasks_.push_back(std::move(task));
  }
  wake_.notify_one();
}

void TransferQueue::WaitIdle() {
  std::unique_lock<std::mutex> lock(mu_);
  idle_.wait(lock, [this] { return tasks_.empty() && running_ == 0; });
}

std::size_t TransferQueue::Pending() const {
  std::lock_guard<std::mutex> lock(mu_);
  return tasks_.size() + running_;
}

void TransferQueue::WorkerLoop() {
  for (;;) {
    Task task;
    {
      std::unique_lock<std::mutex> lock(mu_);
      // Queued work is drained before a stop request is honoured.
      wake_.wait(lock, [this] { return stopping_ || !tasks_.empty(); });
      if (tasks_.empty()) return;
      task = std::move(tasks_.front());
      tasks_.pop_front();
      running_++;
    }

    try {
      task();
    } catch (const std::exception& e) {
      wxLogError("Transfer task failed: %s", e.what());
    }

    {
      std::lock_guard<std::mutex> lock(mu_);
      running_--;
      if (tasks_.empty() && running_ == 0) idle_.notify_all();
    }
  }
}
