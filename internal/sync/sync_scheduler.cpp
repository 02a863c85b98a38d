#include "sync_scheduler.hpp"

#include <stdexcept>
#include <utility>

namespace docsync::sync {

std::future<bool> SyncScheduler::Schedule(source::ContentSource* source) {
  SyncTask task;
  task.source = source;
  auto outcome = task.done.get_future();

  {
    std::lock_guard lock(mutex_);
    if (closed_) {
      throw std::logic_error("sync scheduler is closed");
    }
    queue_.push_back(std::move(task));
  }
  cv_.notify_one();
  return outcome;
}

std::optional<SyncTask> SyncScheduler::Next() {
  std::unique_lock lock(mutex_);
  cv_.wait(lock, [&] { return closed_ || !queue_.empty(); });

  if (queue_.empty()) return std::nullopt;

  SyncTask task = std::move(queue_.front());
  queue_.pop_front();
  return task;
}

void SyncScheduler::Close() {
  {
    std::lock_guard lock(mutex_);
    closed_ = true;
  }
  cv_.notify_all();
}

size_t SyncScheduler::CancelPending() {
  std::deque<SyncTask> dropped;
  {
    std::lock_guard lock(mutex_);
    closed_ = true;
    dropped.swap(queue_);
  }
  cv_.notify_all();

  // Resolved outside the lock; a waiter may re-enter the scheduler.
  for (auto& task : dropped) {
    task.done.set_value(false);
  }
  return dropped.size();
}

size_t SyncScheduler::Pending() const {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

} // namespace docsync::sync
