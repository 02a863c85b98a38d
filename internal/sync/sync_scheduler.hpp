#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <future>
#include <mutex>
#include <optional>

#include "sync_task.hpp"

namespace docsync::sync {

/*
  Task queue for one refresh.

      Schedule × N → Close → workers drain with Next
                   ↘ CancelPending resolves whatever is still queued as failed

  Every future returned by Schedule is resolved exactly once, either by the
  worker that ran the task or by CancelPending.
*/
class SyncScheduler {
 public:
  // Throws std::logic_error once the scheduler is closed.
  std::future<bool> Schedule(source::ContentSource* source);

  // Blocks until a task is available. nullopt once closed and empty.
  std::optional<SyncTask> Next();

  // No further Schedule calls; queued tasks are still handed out.
  void Close();

  // Closes the scheduler and fails every queued task. Returns the number of
  // tasks dropped.
  size_t CancelPending();

  size_t Pending() const;

 private:
  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  std::deque<SyncTask>    queue_;
  bool                    closed_ = false;
};

} // namespace docsync::sync
