#pragma once

#include <atomic>
#include <memory>
#include <thread>

#include "sync_scheduler.hpp"
#include "internal/source/content_source.hpp"

namespace docsync::observability {
class Logger;
}

namespace docsync::sync {

/*
  Background worker that performs source fetches.

  Executes:
      dequeue → ContentSource::Sync → fulfil task promise
*/
class SyncWorker {
 public:
  SyncWorker(std::shared_ptr<SyncScheduler> scheduler, source::SyncOptions options, std::shared_ptr<observability::Logger> logger);
  ~SyncWorker();

  SyncWorker(const SyncWorker&)            = delete;
  SyncWorker& operator=(const SyncWorker&) = delete;

  void Start();

  // Returns once the queue is drained and the thread has exited.
  void Join();

 private:
  void Run();

  std::shared_ptr<SyncScheduler>         scheduler_;
  source::SyncOptions                    options_;
  std::shared_ptr<observability::Logger> logger_;

  std::thread thread_;
};

} // namespace docsync::sync
