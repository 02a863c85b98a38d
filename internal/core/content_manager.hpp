#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <vector>

#include "docsync/v1.hpp"
#include "internal/core/document_candidate.hpp"
#include "internal/source/content_source.hpp"

namespace docsync::observability {
class Logger;
}
namespace docsync::sync {
class SyncScheduler;
}

namespace docsync::core {

struct ManagerOptions {
  uint32_t                  worker_threads = 4;
  std::chrono::milliseconds fetch_timeout  = std::chrono::seconds(300);
};

/*
  Owns every ContentSource and drives them.

  Refresh fans stale sources out to a bounded worker pool and joins all
  workers before returning, so CollectDocuments never observes a source
  mid-fetch. Sources are only mutated through their own Sync.
*/
class ContentManager {
 public:
  ContentManager(std::vector<std::unique_ptr<source::ContentSource>> sources, ManagerOptions options,
                 std::shared_ptr<observability::Logger> logger);

  ContentManager(const ContentManager&)            = delete;
  ContentManager& operator=(const ContentManager&) = delete;

  // Fetches sources that are stale (or all, when forced). True iff every
  // attempted fetch succeeded; skipped sources do not count. False when no
  // sources are configured.
  bool Refresh(bool force);

  // Kills in-flight fetches and fails queued ones of the current Refresh.
  // Cleared at the start of the next Refresh. Safe to call from any thread.
  void Cancel();

  // Current on-disk files of every source, tagged with the source identity.
  std::vector<DocumentCandidate> CollectDocuments() const;

  docsync::v1::ContentStats Stats() const;

  const std::vector<std::unique_ptr<source::ContentSource>>& Sources() const {
    return sources_;
  }

 private:
  std::vector<std::unique_ptr<source::ContentSource>> sources_;
  ManagerOptions                                      options_;
  std::shared_ptr<observability::Logger>              logger_;

  std::atomic<bool> cancelled_{false};

  // Scheduler of the Refresh in progress, if any.
  std::mutex                           scheduler_mutex_;
  std::shared_ptr<sync::SyncScheduler> active_scheduler_;
};

} // namespace docsync::core
