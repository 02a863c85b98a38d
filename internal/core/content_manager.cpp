#include "content_manager.hpp"

#include <algorithm>
#include <future>

#include "internal/observability/logging.hpp"
#include "internal/sync/sync_scheduler.hpp"
#include "internal/sync/sync_worker.hpp"
#include "internal/util/time.hpp"

namespace docsync::core {

using docsync::observability::IntField;
using docsync::observability::StringField;

ContentManager::ContentManager(std::vector<std::unique_ptr<source::ContentSource>> sources, ManagerOptions options,
                               std::shared_ptr<observability::Logger> logger)
    : sources_(std::move(sources)), options_(options), logger_(std::move(logger)) {
  if (options_.worker_threads == 0) {
    options_.worker_threads = 1;
  }
}

void ContentManager::Cancel() {
  cancelled_ = true;

  std::shared_ptr<sync::SyncScheduler> scheduler;
  {
    std::lock_guard<std::mutex> lock(scheduler_mutex_);
    scheduler = active_scheduler_;
  }
  if (!scheduler) {
    return;
  }

  const auto dropped = scheduler->CancelPending();
  DOCSYNC_LOG_WARN(*logger_, "Refresh cancelled", {IntField("dropped", static_cast<int64_t>(dropped))});
}

bool ContentManager::Refresh(bool force) {
  if (sources_.empty()) {
    DOCSYNC_LOG_WARN(*logger_, "No content sources configured");
    return false;
  }

  cancelled_ = false;

  const auto                       now = util::Now();
  std::vector<source::ContentSource*> due;
  for (const auto& source : sources_) {
    if (force || source->NeedsUpdate(now)) {
      due.push_back(source.get());
    }
  }

  if (due.empty()) {
    DOCSYNC_LOG_INFO(*logger_, "All content sources up to date");
    return true;
  }

  // ------------------------------------------------------------------
  // Fan out
  // ------------------------------------------------------------------
  auto scheduler = std::make_shared<sync::SyncScheduler>();

  std::vector<std::future<bool>> results;
  results.reserve(due.size());
  for (auto* source : due) {
    results.push_back(scheduler->Schedule(source));
  }
  scheduler->Close();

  {
    std::lock_guard<std::mutex> lock(scheduler_mutex_);
    active_scheduler_ = scheduler;
  }
  // Cancel() may have run before the scheduler was published.
  if (cancelled_) {
    scheduler->CancelPending();
  }

  source::SyncOptions sync_options;
  sync_options.timeout   = options_.fetch_timeout;
  sync_options.cancelled = &cancelled_;

  const auto worker_count = std::min<size_t>(options_.worker_threads, due.size());

  std::vector<std::unique_ptr<sync::SyncWorker>> workers;
  workers.reserve(worker_count);
  for (size_t i = 0; i < worker_count; ++i) {
    workers.push_back(std::make_unique<sync::SyncWorker>(scheduler, sync_options, logger_));
    workers.back()->Start();
  }

  // ------------------------------------------------------------------
  // Join barrier
  // ------------------------------------------------------------------
  for (auto& worker : workers) {
    worker->Join();
  }

  {
    std::lock_guard<std::mutex> lock(scheduler_mutex_);
    active_scheduler_.reset();
  }

  size_t updated = 0;
  for (auto& result : results) {
    if (result.get()) {
      ++updated;
    }
  }

  DOCSYNC_LOG_INFO(*logger_, "Updated content sources",
                   {IntField("updated", static_cast<int64_t>(updated)), IntField("attempted", static_cast<int64_t>(due.size())),
                    IntField("configured", static_cast<int64_t>(sources_.size()))});

  return updated == due.size();
}

std::vector<DocumentCandidate> ContentManager::CollectDocuments() const {
  std::vector<DocumentCandidate> candidates;

  for (const auto& source : sources_) {
    const auto files = source->ListFiles();
    DOCSYNC_LOG_INFO(*logger_, "Found files", {StringField("source", source->Name()), IntField("count", static_cast<int64_t>(files.size()))});

    for (const auto& path : files) {
      DocumentCandidate candidate;
      candidate.path         = path;
      candidate.source_name  = source->Name();
      candidate.priority     = source->Priority();
      candidate.source_label = source->SourceLabel();
      candidates.push_back(std::move(candidate));
    }
  }

  DOCSYNC_LOG_INFO(*logger_, "Total files from all sources", {IntField("count", static_cast<int64_t>(candidates.size()))});
  return candidates;
}

docsync::v1::ContentStats ContentManager::Stats() const {
  docsync::v1::ContentStats stats;
  stats.set_source_count(static_cast<uint32_t>(sources_.size()));

  uint32_t total = 0;
  for (const auto& source : sources_) {
    auto* entry = stats.add_sources();
    entry->set_name(source->Name());
    entry->set_url(source->Url());
    entry->set_branch(source->Branch());
    entry->set_priority(source->Priority());

    const auto file_count = static_cast<uint32_t>(source->CheckoutExists() ? source->ListFiles().size() : 0);
    entry->set_file_count(file_count);
    total += file_count;

    if (const auto last_sync = source->LastSyncTime()) {
      *entry->mutable_last_sync_time() = util::ToProto(*last_sync);
    }
  }

  stats.set_total_file_count(total);
  return stats;
}

} // namespace docsync::core
