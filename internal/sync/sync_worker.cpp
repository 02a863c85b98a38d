#include "sync_worker.hpp"

#include "internal/observability/logging.hpp"

namespace docsync::sync {

using docsync::observability::StringField;

SyncWorker::SyncWorker(std::shared_ptr<SyncScheduler> scheduler, source::SyncOptions options, std::shared_ptr<observability::Logger> logger)
    : scheduler_(std::move(scheduler)), options_(options), logger_(std::move(logger)) {
}

SyncWorker::~SyncWorker() {
  Join();
}

void SyncWorker::Start() {
  thread_ = std::thread(&SyncWorker::Run, this);
}

void SyncWorker::Join() {
  if (thread_.joinable())
    thread_.join();
}

void SyncWorker::Run() {
  for (;;) {
    auto task = scheduler_->Next();
    if (!task)
      break;

    // Handed out just before the refresh was cancelled.
    if (options_.cancelled && options_.cancelled->load()) {
      DOCSYNC_LOG_WARN(*logger_, "Skipping fetch after cancellation", {StringField("source", task->source->Name())});
      task->done.set_value(false);
      continue;
    }

    bool ok = false;
    try {
      ok = task->source->Sync(options_);
    } catch (const std::exception& e) {
      DOCSYNC_LOG_ERROR(*logger_, "sync failed", {StringField("source", task->source->Name()), StringField("error", e.what())});
    }
    task->done.set_value(ok);
  }
}

} // namespace docsync::sync
