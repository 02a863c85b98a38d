#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/filter/path_filter.hpp"
#include "internal/policy/frequency_policy.hpp"
#include "internal/repo/repository_client.hpp"
#include "internal/util/time.hpp"

namespace docsync::observability {
class Logger;
}

namespace docsync::source {

struct SyncOptions {
  std::chrono::milliseconds timeout{0};
  const std::atomic<bool>*  cancelled = nullptr;
};

/*
  One content source: configuration, persisted sync marker, and the fetch
  operation against its backing repository.

  Owns its checkout directory and the marker inside it. last_sync_time is
  set iff a fetch has succeeded (now or in an earlier process) and never
  moves backwards.
*/
class ContentSource {
 public:
  static constexpr const char* kMarkerFileName = ".last_update";

  // Throws util::InvalidConfig when a required field is missing or the
  // cadence is not recognized.
  ContentSource(const docsync::runtime::config::ContentSourceConfig& config, std::shared_ptr<repo::RepositoryClient> client,
                std::shared_ptr<observability::Logger> logger);

  ContentSource(const ContentSource&)            = delete;
  ContentSource& operator=(const ContentSource&) = delete;

  const std::string&                     Name() const { return name_; }
  const std::string&                     Type() const { return type_; }
  const std::string&                     Url() const { return url_; }
  const std::string&                     Branch() const { return branch_; }
  const std::filesystem::path&           LocalPath() const { return local_path_; }
  policy::Cadence                        UpdateFrequency() const { return cadence_; }
  const std::vector<std::string>&        IncludePaths() const { return include_paths_; }
  const std::vector<std::string>&        ExcludePaths() const { return exclude_paths_; }
  double                                 Priority() const { return priority_; }
  const std::string&                     SourceLabel() const { return source_label_; }

  std::optional<util::TimePoint> LastSyncTime() const;
  bool                           CheckoutExists() const;
  bool                           NeedsUpdate(util::TimePoint now) const;

  // Clone when the checkout is missing, fast-forward otherwise. Never throws;
  // failures are logged and leave both the checkout and last_sync_time as
  // they were.
  bool Sync(const SyncOptions& options);

  // Files of the current checkout that pass the include/exclude patterns.
  std::set<std::filesystem::path> ListFiles() const;

 private:
  std::filesystem::path MarkerPath() const;
  std::filesystem::path StagingPath() const;

  void LoadMarker();
  void PersistMarker(util::TimePoint at);
  void RecordSuccess();

  repo::FetchResult CloneIntoPlace(const repo::FetchOptions& options);

  std::string              name_;
  std::string              type_;
  std::string              url_;
  std::string              branch_;
  std::filesystem::path    local_path_;
  policy::Cadence          cadence_ = policy::Cadence::Daily;
  std::vector<std::string> include_paths_;
  std::vector<std::string> exclude_paths_;
  double                   priority_ = 1.0;
  std::string              source_label_;

  filter::PathFilter                     filter_;
  std::shared_ptr<repo::RepositoryClient> client_;
  std::shared_ptr<observability::Logger>  logger_;

  mutable std::mutex             state_mutex_;
  std::optional<util::TimePoint> last_sync_time_;
  bool                           synced_this_run_ = false;

  // Serializes Sync calls on this source.
  std::mutex sync_mutex_;
};

} // namespace docsync::source
