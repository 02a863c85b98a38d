#include "content_source.hpp"

#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <system_error>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace docsync::source {

namespace fs = std::filesystem;

using docsync::observability::DoubleField;
using docsync::observability::IntField;
using docsync::observability::StringField;

namespace {

constexpr const char* kDefaultBranch    = "main";
constexpr const char* kDefaultFrequency = "daily";

fs::path NormalizeLocalPath(const std::string& raw) {
  auto path = fs::path(raw).lexically_normal();
  // "cache/repo/" normalizes with an empty filename; the staging name needs one.
  if (!path.has_filename() && path.has_parent_path()) {
    path = path.parent_path();
  }
  return path;
}

} // namespace

ContentSource::ContentSource(const docsync::runtime::config::ContentSourceConfig& config, std::shared_ptr<repo::RepositoryClient> client,
                             std::shared_ptr<observability::Logger> logger)
    : name_(config.name()),
      type_(config.type()),
      url_(config.url()),
      branch_(config.has_branch() && !config.branch().empty() ? config.branch() : kDefaultBranch),
      local_path_(NormalizeLocalPath(config.local_path())),
      include_paths_(config.include_paths().begin(), config.include_paths().end()),
      exclude_paths_(config.exclude_paths().begin(), config.exclude_paths().end()),
      priority_(config.has_priority() ? config.priority() : 1.0),
      source_label_(config.has_source_label() && !config.source_label().empty() ? config.source_label() : config.name()),
      filter_(include_paths_, exclude_paths_),
      client_(std::move(client)),
      logger_(std::move(logger)) {
  if (name_.empty()) {
    throw util::InvalidConfig("content source is missing 'name'");
  }
  if (url_.empty()) {
    throw util::InvalidConfig("content source '" + name_ + "' is missing 'url'");
  }
  if (config.local_path().empty()) {
    throw util::InvalidConfig("content source '" + name_ + "' is missing 'local_path'");
  }

  const std::string frequency = config.has_update_frequency() ? config.update_frequency() : kDefaultFrequency;
  const auto        cadence   = policy::ParseCadence(frequency);
  if (!cadence) {
    throw util::InvalidConfig("content source '" + name_ + "' has unknown update_frequency '" + frequency + "'");
  }
  cadence_ = *cadence;

  if (!client_ || !logger_) {
    throw std::invalid_argument("content source requires a repository client and a logger");
  }

  LoadMarker();
}

fs::path ContentSource::MarkerPath() const {
  return local_path_ / kMarkerFileName;
}

fs::path ContentSource::StagingPath() const {
  return local_path_.parent_path() / ("." + local_path_.filename().string() + ".sync-tmp");
}

std::optional<util::TimePoint> ContentSource::LastSyncTime() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return last_sync_time_;
}

bool ContentSource::CheckoutExists() const {
  std::error_code ec;
  return fs::is_directory(local_path_, ec);
}

bool ContentSource::NeedsUpdate(util::TimePoint now) const {
  const bool                  exists = CheckoutExists();
  std::lock_guard<std::mutex> lock(state_mutex_);
  return policy::NeedsUpdate(cadence_, last_sync_time_, exists, now, synced_this_run_);
}

// ------------------------------------------------------------
// Sync marker
// ------------------------------------------------------------

void ContentSource::LoadMarker() {
  std::ifstream in(MarkerPath());
  if (!in) {
    return;
  }

  std::stringstream buffer;
  buffer << in.rdbuf();

  const auto parsed = util::ParseUnixSeconds(buffer.str());
  if (!parsed) {
    DOCSYNC_LOG_DEBUG(*logger_, "Ignoring unreadable sync marker", {StringField("source", name_), StringField("path", MarkerPath().string())});
    return;
  }

  std::lock_guard<std::mutex> lock(state_mutex_);
  last_sync_time_ = *parsed;
}

/*
  Atomic replace:
      write tmp → rename
*/
void ContentSource::PersistMarker(util::TimePoint at) {
  const auto final_path = MarkerPath();
  const auto tmp_path   = fs::path(final_path.string() + ".tmp");

  {
    std::ofstream out(tmp_path, std::ios::trunc);
    out << std::fixed << std::setprecision(6) << util::ToUnixSeconds(at);
    out.close();
    if (!out) {
      DOCSYNC_LOG_WARN(*logger_, "Could not save update timestamp", {StringField("source", name_), StringField("path", tmp_path.string())});
      std::error_code ignored;
      fs::remove(tmp_path, ignored);
      return;
    }
  }

  std::error_code ec;
  fs::rename(tmp_path, final_path, ec);
  if (ec) {
    DOCSYNC_LOG_WARN(*logger_, "Could not save update timestamp",
                     {StringField("source", name_), StringField("path", final_path.string()), StringField("error", ec.message())});
    fs::remove(tmp_path, ec);
  }
}

void ContentSource::RecordSuccess() {
  const auto      now = util::Now();
  util::TimePoint recorded;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    recorded        = last_sync_time_ && *last_sync_time_ > now ? *last_sync_time_ : now;
    last_sync_time_ = recorded;
    synced_this_run_ = true;
  }
  PersistMarker(recorded);
}

// ------------------------------------------------------------
// Fetch
// ------------------------------------------------------------

repo::FetchResult ContentSource::CloneIntoPlace(const repo::FetchOptions& options) {
  std::error_code ec;

  const auto parent = local_path_.parent_path();
  if (!parent.empty()) {
    fs::create_directories(parent, ec);
    if (ec) {
      return repo::FetchResult::Err(repo::FetchStatus::Failed, "cannot create " + parent.string() + ": " + ec.message());
    }
  }

  // Leftover from an interrupted acquisition.
  const auto staging = StagingPath();
  fs::remove_all(staging, ec);

  DOCSYNC_LOG_INFO(*logger_, "Cloning content source", {StringField("source", name_), StringField("url", url_), StringField("path", local_path_.string())});

  auto result = client_->Clone(url_, branch_, staging, options);
  if (!result) {
    fs::remove_all(staging, ec);
    return result;
  }

  fs::rename(staging, local_path_, ec);
  if (ec) {
    const auto message = "cannot move clone into " + local_path_.string() + ": " + ec.message();
    fs::remove_all(staging, ec);
    return repo::FetchResult::Err(repo::FetchStatus::Failed, message);
  }

  return result;
}

bool ContentSource::Sync(const SyncOptions& options) {
  std::lock_guard<std::mutex> sync_lock(sync_mutex_);

  DOCSYNC_LOG_INFO(*logger_, "Updating content source", {StringField("source", name_)});

  repo::FetchOptions fetch_options;
  fetch_options.timeout   = options.timeout;
  fetch_options.cancelled = options.cancelled;

  repo::FetchResult result;
  try {
    if (!CheckoutExists()) {
      result = CloneIntoPlace(fetch_options);
    } else {
      DOCSYNC_LOG_INFO(*logger_, "Pulling latest", {StringField("source", name_), StringField("branch", branch_)});
      result = client_->FastForward(local_path_, branch_, fetch_options);
    }
  } catch (const std::exception& e) {
    DOCSYNC_LOG_ERROR(*logger_, "Unexpected error updating content source", {StringField("source", name_), StringField("error", e.what())});
    return false;
  }

  if (!result) {
    DOCSYNC_LOG_ERROR(*logger_, "Failed to update content source",
                      {StringField("source", name_), StringField("status", repo::FetchStatusName(result.status)),
                       StringField("diagnostics", result.diagnostics)});
    return false;
  }

  switch (result.status) {
    case repo::FetchStatus::Cloned:
      DOCSYNC_LOG_INFO(*logger_, "Cloned content source", {StringField("source", name_)});
      break;
    case repo::FetchStatus::UpToDate:
      DOCSYNC_LOG_INFO(*logger_, "Content source already up to date", {StringField("source", name_)});
      break;
    default:
      DOCSYNC_LOG_INFO(*logger_, "Updated content source", {StringField("source", name_)});
      break;
  }

  RecordSuccess();
  return true;
}

// ------------------------------------------------------------
// Files
// ------------------------------------------------------------

std::set<fs::path> ContentSource::ListFiles() const {
  auto files = filter_.Select(local_path_, *logger_);

  std::error_code ec;
  const auto      base = fs::absolute(local_path_, ec).lexically_normal();
  if (!ec) {
    files.erase(base / kMarkerFileName);
    files.erase(base / (std::string(kMarkerFileName) + ".tmp"));
  }

  DOCSYNC_LOG_DEBUG(*logger_, "Found files", {StringField("source", name_), IntField("count", static_cast<int64_t>(files.size())),
                                              DoubleField("priority", priority_)});
  return files;
}

} // namespace docsync::source
