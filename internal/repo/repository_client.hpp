#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <string>
#include <string_view>

namespace docsync::repo {

enum class FetchStatus {
  Cloned = 0,
  Updated,
  UpToDate,

  Failed,
  TimedOut,
  Cancelled,
};

std::string_view FetchStatusName(FetchStatus status);

struct FetchResult {
  FetchStatus status = FetchStatus::Failed;

  // Captured client output, kept for failure diagnostics.
  std::string diagnostics;

  static FetchResult Ok(FetchStatus s) {
    return {s, {}};
  }

  static FetchResult Err(FetchStatus s, std::string msg) {
    return {s, std::move(msg)};
  }

  explicit operator bool() const {
    return status == FetchStatus::Cloned || status == FetchStatus::Updated || status == FetchStatus::UpToDate;
  }
};

struct FetchOptions {
  // Zero means no deadline.
  std::chrono::milliseconds timeout{0};

  const std::atomic<bool>* cancelled = nullptr;
};

/*
  Repository fetch abstraction.

  Both operations are atomic at the ref level: on failure the destination is
  either absent (Clone) or still at its previous revision (FastForward).

  Implementations:
    GitCliClient → spawns the git command line client
*/
class RepositoryClient {
 public:
  virtual ~RepositoryClient() = default;

  // ------------------------------------------------------------------
  // Clone
  // ------------------------------------------------------------------
  /*
    Shallow, single-branch acquisition of `branch` into `destination`,
    which must not exist yet.
  */
  virtual FetchResult Clone(const std::string& url, const std::string& branch, const std::filesystem::path& destination,
                            const FetchOptions& options) = 0;

  // ------------------------------------------------------------------
  // FastForward
  // ------------------------------------------------------------------
  /*
    Fast-forward-only update of an existing checkout. Diverged histories fail.
  */
  virtual FetchResult FastForward(const std::filesystem::path& checkout, const std::string& branch, const FetchOptions& options) = 0;
};

} // namespace docsync::repo
