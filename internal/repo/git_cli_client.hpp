#pragma once

#include <string>
#include <vector>

#include "repository_client.hpp"
#include "internal/util/process.hpp"

namespace docsync::repo {

/*
  RepositoryClient backed by the git executable.

      clone --depth 1 --single-branch --branch <branch> <url> <dest>
      -C <checkout> pull --ff-only origin <branch>

  The child runs with GIT_TERMINAL_PROMPT=0 so missing credentials fail
  instead of blocking, and LC_ALL=C so "Already up to date" is detectable.
*/
class GitCliClient final : public RepositoryClient {
 public:
  explicit GitCliClient(std::string git_binary = "git");

  FetchResult Clone(const std::string& url, const std::string& branch, const std::filesystem::path& destination,
                    const FetchOptions& options) override;

  FetchResult FastForward(const std::filesystem::path& checkout, const std::string& branch, const FetchOptions& options) override;

 private:
  util::ProcessResult Run(const std::vector<std::string>& args, const FetchOptions& options) const;

  static FetchResult Failure(const util::ProcessResult& result);

  std::string git_binary_;
};

} // namespace docsync::repo
