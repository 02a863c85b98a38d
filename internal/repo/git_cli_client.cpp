#include "git_cli_client.hpp"

namespace docsync::repo {

namespace {

std::string Diagnostics(const util::ProcessResult& result) {
  std::string text = result.stderr_text;
  if (!result.stdout_text.empty()) {
    if (!text.empty() && text.back() != '\n') {
      text.push_back('\n');
    }
    text += result.stdout_text;
  }
  while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
    text.pop_back();
  }
  return text;
}

bool IsAlreadyUpToDate(const std::string& output) {
  // Older git releases print the hyphenated form.
  return output.find("Already up to date") != std::string::npos || output.find("Already up-to-date") != std::string::npos;
}

} // namespace

std::string_view FetchStatusName(FetchStatus status) {
  switch (status) {
    case FetchStatus::Cloned:
      return "cloned";
    case FetchStatus::Updated:
      return "updated";
    case FetchStatus::UpToDate:
      return "up_to_date";
    case FetchStatus::Failed:
      return "failed";
    case FetchStatus::TimedOut:
      return "timed_out";
    case FetchStatus::Cancelled:
      return "cancelled";
  }
  return "unknown";
}

GitCliClient::GitCliClient(std::string git_binary) : git_binary_(std::move(git_binary)) {
  if (git_binary_.empty()) {
    git_binary_ = "git";
  }
}

util::ProcessResult GitCliClient::Run(const std::vector<std::string>& args, const FetchOptions& options) const {
  std::vector<std::string> argv;
  argv.reserve(args.size() + 1);
  argv.push_back(git_binary_);
  argv.insert(argv.end(), args.begin(), args.end());

  util::ProcessOptions process_options;
  process_options.timeout   = options.timeout;
  process_options.cancelled = options.cancelled;
  process_options.extra_env = {"GIT_TERMINAL_PROMPT=0", "LC_ALL=C"};

  return util::RunProcess(argv, process_options);
}

FetchResult GitCliClient::Failure(const util::ProcessResult& result) {
  if (!result.spawn_error.empty()) {
    return FetchResult::Err(FetchStatus::Failed, result.spawn_error);
  }
  if (result.timed_out) {
    return FetchResult::Err(FetchStatus::TimedOut, Diagnostics(result));
  }
  if (result.cancelled) {
    return FetchResult::Err(FetchStatus::Cancelled, Diagnostics(result));
  }

  auto diagnostics = Diagnostics(result);
  diagnostics      = "exit code " + std::to_string(result.exit_code) + (diagnostics.empty() ? "" : ": " + diagnostics);
  return FetchResult::Err(FetchStatus::Failed, std::move(diagnostics));
}

FetchResult GitCliClient::Clone(const std::string& url, const std::string& branch, const std::filesystem::path& destination,
                                const FetchOptions& options) {
  auto result = Run({"clone", "--depth", "1", "--single-branch", "--branch", branch, "--", url, destination.string()}, options);
  if (!result.Succeeded()) {
    return Failure(result);
  }
  return FetchResult::Ok(FetchStatus::Cloned);
}

FetchResult GitCliClient::FastForward(const std::filesystem::path& checkout, const std::string& branch, const FetchOptions& options) {
  auto result = Run({"-C", checkout.string(), "pull", "--ff-only", "origin", branch}, options);
  if (!result.Succeeded()) {
    return Failure(result);
  }
  if (IsAlreadyUpToDate(result.stdout_text)) {
    return FetchResult::Ok(FetchStatus::UpToDate);
  }
  return FetchResult::Ok(FetchStatus::Updated);
}

} // namespace docsync::repo
