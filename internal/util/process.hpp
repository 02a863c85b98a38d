#pragma once

#include <atomic>
#include <chrono>
#include <string>
#include <vector>

namespace docsync::util {

struct ProcessOptions {
  // Zero means no deadline.
  std::chrono::milliseconds timeout{0};

  // Polled while the child runs; when set the child is killed.
  const std::atomic<bool>* cancelled = nullptr;

  // "KEY=VALUE" entries added to the inherited environment, replacing any
  // inherited entry of the same name.
  std::vector<std::string> extra_env;
};

struct ProcessResult {
  int         exit_code = -1;
  bool        timed_out = false;
  bool        cancelled = false;
  std::string stdout_text;
  std::string stderr_text;

  // Set when the child could not be started at all.
  std::string spawn_error;

  bool Succeeded() const {
    return spawn_error.empty() && !timed_out && !cancelled && exit_code == 0;
  }
};

/*
  Runs argv[0] (PATH lookup) as a child process in its own process group,
  capturing stdout and stderr. On timeout or cancellation the whole group
  receives SIGKILL. stdin is /dev/null.
*/
ProcessResult RunProcess(const std::vector<std::string>& argv, const ProcessOptions& options);

} // namespace docsync::util
