#include "process.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <cstring>
#include <string_view>

extern char** environ;

namespace docsync::util {
namespace {

constexpr auto kPollSlice = std::chrono::milliseconds(100);

class Pipe {
 public:
  Pipe() {
    if (::pipe2(fds_, O_CLOEXEC) != 0) {
      fds_[0] = fds_[1] = -1;
    }
  }
  ~Pipe() {
    CloseRead();
    CloseWrite();
  }

  Pipe(const Pipe&)            = delete;
  Pipe& operator=(const Pipe&) = delete;

  bool ok() const {
    return fds_[0] >= 0 && fds_[1] >= 0;
  }
  int read_fd() const {
    return fds_[0];
  }
  int write_fd() const {
    return fds_[1];
  }

  void CloseRead() {
    if (fds_[0] >= 0) {
      ::close(fds_[0]);
      fds_[0] = -1;
    }
  }
  void CloseWrite() {
    if (fds_[1] >= 0) {
      ::close(fds_[1]);
      fds_[1] = -1;
    }
  }

 private:
  int fds_[2];
};

std::string ErrnoMessage(const char* what, int err) {
  return std::string(what) + ": " + std::strerror(err);
}

void SetNonBlocking(int fd) {
  const int flags = ::fcntl(fd, F_GETFL, 0);
  if (flags >= 0) {
    ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
  }
}

// Reads everything currently available. Returns false on EOF or a hard error.
bool Drain(int fd, std::string* out) {
  std::array<char, 4096> buffer{};
  for (;;) {
    const ssize_t n = ::read(fd, buffer.data(), buffer.size());
    if (n > 0) {
      out->append(buffer.data(), static_cast<size_t>(n));
      continue;
    }
    if (n == 0) {
      return false;
    }
    if (errno == EINTR) {
      continue;
    }
    return errno == EAGAIN || errno == EWOULDBLOCK;
  }
}

std::string_view EnvName(std::string_view entry) {
  return entry.substr(0, entry.find('='));
}

bool IsOverridden(std::string_view inherited, const std::vector<std::string>& overrides) {
  const auto name = EnvName(inherited);
  for (const auto& entry : overrides) {
    if (EnvName(entry) == name) {
      return true;
    }
  }
  return false;
}

int DecodeWaitStatus(int status) {
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return 128 + WTERMSIG(status);
  }
  return -1;
}

} // namespace

ProcessResult RunProcess(const std::vector<std::string>& argv, const ProcessOptions& options) {
  ProcessResult result;

  if (argv.empty()) {
    result.spawn_error = "empty command line";
    return result;
  }

  std::vector<char*> args;
  args.reserve(argv.size() + 1);
  for (const auto& arg : argv) {
    args.push_back(const_cast<char*>(arg.c_str()));
  }
  args.push_back(nullptr);

  // extra_env replaces inherited entries with the same name; getenv() returns
  // the first match.
  std::vector<char*> env;
  for (char** it = environ; it && *it; ++it) {
    if (!IsOverridden(*it, options.extra_env)) {
      env.push_back(*it);
    }
  }
  for (const auto& entry : options.extra_env) {
    env.push_back(const_cast<char*>(entry.c_str()));
  }
  env.push_back(nullptr);

  Pipe out;
  Pipe err;
  if (!out.ok() || !err.ok()) {
    result.spawn_error = ErrnoMessage("pipe2", errno);
    return result;
  }

  posix_spawn_file_actions_t actions;
  posix_spawnattr_t          attr;
  posix_spawn_file_actions_init(&actions);
  posix_spawnattr_init(&attr);

  posix_spawn_file_actions_addopen(&actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
  posix_spawn_file_actions_adddup2(&actions, out.write_fd(), STDOUT_FILENO);
  posix_spawn_file_actions_adddup2(&actions, err.write_fd(), STDERR_FILENO);

  // Own process group so a kill reaches helpers such as git-remote-https.
  posix_spawnattr_setflags(&attr, POSIX_SPAWN_SETPGROUP);
  posix_spawnattr_setpgroup(&attr, 0);

  pid_t     pid         = -1;
  const int spawn_error = ::posix_spawnp(&pid, args[0], &actions, &attr, args.data(), env.data());

  posix_spawn_file_actions_destroy(&actions);
  posix_spawnattr_destroy(&attr);

  if (spawn_error != 0) {
    result.spawn_error = ErrnoMessage("posix_spawnp", spawn_error);
    return result;
  }

  out.CloseWrite();
  err.CloseWrite();
  SetNonBlocking(out.read_fd());
  SetNonBlocking(err.read_fd());

  const auto deadline = options.timeout.count() > 0 ? std::chrono::steady_clock::now() + options.timeout
                                                     : std::chrono::steady_clock::time_point::max();

  bool out_open = true;
  bool err_open = true;
  bool killed   = false;

  auto kill_if_expired = [&] {
    if (killed) {
      return;
    }
    if (options.cancelled && options.cancelled->load()) {
      result.cancelled = true;
    } else if (std::chrono::steady_clock::now() >= deadline) {
      result.timed_out = true;
    }
    if (result.cancelled || result.timed_out) {
      ::kill(-pid, SIGKILL);
      killed = true;
    }
  };

  while (out_open || err_open) {
    kill_if_expired();

    std::array<pollfd, 2> fds{};
    nfds_t                count = 0;
    if (out_open) {
      fds[count++] = {out.read_fd(), POLLIN, 0};
    }
    if (err_open) {
      fds[count++] = {err.read_fd(), POLLIN, 0};
    }

    const int ready = ::poll(fds.data(), count, static_cast<int>(kPollSlice.count()));
    if (ready < 0) {
      if (errno == EINTR) {
        continue;
      }
      break;
    }
    if (ready == 0) {
      continue;
    }

    for (nfds_t i = 0; i < count; ++i) {
      if ((fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) {
        continue;
      }
      if (fds[i].fd == out.read_fd()) {
        out_open = Drain(out.read_fd(), &result.stdout_text);
      } else {
        err_open = Drain(err.read_fd(), &result.stderr_text);
      }
    }
  }

  // Pipes can close before the child exits (it may close its own stdio).
  int status = 0;
  for (;;) {
    const pid_t waited = ::waitpid(pid, &status, WNOHANG);
    if (waited == pid) {
      break;
    }
    if (waited < 0 && errno != EINTR) {
      status = -1;
      break;
    }
    kill_if_expired();
    ::usleep(10 * 1000);
  }

  result.exit_code = status == -1 ? -1 : DecodeWaitStatus(status);
  return result;
}

} // namespace docsync::util
