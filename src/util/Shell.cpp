#include "util/Shell.hpp"

#include <sys/types.h>
#include <sys/wait.h>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <unistd.h>

#include <cerrno>
#include <thread>
#include <utility>

using namespace std::chrono;

namespace netsentry::util {

// Tool output beyond this is dropped; the pipe keeps being drained.
static constexpr size_t MAX_CAPTURE_BYTES = 32u * 1024u * 1024u;

static void close_fd(int& fd) {
  if (fd >= 0) { ::close(fd); fd = -1; }
}

static void kill_and_reap(pid_t pid) {
  ::kill(pid, SIGKILL);
  int status = 0;
  while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
}

auto run_command_status(const std::vector<std::string>& argv, milliseconds timeout) -> CommandResult {
  CommandResult res;
  if (argv.empty() || argv[0].empty()) return res;

  // Build argv before fork: only async-signal-safe calls happen in the child.
  std::vector<char*> c_args;
  c_args.reserve(argv.size() + 1);
  for (const auto& a : argv) c_args.push_back(const_cast<char*>(a.c_str()));
  c_args.push_back(nullptr);

  int pipe_fd[2] = {-1, -1};
  if (::pipe2(pipe_fd, O_CLOEXEC) != 0) return res;

  pid_t pid = ::fork();
  if (pid < 0) {
    close_fd(pipe_fd[0]);
    close_fd(pipe_fd[1]);
    return res;
  }
  if (pid == 0) {
    int devnull = ::open("/dev/null", O_RDWR);
    if (devnull >= 0) {
      ::dup2(devnull, STDIN_FILENO);
      ::dup2(devnull, STDERR_FILENO);
    }
    ::dup2(pipe_fd[1], STDOUT_FILENO);
    ::execvp(c_args[0], c_args.data());
    ::_exit(127);
  }

  res.spawned = true;
  close_fd(pipe_fd[1]);
  int rfd = pipe_fd[0];
  ::fcntl(rfd, F_SETFL, ::fcntl(rfd, F_GETFL) | O_NONBLOCK);

  const auto deadline = steady_clock::now() + timeout;
  char buf[8192];
  bool eof = false;

  while (!eof) {
    auto remaining = duration_cast<milliseconds>(deadline - steady_clock::now());
    if (remaining.count() <= 0) {
      close_fd(rfd);
      kill_and_reap(pid);
      res.timed_out = true;
      res.out.clear();
      return res;
    }
    struct pollfd pfd{.fd = rfd, .events = POLLIN, .revents = 0};
    int rv = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
    if (rv < 0) {
      if (errno == EINTR) continue;
      break;
    }
    if (rv == 0) continue; // deadline check at loop top
    for (;;) {
      ssize_t n = ::read(rfd, buf, sizeof(buf));
      if (n > 0) {
        if (res.out.size() < MAX_CAPTURE_BYTES) res.out.append(buf, static_cast<size_t>(n));
        continue;
      }
      if (n == 0) { eof = true; break; }
      if (errno == EINTR) continue;
      if (errno != EAGAIN && errno != EWOULDBLOCK) eof = true;
      break;
    }
  }
  close_fd(rfd);

  // Stdout closed but the child may not have exited yet; same deadline applies.
  int status = 0;
  for (;;) {
    pid_t w = ::waitpid(pid, &status, WNOHANG);
    if (w == pid) break;
    if (w < 0 && errno != EINTR) { res.out.clear(); return res; }
    if (steady_clock::now() >= deadline) {
      kill_and_reap(pid);
      res.timed_out = true;
      res.out.clear();
      return res;
    }
    std::this_thread::sleep_for(5ms);
  }

  if (WIFEXITED(status)) res.exit_code = WEXITSTATUS(status);
  return res;
}

auto run_command(const std::vector<std::string>& argv, milliseconds timeout) -> std::string {
  auto r = run_command_status(argv, timeout);
  if (!r.spawned || r.timed_out || r.exit_code != 0) return {};
  return std::move(r.out);
}

} // namespace netsentry::util
