#include "app/ProcessKiller.hpp"
#include "app/Heuristics.hpp"
#include "util/Shell.hpp"

#include <cctype>
#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <sys/types.h>

namespace netsentry::app {

static std::string kill_error_message(int err) {
  switch (err) {
    case EPERM: return "Operation not permitted";
    case ESRCH: return "No such process";
    default: break;
  }
  return std::string("kill failed: ") + std::strerror(err);
}

ProcessKiller::ProcessKiller(std::string ps_exe) : ps_exe_(std::move(ps_exe)) {}

static std::string trimmed(const std::string& s) {
  size_t b = 0, e = s.size();
  while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
  while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
  return s.substr(b, e - b);
}

std::string ProcessKiller::process_owner(int32_t pid) const {
  return trimmed(netsentry::util::run_command({ps_exe_, "-p", std::to_string(pid), "-o", "user="}));
}

std::string ProcessKiller::process_name(int32_t pid) const {
  auto comm = trimmed(netsentry::util::run_command({ps_exe_, "-p", std::to_string(pid), "-o", "comm="}));
  auto slash = comm.find_last_of('/');
  return slash == std::string::npos ? comm : comm.substr(slash + 1);
}

KillResult ProcessKiller::kill_process(int32_t pid) const {
  if (pid <= 1) return {false, "Refusing to signal pid " + std::to_string(pid)};

  auto owner = process_owner(pid);
  if (owner.empty()) return {false, "Could not determine owner of pid " + std::to_string(pid)};
  if (owner == "root") return {false, "Refusing to signal root-owned pid " + std::to_string(pid)};

  auto name = process_name(pid);
  if (!can_kill(name)) return {false, "Refusing to terminate system process " + name};

  if (::kill(static_cast<pid_t>(pid), SIGTERM) == -1) {
    int err = errno;
    std::fprintf(stderr, "netsentry: ProcessKiller: kill(%d): %s\n", pid, std::strerror(err));
    return {false, kill_error_message(err)};
  }
  return {true, "SIGTERM sent to pid " + std::to_string(pid)};
}

} // namespace netsentry::app
