#pragma once
#include <cstdint>
#include <string>

namespace netsentry::app {

struct KillResult {
  bool success{false};
  std::string message;
};

// Sends SIGTERM to a user-owned process. Refuses pid <= 1, processes whose
// owner cannot be determined, root-owned processes and OS daemons.
class ProcessKiller {
public:
  explicit ProcessKiller(std::string ps_exe = "ps");

  [[nodiscard]] KillResult kill_process(int32_t pid) const;

  // Login name owning pid via "ps -p <pid> -o user="; empty if unknown
  [[nodiscard]] std::string process_owner(int32_t pid) const;

  // Executable name via "ps -p <pid> -o comm=", last path component only
  [[nodiscard]] std::string process_name(int32_t pid) const;

private:
  std::string ps_exe_;
};

} // namespace netsentry::app
