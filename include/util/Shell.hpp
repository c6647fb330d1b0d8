// Timeout-bounded execution of external text-producing tools
#pragma once
#include <chrono>
#include <string>
#include <vector>

namespace netsentry::util {

inline constexpr std::chrono::milliseconds kDefaultCommandTimeout{5000};

struct CommandResult {
  int exit_code{-1};       // -1 if the child never exited normally
  bool timed_out{false};
  bool spawned{false};
  std::string out;         // captured stdout (stderr is discarded)
};

// Run argv[0] (PATH lookup) with argv as its arguments; no shell is involved,
// so arguments are never re-parsed. Stdout is drained while the child runs.
// On timeout the child is SIGKILLed and reaped. Never throws.
[[nodiscard]] auto run_command_status(const std::vector<std::string>& argv,
                                      std::chrono::milliseconds timeout = kDefaultCommandTimeout)
    -> CommandResult;

// Captured stdout on clean exit (status 0), empty string on any failure.
[[nodiscard]] auto run_command(const std::vector<std::string>& argv,
                               std::chrono::milliseconds timeout = kDefaultCommandTimeout)
    -> std::string;

} // namespace netsentry::util
