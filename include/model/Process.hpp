#pragma once
#include <cstdint>
#include <string>

namespace netsentry::model {

// One row of the CPU ranking
struct AppProcess {
  std::string name;   // last path component of the command
  int32_t pid{};
  double cpu_pct{};
};

} // namespace netsentry::model
