#pragma once
#include <cstddef>
#include <vector>
#include "model/Process.hpp"

namespace netsentry::collectors {

// CPU ranking source (top-N processes by CPU)
class IProcessCollector {
public:
  virtual ~IProcessCollector() = default;

  [[nodiscard]] virtual bool sample(std::vector<netsentry::model::AppProcess>& out, size_t limit) = 0;

  [[nodiscard]] virtual const char* name() const = 0;
};

} // namespace netsentry::collectors
