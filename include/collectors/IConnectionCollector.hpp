#pragma once
#include <vector>
#include "model/Connection.hpp"

namespace netsentry::collectors {

// Source of the per-cycle connection list. The production implementation
// runs lsof; tests feed canned text.
class IConnectionCollector {
public:
  virtual ~IConnectionCollector() = default;

  // Replace out with the current connections. False means "no data this cycle".
  [[nodiscard]] virtual bool sample(std::vector<netsentry::model::Connection>& out) = 0;

  [[nodiscard]] virtual const char* name() const = 0;
};

} // namespace netsentry::collectors
