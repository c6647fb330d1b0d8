#pragma once
#include "model/Bandwidth.hpp"

namespace netsentry::collectors {

class IBandwidthCollector {
public:
  virtual ~IBandwidthCollector() = default;

  // Blocking measurement; may take several seconds. On failure out is left
  // as an empty snapshot and false is returned.
  [[nodiscard]] virtual bool sample(netsentry::model::BandwidthSnapshot& out) = 0;

  [[nodiscard]] virtual const char* name() const = 0;
};

} // namespace netsentry::collectors
