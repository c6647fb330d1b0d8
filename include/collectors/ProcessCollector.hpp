#pragma once
#include <string>
#include <string_view>
#include "collectors/IProcessCollector.hpp"

namespace netsentry::collectors {

// "  PID COMM %CPU" table; header dropped, zero-CPU rows dropped
[[nodiscard]] auto parse_ps_output(std::string_view text) -> std::vector<netsentry::model::AppProcess>;

class ProcessCollector : public IProcessCollector {
public:
  explicit ProcessCollector(std::string ps_exe = "ps");
  [[nodiscard]] bool sample(std::vector<netsentry::model::AppProcess>& out, size_t limit) override;
  [[nodiscard]] const char* name() const override { return "ps"; }
private:
  std::string ps_exe_;
};

} // namespace netsentry::collectors
