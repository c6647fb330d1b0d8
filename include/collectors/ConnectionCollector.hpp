#pragma once
#include <string>
#include <string_view>
#include <vector>
#include "collectors/IConnectionCollector.hpp"

namespace netsentry::collectors {

struct Endpoint {
  std::string address;
  std::string port; // "?" when no colon was present
};

// lsof column layout: COMMAND PID USER FD TYPE DEVICE SIZE/OFF NODE NAME [(STATE)]
inline constexpr size_t kLsofMinColumns = 9;
inline constexpr size_t kLsofNodeColumn = 7;
inline constexpr size_t kLsofNameColumn = 8;

// Parse lsof -i text into heuristic-evaluated connections. Lines with fewer
// than kLsofMinColumns fields are dropped. Never throws.
[[nodiscard]] auto parse_connection_list(std::string_view text) -> std::vector<netsentry::model::Connection>;

// "local->remote" or "addr:port"; remote half, split at the last ':', IPv6 brackets stripped
[[nodiscard]] auto split_endpoint(std::string_view field) -> Endpoint;

// Decode lsof's \xHH escapes into raw bytes. Returns input unchanged when no "\x" occurs.
[[nodiscard]] auto unescape_process_name(std::string_view name) -> std::string;

// Keep only lines mentioning ESTABLISHED
[[nodiscard]] auto filter_established(std::string_view text) -> std::string;

class ConnectionCollector : public IConnectionCollector {
public:
  explicit ConnectionCollector(std::string lsof_exe = "lsof");
  [[nodiscard]] bool sample(std::vector<netsentry::model::Connection>& out) override;
  [[nodiscard]] const char* name() const override { return "lsof"; }
private:
  std::string lsof_exe_;
};

} // namespace netsentry::collectors
