#pragma once
#include <chrono>
#include <string>
#include <string_view>
#include <utility>
#include "collectors/IBandwidthCollector.hpp"

namespace netsentry::collectors {

inline constexpr std::chrono::milliseconds kBandwidthTimeout{15000};

// nettop -L 2 emits two blank-line separated CSV blocks; the first carries
// cumulative-since-boot counters, the second the delta we want.
[[nodiscard]] auto parse_bandwidth_output(std::string_view text, double duration_s = 2.0)
    -> netsentry::model::BandwidthSnapshot;

// "com.apple.Safari.1234" -> {"com.apple.Safari", 1234}; no numeric suffix -> {field, 0}
[[nodiscard]] auto parse_process_field(std::string_view field) -> std::pair<std::string, int32_t>;

class BandwidthCollector : public IBandwidthCollector {
public:
  explicit BandwidthCollector(std::string nettop_exe = "nettop");
  [[nodiscard]] bool sample(netsentry::model::BandwidthSnapshot& out) override;
  [[nodiscard]] const char* name() const override { return "nettop"; }
private:
  std::string nettop_exe_;
};

} // namespace netsentry::collectors
