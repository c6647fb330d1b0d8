#pragma once
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace netsentry::model {

// Bytes attributed to one process over one sampling window
struct ProcessBandwidth {
  std::string process_name;
  int32_t pid{};        // 0 if unresolved
  uint64_t bytes_in{};
  uint64_t bytes_out{};

  [[nodiscard]] uint64_t total_bytes() const { return bytes_in + bytes_out; }
  [[nodiscard]] double rate_in(double duration_s) const {
    return duration_s > 0.0 ? static_cast<double>(bytes_in) / duration_s : 0.0;
  }
  [[nodiscard]] double rate_out(double duration_s) const {
    return duration_s > 0.0 ? static_cast<double>(bytes_out) / duration_s : 0.0;
  }
};

// One completed measurement. duration_s is the measured wall-clock time the
// sampling tool ran; a default-constructed snapshot is the "no data" value.
struct BandwidthSnapshot {
  std::chrono::system_clock::time_point timestamp{};
  double duration_s{};
  std::vector<ProcessBandwidth> processes;

  [[nodiscard]] bool empty() const { return processes.empty(); }

  [[nodiscard]] uint64_t total_bytes_in() const {
    uint64_t t = 0; for (const auto& p : processes) t += p.bytes_in; return t;
  }
  [[nodiscard]] uint64_t total_bytes_out() const {
    uint64_t t = 0; for (const auto& p : processes) t += p.bytes_out; return t;
  }
  [[nodiscard]] double rate_in() const {
    return duration_s > 0.0 ? static_cast<double>(total_bytes_in()) / duration_s : 0.0;
  }
  [[nodiscard]] double rate_out() const {
    return duration_s > 0.0 ? static_cast<double>(total_bytes_out()) / duration_s : 0.0;
  }

  [[nodiscard]] std::vector<ProcessBandwidth> top_consumers(size_t limit = 5) const {
    std::vector<ProcessBandwidth> out = processes;
    std::stable_sort(out.begin(), out.end(), [](const ProcessBandwidth& a, const ProcessBandwidth& b){
      return a.total_bytes() > b.total_bytes();
    });
    if (out.size() > limit) out.resize(limit);
    return out;
  }
};

} // namespace netsentry::model
