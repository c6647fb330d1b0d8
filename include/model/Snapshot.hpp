#pragma once
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <vector>
#include "model/Bandwidth.hpp"
#include "model/Connection.hpp"
#include "model/Process.hpp"

namespace netsentry::model {

enum class AlertKind { Suspicious, Bandwidth };

[[nodiscard]] inline const char* to_string(AlertKind k) {
  return k == AlertKind::Bandwidth ? "bandwidth" : "suspicious";
}

struct AlertEvent {
  AlertKind kind{AlertKind::Suspicious};
  std::string title;
  std::string subject;  // process name or address; empty for aggregated alerts
  std::string reason;   // human-readable body
  std::chrono::system_clock::time_point timestamp{};
};

struct AppUsage {
  uint64_t bytes_in{};
  uint64_t bytes_out{};
};

struct NamedUsage {
  std::string name;
  uint64_t bytes_in{};
  uint64_t bytes_out{};
};

// Everything one monitoring cycle publishes. Immutable once published.
struct MonitorSnapshot {
  uint64_t seq{};
  uint64_t cycle{};
  bool measured{false};   // measurement cycle; current_bandwidth is empty if it failed
  std::vector<Connection> connections;
  BandwidthSnapshot current_bandwidth;
  std::vector<BandwidthSnapshot> bandwidth_history; // oldest first, bounded
  uint64_t session_total_in{};
  uint64_t session_total_out{};
  std::map<std::string, AppUsage> session_app_usage;
  std::vector<AlertEvent> new_alerts;               // raised by this cycle
  std::vector<AppProcess> top_processes;

  [[nodiscard]] size_t suspicious_count() const {
    return static_cast<size_t>(std::count_if(connections.begin(), connections.end(),
                                             [](const Connection& c){ return c.is_suspicious(); }));
  }

  [[nodiscard]] size_t trusted_count() const {
    return static_cast<size_t>(std::count_if(connections.begin(), connections.end(),
                                             [](const Connection& c){ return c.classification == Classification::Allowed; }));
  }

  [[nodiscard]] std::vector<Connection> sorted_connections() const {
    auto out = connections;
    std::stable_sort(out.begin(), out.end(), [](const Connection& a, const Connection& b){
      return a.sort_priority() < b.sort_priority();
    });
    return out;
  }

  // Session consumers by cumulative total, descending
  [[nodiscard]] std::vector<NamedUsage> top_session_apps() const {
    std::vector<NamedUsage> out;
    out.reserve(session_app_usage.size());
    for (const auto& [name, u] : session_app_usage) out.push_back({name, u.bytes_in, u.bytes_out});
    std::stable_sort(out.begin(), out.end(), [](const NamedUsage& a, const NamedUsage& b){
      return (a.bytes_in + a.bytes_out) > (b.bytes_in + b.bytes_out);
    });
    return out;
  }

  [[nodiscard]] std::vector<double> upload_rate_history() const {
    std::vector<double> out;
    for (const auto& b : bandwidth_history) out.push_back(b.rate_out());
    return out;
  }

  [[nodiscard]] std::vector<double> download_rate_history() const {
    std::vector<double> out;
    for (const auto& b : bandwidth_history) out.push_back(b.rate_in());
    return out;
  }
};

} // namespace netsentry::model
