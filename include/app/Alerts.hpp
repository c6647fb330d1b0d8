#pragma once
#include "model/Snapshot.hpp"
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <unordered_set>
#include <vector>

namespace netsentry::app {

struct AlertSettings {
  bool notifications = true;          // master switch
  bool notify_suspicious = true;
  bool notify_bandwidth = false;
  int bandwidth_threshold_mb = 50;    // per measurement interval

  [[nodiscard]] uint64_t threshold_bytes() const {
    return bandwidth_threshold_mb > 0 ? static_cast<uint64_t>(bandwidth_threshold_mb) * 1024ull * 1024ull : 0;
  }
};

class AlertEngine {
public:
  explicit AlertEngine(AlertSettings settings = {});

  // New blocked connections alert one by one; new unclassified suspicious
  // ones alert once in aggregate. "New" means the pid was absent from the
  // previous call. The previous pid set is replaced afterwards.
  // notes[i] is the matching rule's note for connections[i] (may be empty).
  std::vector<netsentry::model::AlertEvent> evaluate_connections(
      const std::vector<netsentry::model::Connection>& connections,
      const std::vector<std::string>& notes);

  // Crossing above the threshold alerts once; dropping to or below it re-arms.
  std::vector<netsentry::model::AlertEvent> evaluate_bandwidth(
      const netsentry::model::BandwidthSnapshot& snapshot);

  void set_settings(const AlertSettings& s) { settings_ = s; }
  [[nodiscard]] const AlertSettings& settings() const { return settings_; }
  [[nodiscard]] bool bandwidth_alerted(const std::string& name) const { return alerted_bandwidth_.count(name) != 0; }
  [[nodiscard]] size_t known_pid_count() const { return previous_pids_.size(); }

private:
  AlertSettings settings_;
  std::unordered_set<int32_t> previous_pids_;
  std::unordered_set<std::string> alerted_bandwidth_;
};

// Bounded newest-first history of raised alerts
class AlertLog {
public:
  static constexpr size_t kMaxEntries = 50;

  void add(netsentry::model::AlertEvent e);
  void clear();
  [[nodiscard]] std::vector<netsentry::model::AlertEvent> entries() const;
  [[nodiscard]] size_t size() const;
  [[nodiscard]] bool empty() const;

private:
  mutable std::mutex mu_;
  std::deque<netsentry::model::AlertEvent> entries_;
};

} // namespace netsentry::app
