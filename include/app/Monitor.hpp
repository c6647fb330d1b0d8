#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>
#include "app/Alerts.hpp"
#include "app/Config.hpp"
#include "app/ProcessKiller.hpp"
#include "app/RuleStore.hpp"
#include "app/SnapshotBuffers.hpp"
#include "collectors/IBandwidthCollector.hpp"
#include "collectors/IConnectionCollector.hpp"
#include "collectors/IProcessCollector.hpp"

namespace netsentry::app {

struct MonitorSources {
  std::unique_ptr<netsentry::collectors::IConnectionCollector> connections;
  std::unique_ptr<netsentry::collectors::IBandwidthCollector> bandwidth;
  std::unique_ptr<netsentry::collectors::IProcessCollector> processes; // optional
};

// Production sources built from the configured tool names
[[nodiscard]] MonitorSources make_default_sources(const ToolConfig& tools);

// Periodic sampling and aggregation. Each cycle fetches connections (and on
// measurement cycles a bandwidth snapshot, concurrently), classifies them
// against the rule store, evaluates alerts and publishes a MonitorSnapshot.
class Monitor {
public:
  Monitor(SnapshotBuffers& buffers, RuleStore& rules, const MonitorConfig& cfg);
  Monitor(SnapshotBuffers& buffers, RuleStore& rules, const MonitorConfig& cfg, MonitorSources sources);
  ~Monitor();
  Monitor(const Monitor&) = delete;
  Monitor& operator=(const Monitor&) = delete;

  void start();
  void stop();

  // One full cycle on the calling thread; serialized with the loop
  void run_cycle();

  // Clamped to the 5 s floor; restarts the pending wait
  void set_interval(int seconds);
  [[nodiscard]] int interval() const { return interval_s_.load(std::memory_order_relaxed); }

  void set_alert_settings(const AlertSettings& s);

  void trust_process(const std::string& name);
  void trust_address(const std::string& address);
  void block_process(const std::string& name);
  void block_address(const std::string& address);
  void add_rule(netsentry::model::ConnectionRule rule);
  bool remove_rule(const std::string& id);

  // Refuses pids whose connections are marked unkillable; on success the
  // pid's connections are dropped and a snapshot is republished
  KillResult kill_process(int32_t pid);

  [[nodiscard]] const AlertLog& alert_log() const { return log_; }
  AlertLog& alert_log() { return log_; }
  [[nodiscard]] uint64_t cycles() const;

private:
  void run(std::stop_token st);
  void reapply_rules_locked();
  void publish_locked();
  [[nodiscard]] bool is_measurement_cycle(uint64_t cycle) const;

  SnapshotBuffers& buffers_;
  RuleStore& rules_;
  MonitorSources sources_;
  ProcessKiller killer_;
  size_t top_limit_{5};

  std::atomic<int> interval_s_{kMinIntervalSeconds};
  std::atomic<bool> measuring_{false};

  std::mutex cycle_mu_;          // one cycle at a time
  mutable std::mutex mu_;        // aggregation state
  uint64_t cycle_count_{0};
  std::vector<netsentry::model::Connection> connections_;
  netsentry::model::BandwidthSnapshot current_bw_;
  std::deque<netsentry::model::BandwidthSnapshot> history_;
  uint64_t session_in_{0};
  uint64_t session_out_{0};
  std::map<std::string, netsentry::model::AppUsage> session_usage_;
  std::vector<netsentry::model::AppProcess> top_procs_;
  bool last_measured_{false};
  std::vector<netsentry::model::AlertEvent> last_alerts_; // raised by cycle_count_
  AlertEngine alerts_;
  AlertLog log_;

  std::mutex wait_mu_;
  std::condition_variable_any wait_cv_;
  uint64_t interval_gen_{0};
  std::jthread thread_{};
};

} // namespace netsentry::app
