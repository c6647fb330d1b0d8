#include "app/Monitor.hpp"
#include "collectors/BandwidthCollector.hpp"
#include "collectors/ConnectionCollector.hpp"
#include "collectors/ProcessCollector.hpp"

#include <algorithm>
#include <cstdio>
#include <future>

using namespace std::chrono;
using netsentry::model::AlertEvent;
using netsentry::model::BandwidthSnapshot;
using netsentry::model::Classification;
using netsentry::model::Connection;
using netsentry::model::MatchField;
using netsentry::model::RuleType;

namespace netsentry::app {

MonitorSources make_default_sources(const ToolConfig& tools) {
  MonitorSources s;
  s.connections = std::make_unique<netsentry::collectors::ConnectionCollector>(tools.lsof);
  s.bandwidth = std::make_unique<netsentry::collectors::BandwidthCollector>(tools.nettop);
  s.processes = std::make_unique<netsentry::collectors::ProcessCollector>(tools.ps);
  return s;
}

Monitor::Monitor(SnapshotBuffers& buffers, RuleStore& rules, const MonitorConfig& cfg)
    : Monitor(buffers, rules, cfg, make_default_sources(cfg.tools)) {}

Monitor::Monitor(SnapshotBuffers& buffers, RuleStore& rules, const MonitorConfig& cfg, MonitorSources sources)
    : buffers_(buffers), rules_(rules), sources_(std::move(sources)), killer_(cfg.tools.ps),
      top_limit_(cfg.top_processes > 0 ? static_cast<size_t>(cfg.top_processes) : 0),
      alerts_(cfg.alerts) {
  interval_s_.store(std::max(cfg.interval_s, kMinIntervalSeconds), std::memory_order_relaxed);
}

Monitor::~Monitor() { stop(); }

void Monitor::start() {
  if (thread_.joinable()) return;
  thread_ = std::jthread([this](std::stop_token st){ run(st); });
}

void Monitor::stop() {
  if (!thread_.joinable()) return;
  thread_.request_stop();
  thread_.join();
}

void Monitor::run(std::stop_token st) {
  while (!st.stop_requested()) {
    run_cycle();

    std::unique_lock<std::mutex> lk(wait_mu_);
    auto deadline = steady_clock::now() + seconds(interval_s_.load(std::memory_order_relaxed));
    while (!st.stop_requested()) {
      const uint64_t gen = interval_gen_;
      if (!wait_cv_.wait_until(lk, st, deadline, [&]{ return interval_gen_ != gen; })) break;
      // Interval changed: wait the new interval from now
      deadline = steady_clock::now() + seconds(interval_s_.load(std::memory_order_relaxed));
    }
  }
}

// Exact pid first, then process name
static const netsentry::model::ProcessBandwidth* find_bandwidth(const BandwidthSnapshot& bw,
                                                                const Connection& c) {
  if (c.pid != 0) {
    for (const auto& p : bw.processes)
      if (p.pid == c.pid) return &p;
  }
  for (const auto& p : bw.processes)
    if (p.process_name == c.process_name) return &p;
  return nullptr;
}

bool Monitor::is_measurement_cycle(uint64_t cycle) const {
  if (measuring_.load(std::memory_order_acquire)) return false;
  return interval_s_.load(std::memory_order_relaxed) >= 10 || cycle % 2 == 0;
}

void Monitor::run_cycle() {
  std::lock_guard<std::mutex> cycle_lk(cycle_mu_);

  uint64_t cycle = 0;
  BandwidthSnapshot previous_bw;
  {
    std::lock_guard<std::mutex> lk(mu_);
    cycle = ++cycle_count_;
    previous_bw = current_bw_;
  }
  const bool measure = sources_.bandwidth && is_measurement_cycle(cycle);

  // Fetch: bandwidth runs alongside the connection listing and is joined
  // before anything is merged
  std::future<std::pair<bool, BandwidthSnapshot>> bw_future;
  if (measure) {
    measuring_.store(true, std::memory_order_release);
    auto* bw_source = sources_.bandwidth.get();
    bw_future = std::async(std::launch::async, [bw_source]{
      BandwidthSnapshot snap;
      bool ok = bw_source->sample(snap);
      return std::make_pair(ok, std::move(snap));
    });
  }

  std::vector<Connection> fetched;
  if (sources_.connections && !sources_.connections->sample(fetched)) fetched.clear();

  std::vector<netsentry::model::AppProcess> procs;
  bool procs_ok = sources_.processes && top_limit_ > 0 && sources_.processes->sample(procs, top_limit_);

  // A failed measurement yields an empty snapshot
  const bool measured = measure;
  BandwidthSnapshot bw = std::move(previous_bw);
  if (measure) {
    auto [ok, snap] = bw_future.get();
    measuring_.store(false, std::memory_order_release);
    bw = ok ? std::move(snap) : BandwidthSnapshot{};
  }

  std::lock_guard<std::mutex> lk(mu_);

  // Classify and attach per-process byte counts
  std::vector<std::string> notes(fetched.size());
  for (size_t i = 0; i < fetched.size(); ++i) {
    auto& c = fetched[i];
    if (auto rule = rules_.match(c)) {
      c.classification = rule->type == RuleType::Blocked ? Classification::Blocked : Classification::Allowed;
      notes[i] = rule->note;
    }
    if (const auto* p = find_bandwidth(bw, c)) {
      c.bytes_in = p->bytes_in;
      c.bytes_out = p->bytes_out;
    }
  }

  std::vector<AlertEvent> raised = alerts_.evaluate_connections(fetched, notes);

  if (measured) {
    current_bw_ = bw;
    history_.push_back(bw);
    while (history_.size() > kHistorySize) history_.pop_front();
    session_in_ += bw.total_bytes_in();
    session_out_ += bw.total_bytes_out();
    for (const auto& p : bw.processes) {
      auto& u = session_usage_[p.process_name];
      u.bytes_in += p.bytes_in;
      u.bytes_out += p.bytes_out;
    }
    auto bw_alerts = alerts_.evaluate_bandwidth(bw);
    raised.insert(raised.end(), std::make_move_iterator(bw_alerts.begin()),
                  std::make_move_iterator(bw_alerts.end()));
  }

  if (procs_ok) top_procs_ = std::move(procs);
  connections_ = std::move(fetched);
  for (const auto& a : raised) log_.add(a);
  last_measured_ = measured;
  last_alerts_ = std::move(raised);
  publish_locked();
}

// Republishes between cycles carry the same cycle number and alerts, so
// consumers keyed on cycle see each alert once
void Monitor::publish_locked() {
  netsentry::model::MonitorSnapshot snap;
  snap.cycle = cycle_count_;
  snap.measured = last_measured_;
  snap.connections = connections_;
  snap.current_bandwidth = current_bw_;
  snap.bandwidth_history.assign(history_.begin(), history_.end());
  snap.session_total_in = session_in_;
  snap.session_total_out = session_out_;
  snap.session_app_usage = session_usage_;
  snap.new_alerts = last_alerts_;
  snap.top_processes = top_procs_;
  buffers_.publish(std::move(snap));
}

void Monitor::reapply_rules_locked() {
  for (auto& c : connections_) c.classification = rules_.classify(c);
}

void Monitor::set_interval(int seconds) {
  interval_s_.store(std::max(seconds, kMinIntervalSeconds), std::memory_order_relaxed);
  {
    std::lock_guard<std::mutex> lk(wait_mu_);
    ++interval_gen_;
  }
  wait_cv_.notify_all();
}

void Monitor::set_alert_settings(const AlertSettings& s) {
  std::lock_guard<std::mutex> lk(mu_);
  alerts_.set_settings(s);
}

void Monitor::add_rule(netsentry::model::ConnectionRule rule) {
  rules_.add(std::move(rule));
  std::lock_guard<std::mutex> lk(mu_);
  reapply_rules_locked();
  publish_locked();
}

bool Monitor::remove_rule(const std::string& id) {
  if (!rules_.remove(id)) return false;
  std::lock_guard<std::mutex> lk(mu_);
  reapply_rules_locked();
  publish_locked();
  return true;
}

void Monitor::trust_process(const std::string& name) {
  add_rule(make_rule(RuleType::Allowed, MatchField::ProcessName, name));
}

void Monitor::trust_address(const std::string& address) {
  add_rule(make_rule(RuleType::Allowed, MatchField::RemoteAddress, address));
}

void Monitor::block_process(const std::string& name) {
  add_rule(make_rule(RuleType::Blocked, MatchField::ProcessName, name));
}

void Monitor::block_address(const std::string& address) {
  add_rule(make_rule(RuleType::Blocked, MatchField::RemoteAddress, address));
}

KillResult Monitor::kill_process(int32_t pid) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    for (const auto& c : connections_) {
      if (c.pid == pid && !c.can_kill) {
        return {false, "Refusing to terminate system process " + c.process_name};
      }
    }
  }

  auto res = killer_.kill_process(pid);
  if (!res.success) return res;

  std::lock_guard<std::mutex> lk(mu_);
  connections_.erase(std::remove_if(connections_.begin(), connections_.end(),
                                    [pid](const Connection& c){ return c.pid == pid; }),
                     connections_.end());
  publish_locked();
  return res;
}

uint64_t Monitor::cycles() const {
  std::lock_guard<std::mutex> lk(mu_);
  return cycle_count_;
}

} // namespace netsentry::app
