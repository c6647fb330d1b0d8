#include "minitest.hpp"
#include "app/Alerts.hpp"
#include <string>
#include <vector>

using netsentry::app::AlertEngine;
using netsentry::app::AlertLog;
using netsentry::app::AlertSettings;
using netsentry::model::AlertKind;
using netsentry::model::BandwidthSnapshot;
using netsentry::model::Classification;
using netsentry::model::Connection;

static Connection make_conn(const std::string& name, int32_t pid, Classification cls, bool heuristic) {
  Connection c;
  c.process_name = name;
  c.pid = pid;
  c.remote_address = "203.0.113.5";
  c.remote_port = "443";
  c.classification = cls;
  c.heuristic_suspicious = heuristic;
  return c;
}

static BandwidthSnapshot bw_of(const std::string& name, uint64_t in, uint64_t out, double duration = 2.0) {
  BandwidthSnapshot s;
  s.duration_s = duration;
  s.processes.push_back({name, 10, in, out});
  return s;
}

TEST(blocked_connection_alerts_once_with_note) {
  AlertEngine eng;
  std::vector<Connection> conns{make_conn("evil", 42, Classification::Blocked, false)};
  auto a1 = eng.evaluate_connections(conns, {"known exfil host"});
  ASSERT_EQ(a1.size(), 1u);
  ASSERT_TRUE(a1[0].kind == AlertKind::Suspicious);
  ASSERT_EQ(a1[0].title, "Suspicious Connections");
  ASSERT_EQ(a1[0].reason, "Blocked connection from evil: known exfil host");
  ASSERT_EQ(a1[0].subject, "evil");
  // Same pid next cycle: no repeat
  ASSERT_TRUE(eng.evaluate_connections(conns, {"known exfil host"}).empty());
}

TEST(blocked_connection_without_note) {
  AlertEngine eng;
  std::vector<Connection> conns{make_conn("evil", 42, Classification::Blocked, false)};
  auto a = eng.evaluate_connections(conns, {});
  ASSERT_EQ(a.size(), 1u);
  ASSERT_EQ(a[0].reason, "Blocked connection detected from evil.");
}

TEST(suspicious_connections_aggregate) {
  AlertEngine eng;
  std::vector<Connection> conns{
    make_conn("a", 1, Classification::Unclassified, true),
    make_conn("b", 2, Classification::Unclassified, true),
    make_conn("c", 3, Classification::Allowed, true),
    make_conn("d", 4, Classification::Unclassified, false),
  };
  auto a = eng.evaluate_connections(conns, {});
  ASSERT_EQ(a.size(), 1u);
  ASSERT_EQ(a[0].reason, "2 suspicious outbound connection(s) detected.");
  ASSERT_TRUE(a[0].subject.empty());
}

TEST(pid_reappearing_after_gap_alerts_again) {
  AlertEngine eng;
  std::vector<Connection> present{make_conn("x", 7, Classification::Unclassified, true)};
  std::vector<Connection> gone;
  ASSERT_EQ(eng.evaluate_connections(present, {}).size(), 1u);
  ASSERT_TRUE(eng.evaluate_connections(gone, {}).empty());
  ASSERT_EQ(eng.known_pid_count(), 0u);
  ASSERT_EQ(eng.evaluate_connections(present, {}).size(), 1u);
}

TEST(suppressed_alerts_still_track_pids) {
  AlertSettings s;
  s.notify_suspicious = false;
  AlertEngine eng(s);
  std::vector<Connection> conns{make_conn("x", 7, Classification::Blocked, false)};
  ASSERT_TRUE(eng.evaluate_connections(conns, {}).empty());
  s.notify_suspicious = true;
  eng.set_settings(s);
  ASSERT_TRUE(eng.evaluate_connections(conns, {}).empty());
}

TEST(bandwidth_hysteresis) {
  AlertSettings s;
  s.notify_bandwidth = true;
  s.bandwidth_threshold_mb = 1;
  AlertEngine eng(s);
  const uint64_t mb = 1024ull * 1024ull;

  auto a = eng.evaluate_bandwidth(bw_of("uploader", mb, mb));
  ASSERT_EQ(a.size(), 1u);
  ASSERT_TRUE(a[0].kind == AlertKind::Bandwidth);
  ASSERT_EQ(a[0].title, "High Bandwidth");
  ASSERT_EQ(a[0].reason, "uploader is using 1.0 MB/s.");
  ASSERT_TRUE(eng.bandwidth_alerted("uploader"));

  // Still above: nothing new
  ASSERT_TRUE(eng.evaluate_bandwidth(bw_of("uploader", 3 * mb, 0)).empty());
  // Absent from the snapshot: mark kept
  ASSERT_TRUE(eng.evaluate_bandwidth(bw_of("other", 1, 1)).empty());
  ASSERT_TRUE(eng.bandwidth_alerted("uploader"));
  // Exactly at the threshold re-arms
  ASSERT_TRUE(eng.evaluate_bandwidth(bw_of("uploader", mb, 0)).empty());
  ASSERT_TRUE(!eng.bandwidth_alerted("uploader"));
  ASSERT_EQ(eng.evaluate_bandwidth(bw_of("uploader", 2 * mb, 0)).size(), 1u);
}

TEST(bandwidth_alert_without_duration_uses_bytes) {
  AlertSettings s;
  s.notify_bandwidth = true;
  s.bandwidth_threshold_mb = 1;
  AlertEngine eng(s);
  auto a = eng.evaluate_bandwidth(bw_of("bulk", 3 * 1024ull * 1024ull, 0, 0.0));
  ASSERT_EQ(a.size(), 1u);
  ASSERT_EQ(a[0].reason, "bulk is using 3.0 MB.");
}

TEST(bandwidth_alerts_off_by_default) {
  AlertEngine eng;
  ASSERT_TRUE(eng.evaluate_bandwidth(bw_of("huge", 500ull * 1024 * 1024, 0)).empty());
  // De-dup state still advanced
  ASSERT_TRUE(eng.bandwidth_alerted("huge"));
}

TEST(alert_log_is_bounded_newest_first) {
  AlertLog log;
  ASSERT_TRUE(log.empty());
  for (int i = 0; i < 60; ++i) {
    netsentry::model::AlertEvent e;
    e.reason = std::to_string(i);
    log.add(e);
  }
  ASSERT_EQ(log.size(), AlertLog::kMaxEntries);
  auto entries = log.entries();
  ASSERT_EQ(entries.front().reason, "59");
  ASSERT_EQ(entries.back().reason, "10");
  log.clear();
  ASSERT_TRUE(log.empty());
}
