#include "app/Config.hpp"
#include "app/Heuristics.hpp"
#include "app/LogWriter.hpp"
#include "app/Monitor.hpp"
#include "app/RuleStore.hpp"
#include "app/SnapshotBuffers.hpp"
#include "model/Snapshot.hpp"
#include "util/Format.hpp"

#include <atomic>
#include <charconv>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <ctime>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

using namespace std::chrono_literals;
using netsentry::util::format_bytes;
using netsentry::util::format_rate;
using netsentry::util::pad_trunc;

static std::atomic<bool> g_stop{false};
static void on_sigint(int) { g_stop.store(true); }

static bool parse_int_arg(const char* s, int& out) {
  std::string v(s);
  auto [ptr, ec] = std::from_chars(v.data(), v.data() + v.size(), out);
  return ec == std::errc{} && ptr == v.data() + v.size();
}

static void print_usage() {
  std::cout << "Usage: netsentry [--once] [--iterations N] [--interval S] [--list-rules]\n"
               "                 [--trust-process NAME] [--block-process NAME]\n"
               "                 [--trust-address ADDR] [--block-address ADDR]\n"
               "                 [--remove-rule ID] [--kill PID]\n"
               "Notes: runs until Ctrl+C by default. Config: " << netsentry::app::config_file_path() << "\n";
}

static void print_rules(const netsentry::app::RuleStore& store) {
  auto rules = store.rules();
  std::cout << "Rules (" << store.path().string() << "): "
            << store.allowed_count() << " allowed, " << store.blocked_count() << " blocked\n";
  for (const auto& r : rules) {
    std::cout << "  " << r.id << "  " << pad_trunc(netsentry::model::to_string(r.type), 8)
              << pad_trunc(netsentry::model::label(r.field), 16) << r.value;
    if (!r.note.empty()) std::cout << "  # " << r.note;
    std::cout << "\n";
  }
}

static const char* marker(const netsentry::model::Connection& c) {
  switch (c.classification) {
    case netsentry::model::Classification::Blocked: return "BLOCK";
    case netsentry::model::Classification::Allowed: return "trust";
    case netsentry::model::Classification::Unclassified: break;
  }
  return c.heuristic_suspicious ? "SUSP " : "     ";
}

static void print_connections(const netsentry::model::MonitorSnapshot& s) {
  std::cout << pad_trunc("", 6) << pad_trunc("PROCESS", 22) << pad_trunc("PID", 8)
            << pad_trunc("REMOTE", 42) << pad_trunc("PROTO", 6) << pad_trunc("SERVICE", 22) << "BYTES\n";
  for (const auto& c : s.sorted_connections()) {
    std::string remote = c.remote_address + ":" + c.remote_port;
    std::string bytes = c.bytes_in ? format_bytes(*c.bytes_in) + " in / " + format_bytes(c.bytes_out.value_or(0)) + " out" : "-";
    std::cout << pad_trunc(marker(c), 6) << pad_trunc(c.process_name, 22)
              << pad_trunc(std::to_string(c.pid), 8) << pad_trunc(remote, 42)
              << pad_trunc(c.protocol, 6) << pad_trunc(netsentry::app::service_label(c.remote_port), 22)
              << bytes << "\n";
  }
}

static void print_summary(const netsentry::model::MonitorSnapshot& s) {
  auto now_t = std::time(nullptr);
  std::tm tm{};
  ::localtime_r(&now_t, &tm);
  char ts[16];
  std::strftime(ts, sizeof(ts), "%H:%M:%S", &tm);
  std::cout << ts << " cycle " << s.cycle << ": " << s.connections.size() << " connections, "
            << s.suspicious_count() << " suspicious, " << s.trusted_count() << " trusted";
  if (!s.current_bandwidth.empty()) {
    std::cout << " | down " << format_rate(s.current_bandwidth.rate_in())
              << " up " << format_rate(s.current_bandwidth.rate_out());
  }
  std::cout << " | session " << format_bytes(s.session_total_in) << " in / "
            << format_bytes(s.session_total_out) << " out";
  if (!s.top_processes.empty()) {
    const auto& p = s.top_processes.front();
    char cpu[16];
    std::snprintf(cpu, sizeof(cpu), "%.1f%%", p.cpu_pct);
    std::cout << " | top " << p.name << " " << cpu;
  }
  std::cout << "\n";
}

static void print_alerts(const netsentry::model::MonitorSnapshot& s) {
  for (const auto& a : s.new_alerts) {
    std::cout << "  [" << netsentry::model::to_string(a.kind) << "] " << a.title << ": " << a.reason << "\n";
  }
}

int main(int argc, char** argv) {
  std::signal(SIGINT, on_sigint);
  std::signal(SIGTERM, on_sigint);

  auto cfg = netsentry::app::load_config();
  int iterations = 0; // 0 or less => run until Ctrl+C
  bool once = false;
  bool list_rules = false;
  int kill_pid = 0;
  std::string trust_process, block_process, trust_address, block_address, remove_id;

  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    bool has_val = i + 1 < argc;
    if (a == "--once") once = true;
    else if (a == "--list-rules") list_rules = true;
    else if (a == "--iterations" && has_val) {
      if (!parse_int_arg(argv[++i], iterations)) { std::cerr << "netsentry: invalid --iterations\n"; return 2; }
    } else if (a == "--interval" && has_val) {
      if (!parse_int_arg(argv[++i], cfg.interval_s)) { std::cerr << "netsentry: invalid --interval\n"; return 2; }
    } else if (a == "--kill" && has_val) {
      if (!parse_int_arg(argv[++i], kill_pid)) { std::cerr << "netsentry: invalid --kill\n"; return 2; }
    }
    else if (a == "--trust-process" && has_val) trust_process = argv[++i];
    else if (a == "--block-process" && has_val) block_process = argv[++i];
    else if (a == "--trust-address" && has_val) trust_address = argv[++i];
    else if (a == "--block-address" && has_val) block_address = argv[++i];
    else if (a == "--remove-rule" && has_val) remove_id = argv[++i];
    else if (a == "-h" || a == "--help") { print_usage(); return 0; }
    else {
      std::cerr << "netsentry: unknown or incomplete option " << a << "\n";
      print_usage();
      return 2;
    }
  }

  netsentry::app::RuleStore store(cfg.rules_path.empty() ? netsentry::app::default_rules_path()
                                                         : std::filesystem::path(cfg.rules_path));
  (void)store.load(); // missing or unreadable file means no rules

  netsentry::app::SnapshotBuffers buffers;
  netsentry::app::Monitor monitor(buffers, store, cfg);

  // Rule edits and kills are one-shot commands
  bool did_command = false;
  if (!trust_process.empty()) { monitor.trust_process(trust_process); did_command = true; }
  if (!block_process.empty()) { monitor.block_process(block_process); did_command = true; }
  if (!trust_address.empty()) { monitor.trust_address(trust_address); did_command = true; }
  if (!block_address.empty()) { monitor.block_address(block_address); did_command = true; }
  if (!remove_id.empty()) {
    if (!monitor.remove_rule(remove_id)) {
      std::cerr << "netsentry: no rule with id " << remove_id << "\n";
      return 1;
    }
    did_command = true;
  }
  if (kill_pid != 0) {
    // Populate the connection list so unkillable system daemons are recognized
    monitor.run_cycle();
    auto res = monitor.kill_process(kill_pid);
    std::cout << res.message << "\n";
    if (!res.success) return 1;
    did_command = true;
  }
  if (list_rules) { print_rules(store); return 0; }
  if (did_command) { print_rules(store); return 0; }

  if (once) {
    monitor.run_cycle();
    auto s = buffers.front();
    print_connections(*s);
    print_summary(*s);
    print_alerts(*s);
    return 0;
  }

  std::unique_ptr<netsentry::app::LogWriter> log_writer;
  if (!cfg.log_dir.empty()) {
    log_writer = std::make_unique<netsentry::app::LogWriter>(buffers, cfg.log_dir);
    log_writer->start();
  }

  monitor.start();
  uint64_t last_cycle = 0;
  int printed = 0;
  while (!g_stop.load() && (iterations <= 0 || printed < iterations)) {
    auto s = buffers.front();
    if (s->seq != 0 && s->cycle != last_cycle) {
      last_cycle = s->cycle;
      print_summary(*s);
      print_alerts(*s);
      std::cout.flush();
      ++printed;
    }
    std::this_thread::sleep_for(100ms);
  }
  monitor.stop();
  if (log_writer) log_writer->stop();
  return 0;
}
