#include "minitest.hpp"
#include "collectors/BandwidthCollector.hpp"
#include <string>

using netsentry::collectors::parse_bandwidth_output;
using netsentry::collectors::parse_process_field;

static const char* kTwoBlocks =
    "time,bytes_in,bytes_out\n"
    "Safari.1234,1000,500\n"
    "Slack.5678,2000,300\n"
    "\n"
    "time,bytes_in,bytes_out\n"
    "Safari.1234,5000,2000\n"
    "Slack.5678,3000,1000";

TEST(nettop_uses_second_block) {
  auto snap = parse_bandwidth_output(kTwoBlocks, 2.0);
  ASSERT_EQ(snap.processes.size(), 2u);
  ASSERT_EQ(snap.processes[0].process_name, "Safari");
  ASSERT_EQ(snap.processes[0].pid, 1234);
  ASSERT_EQ(snap.processes[0].bytes_in, 5000u);
  ASSERT_EQ(snap.processes[0].bytes_out, 2000u);
  ASSERT_EQ(snap.processes[1].process_name, "Slack");
  ASSERT_EQ(snap.total_bytes_in(), 8000u);
  ASSERT_EQ(snap.total_bytes_out(), 3000u);
  ASSERT_TRUE(snap.rate_in() == 4000.0);
  ASSERT_TRUE(snap.rate_out() == 1500.0);
}

TEST(nettop_single_block_fallback) {
  auto snap = parse_bandwidth_output("time,bytes_in,bytes_out\nSafari.1234,1000,500\n", 2.0);
  ASSERT_EQ(snap.processes.size(), 1u);
  ASSERT_EQ(snap.processes[0].bytes_in, 1000u);
}

TEST(nettop_aggregates_same_name_keeping_first_pid) {
  auto snap = parse_bandwidth_output(
      "hdr\n\n"
      "time,bytes_in,bytes_out\n"
      "Google Chrome Helper.100,10,20\n"
      "Safari.7,1,1\n"
      "Google Chrome Helper.200,30,40\n");
  ASSERT_EQ(snap.processes.size(), 2u);
  ASSERT_EQ(snap.processes[0].process_name, "Google Chrome Helper");
  ASSERT_EQ(snap.processes[0].pid, 100);
  ASSERT_EQ(snap.processes[0].bytes_in, 40u);
  ASSERT_EQ(snap.processes[0].bytes_out, 60u);
  ASSERT_EQ(snap.processes[1].process_name, "Safari");
}

TEST(nettop_skips_zero_rows_and_junk) {
  auto snap = parse_bandwidth_output(
      "x\n\n"
      "Time,bytes_in,bytes_out\n"
      "idle.1,0,0\n"
      "broken line\n"
      "noisy.2,abc,10\n"
      ",5,5\n");
  ASSERT_EQ(snap.processes.size(), 1u);
  ASSERT_EQ(snap.processes[0].process_name, "noisy");
  ASSERT_EQ(snap.processes[0].bytes_in, 0u);
  ASSERT_EQ(snap.processes[0].bytes_out, 10u);
}

TEST(nettop_empty_input) {
  auto snap = parse_bandwidth_output("", 2.0);
  ASSERT_TRUE(snap.empty());
  ASSERT_TRUE(snap.rate_in() == 0.0);
}

TEST(nettop_zero_duration_rates) {
  auto snap = parse_bandwidth_output(kTwoBlocks, 0.0);
  ASSERT_TRUE(snap.rate_in() == 0.0);
  ASSERT_TRUE(snap.processes[0].rate_out(snap.duration_s) == 0.0);
}

TEST(process_field_split) {
  auto a = parse_process_field("com.apple.Safari.1234");
  ASSERT_EQ(a.first, "com.apple.Safari");
  ASSERT_EQ(a.second, 1234);
  auto b = parse_process_field("nodot");
  ASSERT_EQ(b.first, "nodot");
  ASSERT_EQ(b.second, 0);
  auto c = parse_process_field("v1.2.beta");
  ASSERT_EQ(c.first, "v1.2.beta");
  ASSERT_EQ(c.second, 0);
  auto d = parse_process_field("trailing.");
  ASSERT_EQ(d.first, "trailing.");
  ASSERT_EQ(d.second, 0);
}

TEST(top_consumers_ordering) {
  auto snap = parse_bandwidth_output(kTwoBlocks, 2.0);
  auto top = snap.top_consumers(1);
  ASSERT_EQ(top.size(), 1u);
  ASSERT_EQ(top[0].process_name, "Safari");
}
