#include "minitest.hpp"
#include "app/Heuristics.hpp"

using namespace netsentry::app;

TEST(malware_ports_always_suspicious) {
  for (const char* port : {"4444", "5555", "6666", "1337", "31337", "8888"}) {
    ASSERT_TRUE(evaluate_suspicion("Safari", port, "203.0.113.1"));
  }
}

TEST(high_port_depends_on_process) {
  ASSERT_TRUE(evaluate_suspicion("unknown_tool", "49153", "203.0.113.1"));
  ASSERT_TRUE(!evaluate_suspicion("unknown_tool", "49152", "203.0.113.1"));
  ASSERT_TRUE(!evaluate_suspicion("Slack", "60000", "203.0.113.1"));
  ASSERT_TRUE(!evaluate_suspicion("mDNSResponder", "60000", "203.0.113.1"));
}

TEST(non_numeric_ports_are_not_high) {
  ASSERT_TRUE(!evaluate_suspicion("unknown_tool", "*", "*"));
  ASSERT_TRUE(!evaluate_suspicion("unknown_tool", "?", "host"));
  ASSERT_TRUE(!evaluate_suspicion("unknown_tool", "60000x", "host"));
  ASSERT_TRUE(!evaluate_suspicion("unknown_tool", "443", "host"));
}

TEST(known_and_system_sets_are_exact) {
  ASSERT_TRUE(is_known_process("Safari"));
  ASSERT_TRUE(is_known_process("kernel_task"));
  ASSERT_TRUE(!is_known_process("safari"));
  ASSERT_TRUE(!is_known_process("Safari "));
  ASSERT_TRUE(is_system_process("launchd"));
  ASSERT_TRUE(!is_system_process("Safari"));
}

TEST(can_kill_excludes_system_daemons) {
  ASSERT_TRUE(!can_kill("launchd"));
  ASSERT_TRUE(!can_kill("WindowServer"));
  ASSERT_TRUE(can_kill("Safari"));
  ASSERT_TRUE(can_kill("evil_app"));
}

TEST(service_labels) {
  ASSERT_EQ(service_label("443"), "Secure web (HTTPS)");
  ASSERT_EQ(service_label("53"), "DNS lookup");
  ASSERT_EQ(service_label("*"), "Listening");
  ASSERT_EQ(service_label("55555"), "High port 55555");
  ASSERT_EQ(service_label("3306"), "Port 3306");
}
