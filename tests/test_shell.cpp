#include "minitest.hpp"
#include "util/Shell.hpp"
#include <chrono>

using namespace std::chrono;
using netsentry::util::run_command;
using netsentry::util::run_command_status;

TEST(shell_captures_stdout) {
  ASSERT_EQ(run_command({"echo", "hello world"}), "hello world\n");
}

TEST(shell_arguments_are_not_reparsed) {
  // A shell would expand these; argv passing must not
  ASSERT_EQ(run_command({"echo", "$HOME;", "`id`"}), "$HOME; `id`\n");
}

TEST(shell_nonzero_exit_yields_empty) {
  ASSERT_EQ(run_command({"sh", "-c", "echo partial; exit 3"}), "");
  auto r = run_command_status({"sh", "-c", "echo partial; exit 3"});
  ASSERT_TRUE(r.spawned);
  ASSERT_EQ(r.exit_code, 3);
  ASSERT_EQ(r.out, "partial\n");
}

TEST(shell_stderr_is_discarded) {
  ASSERT_EQ(run_command({"sh", "-c", "echo err 1>&2; echo out"}), "out\n");
}

TEST(shell_missing_binary_yields_empty) {
  ASSERT_EQ(run_command({"netsentry-definitely-not-a-real-tool"}), "");
  auto r = run_command_status({"netsentry-definitely-not-a-real-tool"});
  ASSERT_EQ(r.exit_code, 127);
}

TEST(shell_empty_argv) {
  auto r = run_command_status({});
  ASSERT_TRUE(!r.spawned);
  ASSERT_EQ(run_command({}), "");
}

TEST(shell_timeout_kills_child) {
  auto t0 = steady_clock::now();
  auto r = run_command_status({"sleep", "5"}, milliseconds(200));
  auto elapsed = steady_clock::now() - t0;
  ASSERT_TRUE(r.timed_out);
  ASSERT_TRUE(r.out.empty());
  ASSERT_TRUE(elapsed < seconds(3));
}

TEST(shell_large_output_is_drained) {
  auto out = run_command({"sh", "-c", "i=0; while [ $i -lt 20000 ]; do echo 0123456789; i=$((i+1)); done"},
                         seconds(20));
  ASSERT_EQ(out.size(), 20000u * 11u);
}
