#include "minitest.hpp"
#include "app/ProcessKiller.hpp"
#include <csignal>
#include <filesystem>
#include <fstream>
#include <string>
#include <sys/wait.h>
#include <unistd.h>

namespace fs = std::filesystem;
using netsentry::app::ProcessKiller;

// Stand-in for ps answering "-p PID -o user=" and "-o comm=" with fixed values
static fs::path fake_ps(const char* suffix, const std::string& owner, const std::string& comm) {
  auto dir = fs::temp_directory_path() /
             ("netsentry_killer_test_" + std::to_string(::getpid()) + "_" + suffix);
  fs::remove_all(dir);
  fs::create_directories(dir);
  auto path = dir / "ps";
  std::ofstream(path) << "#!/bin/sh\n"
                         "case \"$4\" in\n"
                         "  user=) echo " << owner << " ;;\n"
                         "  comm=) echo " << comm << " ;;\n"
                         "esac\n";
  fs::permissions(path, fs::perms::owner_all);
  return path;
}

TEST(killer_rejects_init_and_invalid_pids) {
  ProcessKiller k;
  ASSERT_TRUE(!k.kill_process(1).success);
  ASSERT_TRUE(!k.kill_process(0).success);
  ASSERT_TRUE(!k.kill_process(-5).success);
}

TEST(killer_rejects_unknown_owner) {
  // No ps binary by this name: owner cannot be determined
  ProcessKiller k("netsentry-no-such-ps");
  auto r = k.kill_process(static_cast<int32_t>(::getpid()));
  ASSERT_TRUE(!r.success);
  ASSERT_TRUE(!r.message.empty());
}

TEST(killer_terminates_own_child) {
  pid_t child = ::fork();
  ASSERT_TRUE(child >= 0);
  if (child == 0) {
    ::pause();
    ::_exit(0);
  }
  ProcessKiller k;
  auto owner = k.process_owner(child);
  auto r = k.kill_process(child);
  if (owner == "root") {
    // Running as root: the policy refuses and the child must be cleaned up here
    ASSERT_TRUE(!r.success);
    ::kill(child, SIGKILL);
    int status = 0;
    ::waitpid(child, &status, 0);
    return;
  }
  int status = 0;
  ::waitpid(child, &status, 0);
  if (owner.empty()) {
    ASSERT_TRUE(!r.success);
    return;
  }
  ASSERT_TRUE(r.success);
  ASSERT_TRUE(WIFSIGNALED(status));
  ASSERT_EQ(WTERMSIG(status), SIGTERM);
}

TEST(killer_refuses_system_daemon_without_connections) {
  auto ps = fake_ps("daemon", "someone", "/usr/libexec/rapportd");
  ProcessKiller k(ps.string());
  ASSERT_EQ(k.process_name(static_cast<int32_t>(::getpid())), "rapportd");
  auto r = k.kill_process(static_cast<int32_t>(::getpid()));
  ASSERT_TRUE(!r.success);
  ASSERT_TRUE(r.message.find("rapportd") != std::string::npos);
  fs::remove_all(ps.parent_path());
}

TEST(killer_signals_ordinary_user_process) {
  auto ps = fake_ps("worker", "someone", "/opt/tools/worker");
  pid_t child = ::fork();
  ASSERT_TRUE(child >= 0);
  if (child == 0) {
    ::pause();
    ::_exit(0);
  }
  ProcessKiller k(ps.string());
  auto r = k.kill_process(child);
  if (!r.success) ::kill(child, SIGKILL);
  int status = 0;
  ::waitpid(child, &status, 0);
  fs::remove_all(ps.parent_path());
  ASSERT_TRUE(r.success);
  ASSERT_TRUE(WIFSIGNALED(status));
  ASSERT_EQ(WTERMSIG(status), SIGTERM);
}
