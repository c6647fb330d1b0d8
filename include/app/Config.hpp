#pragma once

#include <string>
#include "app/Alerts.hpp"

namespace netsentry::app {

inline constexpr int kMinIntervalSeconds = 5;
inline constexpr size_t kHistorySize = 10;

struct ToolConfig {
  std::string lsof{"lsof"};
  std::string nettop{"nettop"};
  std::string ps{"ps"};
};

struct MonitorConfig {
  int interval_s{kMinIntervalSeconds};
  int top_processes{5};
  AlertSettings alerts{};
  std::string rules_path;   // empty = default_rules_path()
  std::string log_dir;      // empty = alert file logging disabled
  ToolConfig tools{};
};

// Environment variable helpers; NETSENTRY_X also matches netsentry_X
const char* getenv_compat(const char* name);
int getenv_int(const char* name, int defv);
bool getenv_flag(const char* name, bool defv);

// $XDG_CONFIG_HOME/netsentry/config.toml, else ~/.config/netsentry/config.toml
std::string config_file_path();

// TOML -> environment -> compiled default. A missing file is not an error.
MonitorConfig load_config(const std::string& path);
MonitorConfig load_config();

} // namespace netsentry::app
