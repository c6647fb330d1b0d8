#include "app/Config.hpp"
#include "util/TomlReader.hpp"
#include <charconv>
#include <cstdlib>
#include <string>

namespace netsentry::app {

const char* getenv_compat(const char* name) {
  const char* v = std::getenv(name);
  if (v && *v) return v;
  std::string alt;
  std::string n(name);
  if (n.rfind("NETSENTRY_", 0) == 0) {
    alt = std::string("netsentry_") + n.substr(10);
  } else if (n.rfind("netsentry_", 0) == 0) {
    alt = std::string("NETSENTRY_") + n.substr(10);
  }
  if (!alt.empty()) {
    v = std::getenv(alt.c_str());
    if (v && *v) return v;
  }
  return nullptr;
}

int getenv_int(const char* name, int defv) {
  const char* v = getenv_compat(name);
  if (!v || !*v) return defv;
  std::string s(v);
  int out = 0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
  if (ec != std::errc{} || ptr != s.data() + s.size()) return defv;
  return out;
}

bool getenv_flag(const char* name, bool defv) {
  const char* v = getenv_compat(name);
  if (!v) return defv;
  if (v[0]=='0'||v[0]=='f'||v[0]=='F'||v[0]=='n'||v[0]=='N') return false;
  return true;
}

std::string config_file_path() {
  if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
    return std::string(xdg) + "/netsentry/config.toml";
  if (const char* home = std::getenv("HOME"); home && *home)
    return std::string(home) + "/.config/netsentry/config.toml";
  return {};
}

// Resolve an int from TOML -> env -> compiled default
static int resolve_int(const netsentry::util::TomlReader& toml, bool have_toml,
                       const char* section, const char* key,
                       const char* env_name, int def) {
  if (have_toml && toml.has(section, key))
    return toml.get_int(section, key, def);
  if (env_name)
    return getenv_int(env_name, def);
  return def;
}

static bool resolve_bool(const netsentry::util::TomlReader& toml, bool have_toml,
                         const char* section, const char* key,
                         const char* env_name, bool def) {
  if (have_toml && toml.has(section, key))
    return toml.get_bool(section, key, def);
  if (env_name)
    return getenv_flag(env_name, def);
  return def;
}

static std::string resolve_string(const netsentry::util::TomlReader& toml, bool have_toml,
                                  const char* section, const char* key,
                                  const char* env_name, const std::string& def) {
  if (have_toml && toml.has(section, key))
    return toml.get_string(section, key, def);
  if (env_name) {
    const char* v = getenv_compat(env_name);
    if (v && *v) return std::string(v);
  }
  return def;
}

MonitorConfig load_config(const std::string& path) {
  netsentry::util::TomlReader toml;
  bool have_toml = !path.empty() && toml.load(path);

  MonitorConfig c;
  c.interval_s = resolve_int(toml, have_toml, "monitor", "interval_s", "NETSENTRY_INTERVAL_S", kMinIntervalSeconds);
  if (c.interval_s < kMinIntervalSeconds) c.interval_s = kMinIntervalSeconds;
  c.top_processes = resolve_int(toml, have_toml, "monitor", "top_processes", "NETSENTRY_TOP_PROCESSES", 5);
  if (c.top_processes < 0) c.top_processes = 0;

  c.alerts.notifications = resolve_bool(toml, have_toml, "alerts", "notifications", "NETSENTRY_NOTIFICATIONS", true);
  c.alerts.notify_suspicious = resolve_bool(toml, have_toml, "alerts", "suspicious", "NETSENTRY_NOTIFY_SUSPICIOUS", true);
  c.alerts.notify_bandwidth = resolve_bool(toml, have_toml, "alerts", "bandwidth", "NETSENTRY_NOTIFY_BANDWIDTH", false);
  c.alerts.bandwidth_threshold_mb = resolve_int(toml, have_toml, "alerts", "bandwidth_threshold_mb",
                                                "NETSENTRY_BANDWIDTH_THRESHOLD_MB", 50);
  if (c.alerts.bandwidth_threshold_mb < 1) c.alerts.bandwidth_threshold_mb = 1;

  c.rules_path = resolve_string(toml, have_toml, "rules", "path", "NETSENTRY_RULES_PATH", "");
  c.log_dir = resolve_string(toml, have_toml, "log", "dir", "NETSENTRY_LOG_DIR", "");

  c.tools.lsof = resolve_string(toml, have_toml, "tools", "lsof", nullptr, "lsof");
  c.tools.nettop = resolve_string(toml, have_toml, "tools", "nettop", nullptr, "nettop");
  c.tools.ps = resolve_string(toml, have_toml, "tools", "ps", nullptr, "ps");
  return c;
}

MonitorConfig load_config() {
  return load_config(config_file_path());
}

} // namespace netsentry::app
