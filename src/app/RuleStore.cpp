#include "app/RuleStore.hpp"
#include "util/TomlReader.hpp"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <random>

namespace fs = std::filesystem;
using netsentry::model::Classification;
using netsentry::model::Connection;
using netsentry::model::ConnectionRule;
using netsentry::model::MatchField;
using netsentry::model::RuleType;

namespace netsentry::app {

fs::path default_rules_path() {
  if (const char* xdg = std::getenv("XDG_DATA_HOME"); xdg && *xdg)
    return fs::path(xdg) / "netsentry" / "rules.toml";
  if (const char* home = std::getenv("HOME"); home && *home)
    return fs::path(home) / ".local" / "share" / "netsentry" / "rules.toml";
  std::error_code ec;
  auto tmp = fs::temp_directory_path(ec);
  if (ec) tmp = "/tmp";
  return tmp / "netsentry" / "rules.toml";
}

std::string generate_rule_id() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};
  uint64_t hi = rng();
  uint64_t lo = rng();
  // version 4, variant 10xx
  hi = (hi & 0xFFFFFFFFFFFF0FFFull) | 0x0000000000004000ull;
  lo = (lo & 0x3FFFFFFFFFFFFFFFull) | 0x8000000000000000ull;
  char buf[40];
  std::snprintf(buf, sizeof(buf), "%08llx-%04llx-%04llx-%04llx-%012llx",
                static_cast<unsigned long long>(hi >> 32),
                static_cast<unsigned long long>((hi >> 16) & 0xFFFF),
                static_cast<unsigned long long>(hi & 0xFFFF),
                static_cast<unsigned long long>(lo >> 48),
                static_cast<unsigned long long>(lo & 0xFFFFFFFFFFFFull));
  return buf;
}

ConnectionRule make_rule(RuleType type, MatchField field, std::string value, std::string note) {
  ConnectionRule r;
  r.id = generate_rule_id();
  r.type = type;
  r.field = field;
  r.value = std::move(value);
  r.note = std::move(note);
  r.created_at = std::chrono::duration_cast<std::chrono::seconds>(
      std::chrono::system_clock::now().time_since_epoch()).count();
  return r;
}

const std::string& field_value(const Connection& c, MatchField field) {
  switch (field) {
    case MatchField::RemoteAddress: return c.remote_address;
    case MatchField::RemotePort:    return c.remote_port;
    case MatchField::ProcessName:   break;
  }
  return c.process_name;
}

RuleStore::RuleStore(fs::path path) : path_(std::move(path)) {}

bool RuleStore::load() {
  std::lock_guard<std::mutex> lk(mu_);
  rules_.clear();
  std::error_code ec;
  if (!fs::exists(path_, ec)) return false;

  netsentry::util::TomlReader toml;
  if (!toml.load(path_.string())) {
    std::fprintf(stderr, "netsentry: RuleStore: failed to read %s\n", path_.c_str());
    return false;
  }

  std::vector<ConnectionRule> loaded;
  for (const auto& sec : toml.section_names()) {
    if (sec.rfind("rule.", 0) != 0) continue;
    auto type = netsentry::model::parse_rule_type(toml.get_string(sec, "type"));
    auto field = netsentry::model::parse_match_field(toml.get_string(sec, "field"));
    if (!type || !field || !toml.has(sec, "id") || !toml.has(sec, "value") ||
        toml.get_string(sec, "id").empty()) {
      std::fprintf(stderr, "netsentry: RuleStore: malformed entry [%s] in %s, discarding rules\n",
                   sec.c_str(), path_.c_str());
      return false;
    }
    ConnectionRule r;
    r.id = toml.get_string(sec, "id");
    r.type = *type;
    r.field = *field;
    r.value = toml.get_string(sec, "value");
    r.note = toml.get_string(sec, "note");
    r.created_at = toml.get_int64(sec, "created_at", 0);
    loaded.push_back(std::move(r));
  }
  rules_ = std::move(loaded);
  return true;
}

bool RuleStore::save() const {
  std::lock_guard<std::mutex> lk(mu_);
  return save_locked();
}

bool RuleStore::save_locked() const {
  std::error_code ec;
  if (path_.has_parent_path()) {
    fs::create_directories(path_.parent_path(), ec);
    if (ec) {
      std::fprintf(stderr, "netsentry: RuleStore: failed to create %s: %s\n",
                   path_.parent_path().c_str(), ec.message().c_str());
      return false;
    }
  }

  netsentry::util::TomlReader toml;
  toml.set("", "version", 1LL);
  for (size_t i = 0; i < rules_.size(); ++i) {
    const auto& r = rules_[i];
    std::string sec = "rule." + std::to_string(i);
    toml.set(sec, "id", r.id);
    toml.set(sec, "type", netsentry::model::to_string(r.type));
    toml.set(sec, "field", netsentry::model::to_string(r.field));
    toml.set(sec, "value", r.value);
    toml.set(sec, "note", r.note);
    toml.set(sec, "created_at", static_cast<long long>(r.created_at));
  }

  fs::path tmp = path_;
  tmp += ".tmp";
  if (!toml.save(tmp.string())) {
    std::fprintf(stderr, "netsentry: RuleStore: failed to write %s\n", tmp.c_str());
    fs::remove(tmp, ec);
    return false;
  }
  fs::permissions(tmp, fs::perms::owner_read | fs::perms::owner_write, fs::perm_options::replace, ec);
  if (ec) {
    std::fprintf(stderr, "netsentry: RuleStore: chmod %s: %s\n", tmp.c_str(), ec.message().c_str());
  }
  fs::rename(tmp, path_, ec);
  if (ec) {
    std::fprintf(stderr, "netsentry: RuleStore: rename to %s: %s\n", path_.c_str(), ec.message().c_str());
    fs::remove(tmp, ec);
    return false;
  }
  return true;
}

void RuleStore::add(ConnectionRule rule) {
  std::lock_guard<std::mutex> lk(mu_);
  rules_.push_back(std::move(rule));
  (void)save_locked(); // failure already reported
}

bool RuleStore::remove(const std::string& id) {
  std::lock_guard<std::mutex> lk(mu_);
  auto before = rules_.size();
  rules_.erase(std::remove_if(rules_.begin(), rules_.end(),
                              [&](const ConnectionRule& r){ return r.id == id; }),
               rules_.end());
  if (rules_.size() == before) return false;
  (void)save_locked();
  return true;
}

void RuleStore::remove_at(std::vector<size_t> indices) {
  std::lock_guard<std::mutex> lk(mu_);
  // Erase from the back so earlier indices stay valid
  std::sort(indices.begin(), indices.end());
  indices.erase(std::unique(indices.begin(), indices.end()), indices.end());
  for (auto it = indices.rbegin(); it != indices.rend(); ++it) {
    if (*it < rules_.size()) rules_.erase(rules_.begin() + static_cast<std::ptrdiff_t>(*it));
  }
  (void)save_locked();
}

void RuleStore::clear() {
  std::lock_guard<std::mutex> lk(mu_);
  rules_.clear();
  (void)save_locked();
}

const ConnectionRule* RuleStore::match_locked(const Connection& c) const {
  for (const auto& r : rules_) {
    if (field_value(c, r.field) == r.value) return &r;
  }
  return nullptr;
}

std::optional<ConnectionRule> RuleStore::match(const Connection& c) const {
  std::lock_guard<std::mutex> lk(mu_);
  if (const auto* r = match_locked(c)) return *r;
  return std::nullopt;
}

bool RuleStore::is_allowed(const Connection& c) const {
  std::lock_guard<std::mutex> lk(mu_);
  const auto* r = match_locked(c);
  return r && r->type == RuleType::Allowed;
}

bool RuleStore::is_blocked(const Connection& c) const {
  std::lock_guard<std::mutex> lk(mu_);
  const auto* r = match_locked(c);
  return r && r->type == RuleType::Blocked;
}

Classification RuleStore::classify(const Connection& c) const {
  std::lock_guard<std::mutex> lk(mu_);
  const auto* r = match_locked(c);
  if (!r) return Classification::Unclassified;
  return r->type == RuleType::Blocked ? Classification::Blocked : Classification::Allowed;
}

size_t RuleStore::allowed_count() const {
  std::lock_guard<std::mutex> lk(mu_);
  return static_cast<size_t>(std::count_if(rules_.begin(), rules_.end(),
                                           [](const ConnectionRule& r){ return r.type == RuleType::Allowed; }));
}

size_t RuleStore::blocked_count() const {
  std::lock_guard<std::mutex> lk(mu_);
  return static_cast<size_t>(std::count_if(rules_.begin(), rules_.end(),
                                           [](const ConnectionRule& r){ return r.type == RuleType::Blocked; }));
}

std::vector<ConnectionRule> RuleStore::rules() const {
  std::lock_guard<std::mutex> lk(mu_);
  return rules_;
}

} // namespace netsentry::app
