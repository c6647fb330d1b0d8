#pragma once
#include <cstddef>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "model/Connection.hpp"
#include "model/Rule.hpp"

namespace netsentry::app {

// $XDG_DATA_HOME/netsentry/rules.toml, else ~/.local/share/..., else the temp dir
[[nodiscard]] std::filesystem::path default_rules_path();

// Fresh random 8-4-4-4-12 hex identifier
[[nodiscard]] std::string generate_rule_id();

// Stamped with a new id and the current time
[[nodiscard]] netsentry::model::ConnectionRule make_rule(netsentry::model::RuleType type,
                                                         netsentry::model::MatchField field,
                                                         std::string value,
                                                         std::string note = {});

// The connection field a rule compares against
[[nodiscard]] const std::string& field_value(const netsentry::model::Connection& c,
                                             netsentry::model::MatchField field);

// Ordered allow/block rules persisted as TOML. The whole list is rewritten
// after every mutation; first match in list order wins.
class RuleStore {
public:
  explicit RuleStore(std::filesystem::path path = default_rules_path());
  RuleStore(const RuleStore&) = delete;
  RuleStore& operator=(const RuleStore&) = delete;

  // Replaces the in-memory list; any failure leaves it empty
  bool load();
  bool save() const;

  void add(netsentry::model::ConnectionRule rule);
  bool remove(const std::string& id);
  void remove_at(std::vector<size_t> indices);
  void clear();

  // Copy of the first matching rule
  [[nodiscard]] std::optional<netsentry::model::ConnectionRule> match(const netsentry::model::Connection& c) const;
  [[nodiscard]] bool is_allowed(const netsentry::model::Connection& c) const;
  [[nodiscard]] bool is_blocked(const netsentry::model::Connection& c) const;
  [[nodiscard]] netsentry::model::Classification classify(const netsentry::model::Connection& c) const;

  [[nodiscard]] size_t allowed_count() const;
  [[nodiscard]] size_t blocked_count() const;
  [[nodiscard]] std::vector<netsentry::model::ConnectionRule> rules() const;
  [[nodiscard]] const std::filesystem::path& path() const { return path_; }

private:
  bool save_locked() const;
  const netsentry::model::ConnectionRule* match_locked(const netsentry::model::Connection& c) const;

  std::filesystem::path path_;
  mutable std::mutex mu_;
  std::vector<netsentry::model::ConnectionRule> rules_;
};

} // namespace netsentry::app
