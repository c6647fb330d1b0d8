#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace netsentry::model {

enum class RuleType { Allowed, Blocked };
enum class MatchField { ProcessName, RemoteAddress, RemotePort };

struct ConnectionRule {
  std::string id;          // 8-4-4-4-12 hex
  RuleType type{RuleType::Allowed};
  MatchField field{MatchField::ProcessName};
  std::string value;       // exact match, no normalization
  std::string note;        // empty = no note
  int64_t created_at{};    // unix seconds

  bool operator==(const ConnectionRule&) const = default;
};

// Persisted names ("allowed", "processName", ...)
[[nodiscard]] inline const char* to_string(RuleType t) {
  return t == RuleType::Blocked ? "blocked" : "allowed";
}

[[nodiscard]] inline const char* to_string(MatchField f) {
  switch (f) {
    case MatchField::RemoteAddress: return "remoteAddress";
    case MatchField::RemotePort:    return "remotePort";
    case MatchField::ProcessName:   break;
  }
  return "processName";
}

[[nodiscard]] inline const char* label(MatchField f) {
  switch (f) {
    case MatchField::RemoteAddress: return "Remote Address";
    case MatchField::RemotePort:    return "Port";
    case MatchField::ProcessName:   break;
  }
  return "Process Name";
}

[[nodiscard]] inline std::optional<RuleType> parse_rule_type(std::string_view s) {
  if (s == "allowed") return RuleType::Allowed;
  if (s == "blocked") return RuleType::Blocked;
  return std::nullopt;
}

[[nodiscard]] inline std::optional<MatchField> parse_match_field(std::string_view s) {
  if (s == "processName")   return MatchField::ProcessName;
  if (s == "remoteAddress") return MatchField::RemoteAddress;
  if (s == "remotePort")    return MatchField::RemotePort;
  return std::nullopt;
}

} // namespace netsentry::model
