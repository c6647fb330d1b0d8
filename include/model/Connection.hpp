#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace netsentry::model {

// User classification from the rule store. Unclassified defers to the heuristic.
enum class Classification { Unclassified, Allowed, Blocked };

struct Connection {
  std::string process_name;   // may be empty if unresolved
  int32_t pid{};              // 0 = unknown
  std::string remote_address; // IPv4, bracket-stripped IPv6, or "*"
  std::string remote_port;    // numeric, "*", or "?"
  std::string protocol;       // TCP|UDP
  std::string state;          // ESTABLISHED, CLOSE_WAIT, ... or UNKNOWN
  bool heuristic_suspicious{false};
  Classification classification{Classification::Unclassified};
  // Per-interval byte counters, set only when a bandwidth record matched
  std::optional<uint64_t> bytes_in;
  std::optional<uint64_t> bytes_out;
  bool can_kill{true};

  [[nodiscard]] bool is_suspicious() const {
    switch (classification) {
      case Classification::Blocked: return true;
      case Classification::Allowed: return false;
      case Classification::Unclassified: break;
    }
    return heuristic_suspicious;
  }

  // Blocked first, then suspicious, then normal, then trusted
  [[nodiscard]] int sort_priority() const {
    switch (classification) {
      case Classification::Blocked: return 0;
      case Classification::Allowed: return 3;
      case Classification::Unclassified: break;
    }
    return heuristic_suspicious ? 1 : 2;
  }
};

[[nodiscard]] inline const char* to_string(Classification c) {
  switch (c) {
    case Classification::Allowed: return "allowed";
    case Classification::Blocked: return "blocked";
    case Classification::Unclassified: break;
  }
  return "unclassified";
}

} // namespace netsentry::model
