#pragma once

#include <string>
#include <string_view>

namespace netsentry::app {

// First port above the IANA dynamic/private range start
inline constexpr int kEphemeralPortThreshold = 49152;

// Port-and-process heuristic; noisy on purpose, user rules override it.
// (a) historically malware-associated port -> suspicious
// (b) numeric port > 49152 from a process not in the known set -> suspicious
[[nodiscard]] bool evaluate_suspicion(std::string_view process_name,
                                      std::string_view remote_port,
                                      std::string_view remote_address);

[[nodiscard]] bool is_suspicious_port(std::string_view port);
[[nodiscard]] bool is_known_process(std::string_view name);
[[nodiscard]] bool is_system_process(std::string_view name);

// False only for OS daemons that must never be terminated from here
[[nodiscard]] bool can_kill(std::string_view name);

// "Secure web (HTTPS)", "DNS lookup", "High port 55555", ...
[[nodiscard]] auto service_label(std::string_view remote_port) -> std::string;

} // namespace netsentry::app
