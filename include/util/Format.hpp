#pragma once

#include <cstdint>
#include <string>

namespace netsentry::util {

// "512 B", "3 KB", "1.5 MB", "2.0 GB"
[[nodiscard]] std::string format_bytes(uint64_t bytes);

// "800 B/s", "1.2 KB/s", "3.4 MB/s"
[[nodiscard]] std::string format_rate(double bytes_per_sec);

// Right-pad or truncate to exactly w bytes (ASCII table columns)
[[nodiscard]] std::string pad_trunc(const std::string& s, size_t w);

} // namespace netsentry::util
