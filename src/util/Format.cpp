#include "util/Format.hpp"
#include <cstdio>

namespace netsentry::util {

std::string format_bytes(uint64_t bytes) {
  double kb = static_cast<double>(bytes) / 1024.0;
  double mb = kb / 1024.0;
  double gb = mb / 1024.0;
  char buf[64];
  if (gb >= 1.0)      std::snprintf(buf, sizeof(buf), "%.1f GB", gb);
  else if (mb >= 1.0) std::snprintf(buf, sizeof(buf), "%.1f MB", mb);
  else if (kb >= 1.0) std::snprintf(buf, sizeof(buf), "%.0f KB", kb);
  else                std::snprintf(buf, sizeof(buf), "%llu B", static_cast<unsigned long long>(bytes));
  return buf;
}

std::string format_rate(double bytes_per_sec) {
  double kb = bytes_per_sec / 1024.0;
  double mb = kb / 1024.0;
  double gb = mb / 1024.0;
  char buf[64];
  if (gb >= 1.0)      std::snprintf(buf, sizeof(buf), "%.1f GB/s", gb);
  else if (mb >= 1.0) std::snprintf(buf, sizeof(buf), "%.1f MB/s", mb);
  else if (kb >= 1.0) std::snprintf(buf, sizeof(buf), "%.1f KB/s", kb);
  else                std::snprintf(buf, sizeof(buf), "%.0f B/s", bytes_per_sec);
  return buf;
}

std::string pad_trunc(const std::string& s, size_t w) {
  if (s.size() >= w) return s.substr(0, w);
  return s + std::string(w - s.size(), ' ');
}

} // namespace netsentry::util
