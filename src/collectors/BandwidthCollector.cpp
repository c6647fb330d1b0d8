#include "collectors/BandwidthCollector.hpp"
#include "util/Shell.hpp"

#include <cctype>
#include <charconv>
#include <unordered_map>
#include <vector>

using namespace std::chrono;

namespace netsentry::collectors {

static std::string_view trim(std::string_view sv) {
  while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front()))) sv.remove_prefix(1);
  while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back()))) sv.remove_suffix(1);
  return sv;
}

static uint64_t parse_u64_or_zero(std::string_view sv) {
  sv = trim(sv);
  uint64_t v = 0;
  auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), v);
  if (ec != std::errc{} || ptr != sv.data() + sv.size()) return 0;
  return v;
}

static bool contains_time_ci(std::string_view sv) {
  static constexpr std::string_view needle = "time";
  if (sv.size() < needle.size()) return false;
  for (size_t i = 0; i + needle.size() <= sv.size(); ++i) {
    size_t k = 0;
    while (k < needle.size() &&
           std::tolower(static_cast<unsigned char>(sv[i + k])) == needle[k]) ++k;
    if (k == needle.size()) return true;
  }
  return false;
}

static std::vector<std::string_view> split(std::string_view s, std::string_view sep) {
  std::vector<std::string_view> out;
  size_t pos = 0;
  for (;;) {
    size_t next = s.find(sep, pos);
    if (next == std::string_view::npos) { out.push_back(s.substr(pos)); break; }
    out.push_back(s.substr(pos, next - pos));
    pos = next + sep.size();
  }
  return out;
}

auto parse_process_field(std::string_view field) -> std::pair<std::string, int32_t> {
  auto dot = field.rfind('.');
  if (dot == std::string_view::npos) return {std::string(field), 0};
  std::string_view pid_str = field.substr(dot + 1);
  int32_t pid = 0;
  auto [ptr, ec] = std::from_chars(pid_str.data(), pid_str.data() + pid_str.size(), pid);
  if (!pid_str.empty() && ec == std::errc{} && ptr == pid_str.data() + pid_str.size()) {
    return {std::string(field.substr(0, dot)), pid};
  }
  return {std::string(field), 0};
}

auto parse_bandwidth_output(std::string_view text, double duration_s) -> netsentry::model::BandwidthSnapshot {
  netsentry::model::BandwidthSnapshot snap;
  snap.timestamp = system_clock::now();
  snap.duration_s = duration_s;

  auto blocks = split(text, "\n\n");
  std::string_view target = blocks.size() >= 2 ? blocks[1] : blocks[0];

  // Aggregate by name; first-seen order is kept for stable output.
  std::unordered_map<std::string, size_t> index;
  for (auto line : split(target, "\n")) {
    if (line.empty()) continue;
    auto cols = split(line, ",");
    if (cols.size() < 3) continue;

    std::string_view field = trim(cols[0]);
    if (field.empty() || contains_time_ci(field)) continue;

    auto [name, pid] = parse_process_field(field);
    if (name.empty()) continue;

    uint64_t in = parse_u64_or_zero(cols[1]);
    uint64_t out = parse_u64_or_zero(cols[2]);
    if (in == 0 && out == 0) continue;

    auto it = index.find(name);
    if (it != index.end()) {
      auto& p = snap.processes[it->second];
      p.bytes_in += in;
      p.bytes_out += out;
    } else {
      index.emplace(name, snap.processes.size());
      snap.processes.push_back(netsentry::model::ProcessBandwidth{std::move(name), pid, in, out});
    }
  }
  return snap;
}

BandwidthCollector::BandwidthCollector(std::string nettop_exe) : nettop_exe_(std::move(nettop_exe)) {}

bool BandwidthCollector::sample(netsentry::model::BandwidthSnapshot& out) {
  auto start = steady_clock::now();
  auto txt = netsentry::util::run_command(
      {nettop_exe_, "-P", "-d", "-L", "2", "-J", "bytes_in,bytes_out", "-t", "external", "-c"},
      kBandwidthTimeout);
  double elapsed_s = duration_cast<duration<double>>(steady_clock::now() - start).count();
  if (txt.empty()) {
    out = netsentry::model::BandwidthSnapshot{};
    return false;
  }
  out = parse_bandwidth_output(txt, elapsed_s);
  return true;
}

} // namespace netsentry::collectors
