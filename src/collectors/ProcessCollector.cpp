#include "collectors/ProcessCollector.hpp"
#include "util/Shell.hpp"

#include <charconv>
#include <sstream>
#include <string>
#include <vector>

namespace netsentry::collectors {

auto parse_ps_output(std::string_view text) -> std::vector<netsentry::model::AppProcess> {
  std::vector<netsentry::model::AppProcess> out;
  std::istringstream ss{std::string(text)};
  std::string line;
  bool header = true;
  while (std::getline(ss, line)) {
    if (header) { header = false; continue; }
    std::istringstream ls(line);
    std::vector<std::string> parts;
    std::string tok;
    while (ls >> tok) parts.push_back(tok);
    if (parts.size() < 3) continue;

    int32_t pid = 0;
    const auto& ps = parts.front();
    auto [ptr, ec] = std::from_chars(ps.data(), ps.data() + ps.size(), pid);
    if (ec != std::errc{}) pid = 0;

    double cpu = 0.0;
    const auto& cs = parts.back();
    auto [cptr, cec] = std::from_chars(cs.data(), cs.data() + cs.size(), cpu);
    if (cec != std::errc{}) cpu = 0.0;
    if (!(cpu > 0.0)) continue;

    // COMM may contain spaces; it spans everything between PID and %CPU
    std::string cmd;
    for (size_t i = 1; i + 1 < parts.size(); ++i) {
      if (!cmd.empty()) cmd += ' ';
      cmd += parts[i];
    }
    auto slash = cmd.rfind('/');
    std::string name = (slash == std::string::npos) ? cmd : cmd.substr(slash + 1);
    if (name.empty()) name = cmd;

    out.push_back(netsentry::model::AppProcess{std::move(name), pid, cpu});
  }
  return out;
}

ProcessCollector::ProcessCollector(std::string ps_exe) : ps_exe_(std::move(ps_exe)) {}

bool ProcessCollector::sample(std::vector<netsentry::model::AppProcess>& out, size_t limit) {
  auto txt = netsentry::util::run_command({ps_exe_, "-Ao", "pid,comm,%cpu", "--sort=-%cpu"});
  if (txt.empty()) { out.clear(); return false; }
  out = parse_ps_output(txt);
  if (out.size() > limit) out.resize(limit);
  return true;
}

} // namespace netsentry::collectors
