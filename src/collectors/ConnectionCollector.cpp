#include "collectors/ConnectionCollector.hpp"
#include "app/Heuristics.hpp"
#include "util/Shell.hpp"

#include <cctype>
#include <charconv>

namespace netsentry::collectors {

static std::vector<std::string_view> split_ws(std::string_view line) {
  std::vector<std::string_view> parts;
  size_t i = 0;
  while (i < line.size()) {
    while (i < line.size() && std::isspace(static_cast<unsigned char>(line[i]))) ++i;
    size_t start = i;
    while (i < line.size() && !std::isspace(static_cast<unsigned char>(line[i]))) ++i;
    if (i > start) parts.push_back(line.substr(start, i - start));
  }
  return parts;
}

static int hex_val(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

auto unescape_process_name(std::string_view name) -> std::string {
  if (name.find("\\x") == std::string_view::npos) return std::string(name);
  std::string out;
  out.reserve(name.size());
  size_t i = 0;
  while (i < name.size()) {
    if (name[i] == '\\' && i + 3 < name.size() && name[i + 1] == 'x') {
      int hi = hex_val(name[i + 2]);
      int lo = hex_val(name[i + 3]);
      if (hi >= 0 && lo >= 0) {
        out.push_back(static_cast<char>(hi * 16 + lo));
        i += 4;
        continue;
      }
    }
    out.push_back(name[i]);
    ++i;
  }
  return out;
}

auto split_endpoint(std::string_view field) -> Endpoint {
  std::string_view remote = field;
  auto arrow = field.rfind("->");
  if (arrow != std::string_view::npos) remote = field.substr(arrow + 2);

  auto colon = remote.rfind(':');
  if (colon == std::string_view::npos) return Endpoint{std::string(remote), "?"};

  std::string_view addr = remote.substr(0, colon);
  std::string_view port = remote.substr(colon + 1);
  if (addr.size() >= 2 && addr.front() == '[' && addr.back() == ']') {
    addr = addr.substr(1, addr.size() - 2);
  }
  return Endpoint{std::string(addr), std::string(port)};
}

auto parse_connection_list(std::string_view text) -> std::vector<netsentry::model::Connection> {
  std::vector<netsentry::model::Connection> out;
  size_t pos = 0;
  while (pos < text.size()) {
    size_t nl = text.find('\n', pos);
    std::string_view line = text.substr(pos, nl == std::string_view::npos ? std::string_view::npos : nl - pos);
    pos = (nl == std::string_view::npos) ? text.size() : nl + 1;
    if (line.empty()) continue;

    auto parts = split_ws(line);
    if (parts.size() < kLsofMinColumns) continue;

    netsentry::model::Connection c;
    c.process_name = unescape_process_name(parts[0]);

    int32_t pid = 0;
    auto [ptr, ec] = std::from_chars(parts[1].data(), parts[1].data() + parts[1].size(), pid);
    c.pid = (ec == std::errc{} && ptr == parts[1].data() + parts[1].size() && pid >= 0) ? pid : 0;

    std::string node(parts[kLsofNodeColumn]);
    for (auto& ch : node) ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
    c.protocol = node.find("TCP") != std::string::npos ? "TCP" : "UDP";

    std::string_view last = parts.back();
    bool has_state = last.size() >= 2 && last.front() == '(' && last.back() == ')';
    c.state = has_state ? std::string(last.substr(1, last.size() - 2)) : std::string("UNKNOWN");

    // Column drift: with a "(STATE)" suffix the endpoint precedes it; otherwise NAME is fixed.
    std::string_view conn_field;
    if (parts.size() >= kLsofMinColumns + 1 && last.front() == '(') {
      conn_field = parts[parts.size() - 2];
    } else {
      conn_field = parts[kLsofNameColumn];
    }
    auto ep = split_endpoint(conn_field);
    c.remote_address = std::move(ep.address);
    c.remote_port = std::move(ep.port);

    c.heuristic_suspicious = netsentry::app::evaluate_suspicion(c.process_name, c.remote_port, c.remote_address);
    c.can_kill = netsentry::app::can_kill(c.process_name);
    out.push_back(std::move(c));
  }
  return out;
}

auto filter_established(std::string_view text) -> std::string {
  std::string out;
  size_t pos = 0;
  while (pos < text.size()) {
    size_t nl = text.find('\n', pos);
    std::string_view line = text.substr(pos, nl == std::string_view::npos ? std::string_view::npos : nl - pos);
    pos = (nl == std::string_view::npos) ? text.size() : nl + 1;
    if (line.find("ESTABLISHED") == std::string_view::npos) continue;
    out.append(line);
    out.push_back('\n');
  }
  return out;
}

ConnectionCollector::ConnectionCollector(std::string lsof_exe) : lsof_exe_(std::move(lsof_exe)) {}

bool ConnectionCollector::sample(std::vector<netsentry::model::Connection>& out) {
  auto txt = netsentry::util::run_command({lsof_exe_, "-i", "-n", "-P"});
  out = parse_connection_list(filter_established(txt));
  return !txt.empty();
}

} // namespace netsentry::collectors
