#pragma once

#include <algorithm>
#include <cctype>
#include <charconv>
#include <fstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace netsentry::util {

// Flat TOML subset: [section] headers (dotted names allowed, kept verbatim),
// key = value pairs, '#' comments. String values may be double-quoted with
// \\ \" \n \t escapes. Section and key order is preserved on save.
class TomlReader {
public:
  bool load(const std::string& path) {
    sections_.clear();
    std::ifstream in(path);
    if (!in.is_open()) return false;
    std::string current_section;
    std::string line;
    while (std::getline(in, line)) {
      auto sv = trim(line);
      if (sv.empty() || sv[0] == '#') continue;
      if (sv.front() == '[' && sv.back() == ']') {
        current_section = std::string(trim(sv.substr(1, sv.size() - 2)));
        ensure_section(current_section);
        continue;
      }
      auto eq = sv.find('=');
      if (eq == std::string_view::npos) continue;
      std::string key(trim(sv.substr(0, eq)));
      std::string val(trim(sv.substr(eq + 1)));
      if (val.size() >= 2 && val.front() == '"' && val.back() == '"')
        val = unescape(std::string_view(val).substr(1, val.size() - 2));
      ensure_section(current_section).set(key, std::move(val));
    }
    return !in.bad();
  }

  bool save(const std::string& path) const {
    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open()) return false;
    bool first = true;
    for (const auto& [name, sec] : sections_) {
      if (!first) out << '\n';
      first = false;
      if (!name.empty()) out << '[' << name << "]\n";
      for (const auto& [k, v] : sec.entries) {
        if (needs_quoting(v))
          out << k << " = \"" << escape(v) << "\"\n";
        else
          out << k << " = " << v << '\n';
      }
    }
    out.flush();
    return out.good();
  }

  [[nodiscard]] std::string get_string(std::string_view section, std::string_view key,
                                        const std::string& def = "") const {
    const auto* raw = find_value(section, key);
    return raw ? *raw : def;
  }

  [[nodiscard]] int get_int(std::string_view section, std::string_view key, int def = 0) const {
    return get_number(section, key, def);
  }

  [[nodiscard]] long long get_int64(std::string_view section, std::string_view key, long long def = 0) const {
    return get_number(section, key, def);
  }

  // true/false in any case, or 1/0
  [[nodiscard]] bool get_bool(std::string_view section, std::string_view key, bool def = false) const {
    const auto* raw = find_value(section, key);
    if (!raw) return def;
    std::string v;
    for (char c : *raw) v += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (v == "true" || v == "1") return true;
    if (v == "false" || v == "0") return false;
    return def;
  }

  void set(const std::string& section, const std::string& key, const std::string& value) {
    ensure_section(section).set(key, value);
  }

  void set(const std::string& section, const std::string& key, const char* value) {
    ensure_section(section).set(key, std::string(value));
  }

  void set(const std::string& section, const std::string& key, int value) {
    ensure_section(section).set(key, std::to_string(value));
  }

  void set(const std::string& section, const std::string& key, long long value) {
    ensure_section(section).set(key, std::to_string(value));
  }

  void set(const std::string& section, const std::string& key, bool value) {
    ensure_section(section).set(key, value ? "true" : "false");
  }

  [[nodiscard]] bool has(std::string_view section, std::string_view key) const {
    return find_value(section, key) != nullptr;
  }

  // Section names in file order; the unnamed top-level section is skipped.
  [[nodiscard]] std::vector<std::string> section_names() const {
    std::vector<std::string> out;
    for (const auto& [n, s] : sections_)
      if (!n.empty()) out.push_back(n);
    return out;
  }

private:
  using Entries = std::vector<std::pair<std::string, std::string>>;

  struct Section {
    Entries entries;

    [[nodiscard]] const std::string* find(std::string_view key) const {
      auto it = std::find_if(entries.begin(), entries.end(),
                             [key](const auto& kv){ return kv.first == key; });
      return it == entries.end() ? nullptr : &it->second;
    }

    void set(const std::string& key, std::string val) {
      for (auto& [k, v] : entries) {
        if (k == key) { v = std::move(val); return; }
      }
      entries.emplace_back(key, std::move(val));
    }
  };

  std::vector<std::pair<std::string, Section>> sections_;

  Section& ensure_section(const std::string& name) {
    for (auto& [n, s] : sections_)
      if (n == name) return s;
    sections_.emplace_back(name, Section{});
    return sections_.back().second;
  }

  [[nodiscard]] const Section* find_section(std::string_view name) const {
    for (const auto& [n, s] : sections_)
      if (n == name) return &s;
    return nullptr;
  }

  [[nodiscard]] const std::string* find_value(std::string_view section, std::string_view key) const {
    const auto* s = find_section(section);
    return s ? s->find(key) : nullptr;
  }

  template <typename T>
  [[nodiscard]] T get_number(std::string_view section, std::string_view key, T def) const {
    const auto* raw = find_value(section, key);
    if (!raw || raw->empty()) return def;
    T out{};
    auto [ptr, ec] = std::from_chars(raw->data(), raw->data() + raw->size(), out);
    if (ec != std::errc{} || ptr != raw->data() + raw->size()) return def;
    return out;
  }

  static std::string_view trim(std::string_view sv) {
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front()))) sv.remove_prefix(1);
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back()))) sv.remove_suffix(1);
    return sv;
  }

  static std::string escape(std::string_view v) {
    std::string out;
    out.reserve(v.size());
    for (char c : v) {
      switch (c) {
        case '\\': out += "\\\\"; break;
        case '"':  out += "\\\""; break;
        case '\n': out += "\\n"; break;
        case '\t': out += "\\t"; break;
        case '\r': out += "\\r"; break;
        default:   out += c; break;
      }
    }
    return out;
  }

  static std::string unescape(std::string_view v) {
    std::string out;
    out.reserve(v.size());
    for (size_t i = 0; i < v.size(); ++i) {
      if (v[i] == '\\' && i + 1 < v.size()) {
        char n = v[++i];
        switch (n) {
          case 'n': out += '\n'; break;
          case 't': out += '\t'; break;
          case 'r': out += '\r'; break;
          default:  out += n; break; // \\ and \"
        }
        continue;
      }
      out += v[i];
    }
    return out;
  }

  // Bare integers and booleans are written unquoted
  static bool needs_quoting(const std::string& val) {
    if (val == "true" || val == "false") return false;
    std::string_view digits(val);
    if (!digits.empty() && digits.front() == '-') digits.remove_prefix(1);
    if (digits.empty()) return true;
    return !std::all_of(digits.begin(), digits.end(),
                        [](unsigned char c){ return std::isdigit(c) != 0; });
  }
};

} // namespace netsentry::util
