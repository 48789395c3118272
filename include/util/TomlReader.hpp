#pragma once

#include <cctype>
#include <charconv>
#include <cmath>
#include <fstream>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace dockhand::util {

// Flat TOML subset: [section] headers, key = value lines, # comments.
// Used for both the config file and the placement ledger.
class TomlReader {
public:
  using Entries = std::vector<std::pair<std::string, std::string>>;

  bool load(const std::string& path) {
    sections_.clear();
    std::ifstream in(path);
    if (!in.is_open()) return false;
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) return false;
    parse(text);
    return true;
  }

  void parse(std::string_view text) {
    sections_.clear();
    std::string current_section;
    while (!text.empty()) {
      auto nl = text.find('\n');
      auto sv = trim(text.substr(0, nl));
      text = (nl == std::string_view::npos) ? std::string_view{} : text.substr(nl + 1);
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
      // Strip surrounding quotes from string values
      if (val.size() >= 2 && val.front() == '"' && val.back() == '"')
        val = val.substr(1, val.size() - 2);
      ensure_section(current_section).set(key, val);
    }
  }

  [[nodiscard]] std::string serialize() const {
    std::string out;
    bool first = true;
    for (const auto& [name, sec] : sections_) {
      if (!first) out += '\n';
      first = false;
      if (!name.empty()) out += '[' + name + "]\n";
      for (const auto& [k, v] : sec.entries) {
        if (needs_quoting(v))
          out += k + " = \"" + v + "\"\n";
        else
          out += k + " = " + v + '\n';
      }
    }
    return out;
  }

  [[nodiscard]] std::string get_string(std::string_view section, std::string_view key,
                                        const std::string& def = "") const {
    const auto* s = find_section(section);
    return s ? s->get(key, def) : def;
  }

  [[nodiscard]] int get_int(std::string_view section, std::string_view key, int def = 0) const {
    const auto* s = find_section(section);
    if (!s) return def;
    auto val = s->get(key, "");
    if (val.empty()) return def;
    auto parsed = parse_int(val);
    return parsed ? static_cast<int>(*parsed) : def;
  }

  [[nodiscard]] double get_double(std::string_view section, std::string_view key, double def = 0.0) const {
    const auto* s = find_section(section);
    if (!s) return def;
    auto parsed = parse_double(s->get(key, ""));
    return parsed ? *parsed : def;
  }

  [[nodiscard]] bool get_bool(std::string_view section, std::string_view key, bool def = false) const {
    const auto* s = find_section(section);
    if (!s) return def;
    auto val = s->get(key, "");
    if (val.empty()) return def;
    if (val == "true" || val == "True" || val == "TRUE" || val == "1") return true;
    if (val == "false" || val == "False" || val == "FALSE" || val == "0") return false;
    return def;
  }

  void set(const std::string& section, const std::string& key, const std::string& value) {
    ensure_section(section).set(key, value);
  }

  void set(const std::string& section, const std::string& key, double value) {
    ensure_section(section).set(key, format_double(value));
  }

  [[nodiscard]] bool has(std::string_view section, std::string_view key) const {
    const auto* s = find_section(section);
    return s && s->has(key);
  }

  // Section names in file order.
  [[nodiscard]] std::vector<std::string> section_names() const {
    std::vector<std::string> out;
    out.reserve(sections_.size());
    for (const auto& [n, s] : sections_) out.push_back(n);
    return out;
  }

  // All key/value pairs of a section in file order; empty if missing.
  [[nodiscard]] Entries entries(std::string_view section) const {
    const auto* s = find_section(section);
    return s ? s->entries : Entries{};
  }

  // Whole-string integer parse; rejects trailing garbage.
  static std::optional<long long> parse_int(std::string_view sv) {
    long long v = 0;
    auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), v);
    if (ec != std::errc() || ptr != sv.data() + sv.size() || sv.empty()) return std::nullopt;
    return v;
  }

  // Whole-string double parse; rejects trailing garbage and non-finite values.
  static std::optional<double> parse_double(std::string_view sv) {
    double v = 0.0;
    auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), v);
    if (ec != std::errc() || ptr != sv.data() + sv.size() || sv.empty()) return std::nullopt;
    if (!std::isfinite(v)) return std::nullopt;
    return v;
  }

  // Shortest representation that parses back to the same double.
  static std::string format_double(double v) {
    char buf[32];
    auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), v);
    if (ec != std::errc()) return "0";
    return std::string(buf, ptr);
  }

private:
  struct Section {
    Entries entries;

    [[nodiscard]] std::string get(std::string_view key, const std::string& def) const {
      for (const auto& [k, v] : entries)
        if (k == key) return v;
      return def;
    }

    void set(const std::string& key, const std::string& val) {
      for (auto& [k, v] : entries) {
        if (k == key) { v = val; return; }
      }
      entries.emplace_back(key, val);
    }

    [[nodiscard]] bool has(std::string_view key) const {
      for (const auto& [k, v] : entries)
        if (k == key) return true;
      return false;
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

  static std::string_view trim(std::string_view sv) {
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front()))) sv.remove_prefix(1);
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back()))) sv.remove_suffix(1);
    return sv;
  }

  static bool needs_quoting(const std::string& val) {
    if (val.empty()) return true;
    if (val == "true" || val == "false") return false;
    // Bare numbers stay bare
    if (parse_double(val)) return false;
    return true;
  }
};

} // namespace dockhand::util
