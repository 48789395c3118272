#include "app/ArgScanner.hpp"

#include <algorithm>
#include <cctype>

namespace dockhand::app {

static bool is_word_char(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

// "--env", or a short cluster "-<word chars>" containing 'e'.
static bool is_env_flag(std::string_view head) {
  if (head == "--env") return true;
  if (head.size() < 2 || head[0] != '-') return false;
  auto cluster = head.substr(1);
  if (!std::all_of(cluster.begin(), cluster.end(), is_word_char)) return false;
  return cluster.find('e') != std::string_view::npos;
}

// Matches the flag head by hand; the value part may be arbitrarily long.
auto parse_env_args(const std::vector<std::string>& args) -> EnvMap {
  EnvMap result;
  bool in_env = false;
  for (const auto& tok : args) {
    std::string arg = tok;
    if (!in_env) {
      auto eq = tok.find('=');
      if (!is_env_flag(std::string_view(tok).substr(0, eq))) continue;
      if (eq == std::string::npos) {
        in_env = true;
        continue;
      }
      // Inline value must be non-empty and not start with whitespace
      if (eq + 1 >= tok.size() || std::isspace(static_cast<unsigned char>(tok[eq + 1]))) continue;
      arg = tok.substr(eq + 1);
    }
    in_env = false;
    auto eq = arg.find('=');
    if (eq == std::string::npos) continue;
    result[arg.substr(0, eq)] = arg.substr(eq + 1);
  }
  return result;
}

bool already_has_hostname(const std::vector<std::string>& args) {
  for (const auto& arg : args) {
    if (arg == "-h") return true;
    if (arg.rfind("--hostname", 0) == 0) return true;
    if (arg.size() > 1 && arg[0] == '-' && arg[1] != '-') {
      // several short args; anything after '=' is a value
      auto flags = std::string_view(arg).substr(0, arg.find('='));
      if (flags.find('h') != std::string_view::npos) return true;
    }
  }
  return false;
}

bool has_flag(const std::vector<std::string>& args, std::string_view flag) {
  return std::any_of(args.begin(), args.end(), [&](const std::string& a){
    if (a == flag) return true;
    return a.size() > flag.size() && a.compare(0, flag.size(), flag) == 0 && a[flag.size()] == '=';
  });
}

auto find_run(const std::vector<std::string>& args) -> std::optional<size_t> {
  auto it = std::find(args.begin(), args.end(), "run");
  if (it == args.end()) return std::nullopt;
  return static_cast<size_t>(it - args.begin());
}

} // namespace dockhand::app
