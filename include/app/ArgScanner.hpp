#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace dockhand::app {

using EnvMap = std::unordered_map<std::string, std::string>;

// Collect KEY=VALUE pairs passed through -e/--env style flags, inline
// (--env=K=V, -e=K=V) or as the following token. Later keys win.
[[nodiscard]] auto parse_env_args(const std::vector<std::string>& args) -> EnvMap;

// True if the vector already sets the container hostname: "-h", any token
// starting with "--hostname", or a short-option cluster containing 'h'.
[[nodiscard]] bool already_has_hostname(const std::vector<std::string>& args);

// True if 'flag' appears either bare or as "flag=value".
[[nodiscard]] bool has_flag(const std::vector<std::string>& args, std::string_view flag);

// Index of the first "run" token.
[[nodiscard]] auto find_run(const std::vector<std::string>& args) -> std::optional<size_t>;

} // namespace dockhand::app
