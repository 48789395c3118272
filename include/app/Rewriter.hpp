#pragma once

#include "model/Placement.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace dockhand::app {

using Args = std::vector<std::string>;

// Insert 'argument' right after the first "run" token; unchanged without one.
[[nodiscard]] Args add_argument(Args args, std::string argument);

// "--cpuset-cpus=<cores>" then "--cpuset-mems=<zone>", each after "run".
[[nodiscard]] Args apply_pinning(Args args, const model::Pinning& pin);

// "--hostname=<hostname>" after "run".
[[nodiscard]] Args apply_hostname(Args args, const std::string& hostname);

// Hostname to inject, or nullopt when the vector already sets one or no task
// id is known. 'fqdn' is only called when a hostname is actually generated.
[[nodiscard]] std::optional<std::string> derive_hostname(const Args& args,
                                                         const std::optional<std::string>& task_id,
                                                         const std::function<std::string()>& fqdn);

// Full rewrite: pinning flags first, hostname last, so the result reads
// "run --hostname=.. --cpuset-mems=.. --cpuset-cpus=..".
[[nodiscard]] Args rewrite(Args args, const std::optional<model::Pinning>& pin,
                           const std::optional<std::string>& hostname);

// "0,2,4"
[[nodiscard]] std::string join_cores(const model::CoreSet& cores);

} // namespace dockhand::app
