#include "app/Rewriter.hpp"
#include "app/ArgScanner.hpp"
#include "app/HostnameGen.hpp"

#include <cstddef>

namespace dockhand::app {

Args add_argument(Args args, std::string argument) {
  if (auto idx = find_run(args)) {
    args.insert(args.begin() + static_cast<std::ptrdiff_t>(*idx + 1), std::move(argument));
  }
  return args;
}

std::string join_cores(const model::CoreSet& cores) {
  std::string out;
  for (size_t i = 0; i < cores.size(); ++i) {
    if (i) out.push_back(',');
    out += std::to_string(cores[i]);
  }
  return out;
}

Args apply_pinning(Args args, const model::Pinning& pin) {
  args = add_argument(std::move(args), "--cpuset-cpus=" + join_cores(pin.cores));
  return add_argument(std::move(args), "--cpuset-mems=" + std::to_string(pin.zone));
}

Args apply_hostname(Args args, const std::string& hostname) {
  return add_argument(std::move(args), "--hostname=" + hostname);
}

std::optional<std::string> derive_hostname(const Args& args, const std::optional<std::string>& task_id,
                                           const std::function<std::string()>& fqdn) {
  if (!task_id || task_id->empty()) return std::nullopt;
  if (already_has_hostname(args)) return std::nullopt;
  return generate_hostname(fqdn ? fqdn() : std::string(), *task_id);
}

Args rewrite(Args args, const std::optional<model::Pinning>& pin,
             const std::optional<std::string>& hostname) {
  if (pin) args = apply_pinning(std::move(args), *pin);
  if (hostname) args = apply_hostname(std::move(args), *hostname);
  return args;
}

} // namespace dockhand::app
