#include "app/HostnameGen.hpp"

namespace dockhand::app {

static bool allowed(char c) {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '-';
}

auto sanitize_hostname(std::string_view raw) -> std::string {
  std::string out;
  out.reserve(raw.size());
  bool in_run = false;
  for (char c : raw) {
    if (allowed(c)) { out.push_back(c); in_run = false; continue; }
    if (!in_run) out.push_back('-');
    in_run = true;
  }
  if (out.size() > kMaxHostnameLength) out.resize(kMaxHostnameLength);
  return out;
}

auto generate_hostname(std::string_view fqdn, std::string_view task_id) -> std::string {
  auto host = fqdn.substr(0, fqdn.find('.'));
  auto dot = task_id.rfind('.');
  auto task = (dot == std::string_view::npos) ? task_id : task_id.substr(dot + 1);
  std::string raw;
  raw.reserve(host.size() + 1 + task.size());
  raw.append(host).append("-").append(task);
  return sanitize_hostname(raw);
}

} // namespace dockhand::app
