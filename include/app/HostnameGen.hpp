#pragma once
#include <string>
#include <string_view>

namespace dockhand::app {

// DNS label limit
inline constexpr size_t kMaxHostnameLength = 63;

// Collapse every run of characters outside [A-Za-z0-9-] into a single '-'
// and cut the result to kMaxHostnameLength. Idempotent.
[[nodiscard]] auto sanitize_hostname(std::string_view raw) -> std::string;

// "<first label of fqdn>-<last dot segment of task id>", sanitized.
[[nodiscard]] auto generate_hostname(std::string_view fqdn, std::string_view task_id) -> std::string;

} // namespace dockhand::app
