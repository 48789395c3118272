#pragma once
#include <string>

namespace dockhand::host {

// Fully-qualified name of this host: gethostname() canonicalized through the
// resolver (AI_CANONNAME). Falls back to the bare hostname when resolution
// fails, and to "localhost" when even that is unavailable.
[[nodiscard]] auto local_fqdn() -> std::string;

} // namespace dockhand::host
