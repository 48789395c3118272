#pragma once
#include "model/Placement.hpp"
#include <optional>

namespace dockhand::app {

// Slack for accumulated floating-point error in committed sums
inline constexpr double kCapacityEpsilon = 1e-9;

// First-fit by ascending zone id. On success the request's entry is appended
// to the chosen zone and its id returned; std::nullopt means every zone is
// exhausted (or the request is not a positive, finite quantity). Entries
// already owned by request.owner_pid are dropped first: they can only belong
// to a dead owner whose pid was recycled.
[[nodiscard]] auto place(model::PlacementLedger& ledger, const model::PlacementRequest& request)
    -> std::optional<model::ZoneId>;

} // namespace dockhand::app
