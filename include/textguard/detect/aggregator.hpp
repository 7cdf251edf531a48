#pragma once

#include "textguard/detect/types.hpp"

#include <vector>

namespace textguard::detect {

/// Merges findings of the same kind into one: counts are summed, severity is the maximum,
/// details come from the first occurrence while `matches` and `inner_kinds` are merged
/// (deduplicated, `matches` capped at `max_matches`). Output is in phase order.
[[nodiscard]] std::vector<Finding> group_by_kind(const std::vector<Finding> &findings,
                                                 std::size_t max_matches);

/// Highest severity across findings, or safe when there are none.
[[nodiscard]] ThreatLevel threat_level_of(const std::vector<Finding> &findings);

/// Builds the scan verdict from raw detector output. The `id` is left empty.
[[nodiscard]] ScanResult aggregate(const std::vector<Finding> &findings, std::size_t max_matches);

} // namespace textguard::detect
