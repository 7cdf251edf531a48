#pragma once

#include "textguard/config/schema.hpp"
#include "textguard/observability/observer.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace textguard::observability {

/// Splits `observability.backend` ("log", "none", "log,noop") into lowercase names.
/// Blank entries are dropped.
[[nodiscard]] std::vector<std::string> backend_names(const std::string &list);

[[nodiscard]] bool is_known_backend(std::string_view name);

/// One name yields that observer; several yield a MultiObserver over them.
[[nodiscard]] std::unique_ptr<IObserver>
create_observer(const config::ObservabilityConfig &config);

} // namespace textguard::observability
