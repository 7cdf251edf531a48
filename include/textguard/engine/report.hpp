#pragma once

#include "textguard/detect/catalog.hpp"
#include "textguard/detect/types.hpp"

#include <string>
#include <vector>

namespace textguard::engine {

/// JSON documents for scan and clean results. Output is ASCII; anything else is escaped.
[[nodiscard]] std::string scan_result_json(const detect::ScanResult &result);
[[nodiscard]] std::string clean_result_json(const detect::CleanResult &result);
[[nodiscard]] std::string finding_json(const detect::Finding &finding);
[[nodiscard]] std::string techniques_json(const std::vector<detect::TechniqueInfo> &techniques);

} // namespace textguard::engine
