#pragma once

#include "textguard/detect/types.hpp"

#include <string_view>

namespace textguard::detect {

/// Runs every detector over `text` in phase order: characters, homoglyphs, patterns, then
/// the recursive decoder.
[[nodiscard]] Detection run_detectors(std::string_view text, const DetectOptions &options);

} // namespace textguard::detect
