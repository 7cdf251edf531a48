#pragma once

#include "textguard/detect/types.hpp"

#include <string_view>

namespace textguard::detect {

/// Matches the instruction and delimiter phrase catalog, case-insensitively. One finding per
/// phrase family that matched; `matches` holds the matched substrings in text order, capped at
/// `max_matches`, while `count` is the full number of matches. A whitespace run of any length
/// matches as its first character and appears that way in `matches`; spans still cover the
/// whole run.
[[nodiscard]] Detection match_patterns(std::string_view text, std::size_t max_matches);

/// True if any instruction-injection family matches. Reads the phrase table only.
[[nodiscard]] bool contains_instruction_injection(std::string_view text);

} // namespace textguard::detect
