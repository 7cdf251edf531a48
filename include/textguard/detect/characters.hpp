#pragma once

#include "textguard/detect/types.hpp"

#include <string_view>

namespace textguard::detect {

/// Flags zero-width, bidi, control and tag codepoints. Emits at most one finding each for
/// zero_width, bidi_override and control_character (count = occurrences, details from the
/// first occurrence) and one ascii_smuggling finding per contiguous run of tag characters.
/// Every flagged codepoint yields a deletion span.
[[nodiscard]] Detection classify_characters(std::string_view text);

/// ASCII recovered from a run of tag characters; non-printable tags are dropped.
[[nodiscard]] std::string decode_tag_run(std::string_view run);

} // namespace textguard::detect
