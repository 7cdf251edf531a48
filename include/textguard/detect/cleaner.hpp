#pragma once

#include "textguard/detect/types.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace textguard::detect {

/// Rewrites `text` with every span applied. Overlapping spans merge into one deletion.
/// Deleting a span marked `collapse_whitespace` leaves at most one blank between its
/// neighbours and none at the start or end of a line.
[[nodiscard]] std::string apply_spans(std::string_view text, std::vector<Span> spans);

/// Sanitizes `text`. Each pass deletes invisible, bidi, control and tag characters,
/// replaces confusables with their Latin letters, deletes phrase and delimiter matches
/// and finally deletes top-level encoded payloads, detecting afresh before each phase.
/// Passes repeat until the text stops changing, so cleaning the output again removes
/// nothing. `threat_level_before` is the verdict on the untouched input.
[[nodiscard]] CleanResult clean_text(std::string_view text, const DetectOptions &options);

} // namespace textguard::detect
