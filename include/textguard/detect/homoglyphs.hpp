#pragma once

#include "textguard/detect/types.hpp"

#include <cstddef>
#include <string>
#include <string_view>

namespace textguard::detect {

/// The text with every confusable codepoint replaced by its Latin reading.
[[nodiscard]] std::string substitute_confusables(std::string_view text,
                                                 std::size_t *replaced = nullptr);

/// Emits a single homoglyph finding when any confusable codepoint is present: `character`
/// and `unicode` describe the first one, `looks_like` is the fully substituted text and
/// `count` the number of confusables. Severity is escalated to high when the substituted
/// text reads as an instruction injection. Each confusable yields a replacement span.
[[nodiscard]] Detection detect_homoglyphs(std::string_view text);

} // namespace textguard::detect
