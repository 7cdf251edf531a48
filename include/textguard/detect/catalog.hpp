#pragma once

#include "textguard/detect/types.hpp"

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace textguard::detect {

inline constexpr std::uint32_t TAG_CHARACTER_BASE = 0xE0000U;
inline constexpr std::uint32_t TAG_CHARACTER_LAST = 0xE007FU;

/// Inclusive codepoint range with a display name. Single codepoints use first == last.
struct CodepointRange {
  std::uint32_t first;
  std::uint32_t last;
  const char *name;
};

/// Codepoints in [first, last] read as Latin `latin + (cp - first)`.
struct Confusable {
  std::uint32_t first;
  std::uint32_t last;
  char latin;
  const char *name;
};

struct PatternFamily {
  FindingKind kind;
  const char *name;
  /// ECMAScript regex, matched case-insensitively.
  const char *pattern;
};

struct TechniqueInfo {
  FindingKind kind;
  const char *title;
  const char *description;
  Severity severity;
  std::vector<const char *> examples;
};

[[nodiscard]] const std::vector<CodepointRange> &zero_width_catalog();
[[nodiscard]] const std::vector<CodepointRange> &bidi_catalog();
[[nodiscard]] const std::vector<Confusable> &confusable_catalog();
[[nodiscard]] const std::vector<PatternFamily> &pattern_catalog();
[[nodiscard]] const std::vector<TechniqueInfo> &technique_catalog();
/// Whole words that make a ROT13 decoding look deliberate.
[[nodiscard]] const std::vector<std::string_view> &suspicious_words();

[[nodiscard]] const TechniqueInfo &technique_info(FindingKind kind);

[[nodiscard]] const CodepointRange *find_zero_width(std::uint32_t cp);
[[nodiscard]] const CodepointRange *find_bidi(std::uint32_t cp);
[[nodiscard]] const Confusable *find_confusable(std::uint32_t cp);
[[nodiscard]] std::optional<char> latin_equivalent(std::uint32_t cp);

/// C0 controls other than tab/newline/carriage return, DEL and C1 controls.
[[nodiscard]] bool is_control_codepoint(std::uint32_t cp);
[[nodiscard]] bool is_tag_codepoint(std::uint32_t cp);

} // namespace textguard::detect
