#include "textguard/detect/homoglyphs.hpp"

#include "textguard/common/utf8.hpp"
#include "textguard/detect/catalog.hpp"
#include "textguard/detect/patterns.hpp"

namespace textguard::detect {

std::string substitute_confusables(const std::string_view text, std::size_t *replaced) {
  std::string output;
  output.reserve(text.size());
  std::size_t count = 0;

  std::size_t index = 0;
  common::Utf8Char ch;
  while (common::next_utf8_char(text, index, ch)) {
    if (const auto latin = latin_equivalent(ch.codepoint); latin.has_value() && ch.valid) {
      output.push_back(*latin);
      ++count;
    } else {
      output.append(text.substr(ch.offset, ch.length));
    }
  }

  if (replaced != nullptr) {
    *replaced = count;
  }
  return output;
}

Detection detect_homoglyphs(const std::string_view text) {
  Detection detection;
  Finding finding;
  finding.count = 0;

  std::size_t index = 0;
  std::size_t position = 0;
  common::Utf8Char ch;
  for (; common::next_utf8_char(text, index, ch); ++position) {
    if (!ch.valid) {
      continue;
    }
    const auto *entry = find_confusable(ch.codepoint);
    if (entry == nullptr) {
      continue;
    }
    if (finding.count == 0) {
      finding.character = std::string(text.substr(ch.offset, ch.length));
      finding.unicode = common::format_codepoint(ch.codepoint);
      finding.name = entry->name;
    }
    ++finding.count;
    record_position(finding, position);
    detection.spans.push_back(Span{.begin = ch.offset,
                                   .end = ch.offset + ch.length,
                                   .replacement = std::string(1, *latin_equivalent(ch.codepoint))});
  }

  if (finding.count == 0) {
    return detection;
  }

  const auto &info = technique_info(FindingKind::Homoglyph);
  finding.kind = FindingKind::Homoglyph;
  finding.description = info.description;
  finding.looks_like = substitute_confusables(text);
  finding.severity = contains_instruction_injection(*finding.looks_like) ? Severity::High
                                                                          : info.severity;
  detection.findings.push_back(std::move(finding));
  return detection;
}

} // namespace textguard::detect
