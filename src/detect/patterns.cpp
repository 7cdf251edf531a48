#include "textguard/detect/patterns.hpp"

#include "textguard/common/utf8.hpp"
#include "textguard/detect/catalog.hpp"

#include <algorithm>
#include <regex>
#include <string>
#include <vector>

namespace textguard::detect {

namespace {

struct CompiledFamily {
  const PatternFamily *family;
  std::regex regex;
};

const std::vector<CompiledFamily> &compiled_families() {
  static const std::vector<CompiledFamily> compiled = [] {
    std::vector<CompiledFamily> out;
    out.reserve(pattern_catalog().size());
    for (const auto &family : pattern_catalog()) {
      out.push_back(CompiledFamily{
          &family, std::regex(family.pattern, std::regex::ECMAScript | std::regex::icase)});
    }
    return out;
  }();
  return compiled;
}

std::cregex_iterator begin_matches(const std::string_view text, const std::regex &regex) {
  return std::cregex_iterator(text.data(), text.data() + text.size(), regex);
}

bool is_regex_space(const char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
}

// Copy of the text with every whitespace run shortened to its first character, plus the
// source byte range behind each kept byte. The regex engine recurses once per repeated
// character, so quantified whitespace must stay short.
struct MatchView {
  std::string text;
  std::vector<std::size_t> source_begin;
  std::vector<std::size_t> source_end;

  explicit MatchView(const std::string_view source) {
    text.reserve(source.size());
    source_begin.reserve(source.size());
    source_end.reserve(source.size());
    std::size_t i = 0;
    while (i < source.size()) {
      std::size_t next = i + 1;
      if (is_regex_space(source[i])) {
        while (next < source.size() && is_regex_space(source[next])) {
          ++next;
        }
      }
      text.push_back(source[i]);
      source_begin.push_back(i);
      source_end.push_back(next);
      i = next;
    }
  }
};

} // namespace

Detection match_patterns(const std::string_view text, const std::size_t max_matches) {
  Detection detection;
  if (text.empty()) {
    return detection;
  }

  const MatchView view(text);
  for (const auto &compiled : compiled_families()) {
    Finding finding;
    finding.count = 0;
    common::CodepointCounter positions(text);

    for (auto it = begin_matches(view.text, compiled.regex); it != std::cregex_iterator();
         ++it) {
      const auto &match = *it;
      if (match.length(0) == 0) {
        continue;
      }
      const auto view_begin = static_cast<std::size_t>(match.position(0));
      const auto view_end = view_begin + static_cast<std::size_t>(match.length(0));
      const std::size_t begin = view.source_begin[view_begin];
      const std::size_t end = view.source_end[view_end - 1];

      ++finding.count;
      if (finding.positions.size() < MAX_POSITIONS) {
        record_position(finding, positions.at(begin));
      }
      std::string literal = view.text.substr(view_begin, view_end - view_begin);
      if (finding.matches.size() < max_matches &&
          std::find(finding.matches.begin(), finding.matches.end(), literal) ==
              finding.matches.end()) {
        finding.matches.push_back(std::move(literal));
      }
      detection.spans.push_back(Span{.begin = begin, .end = end, .collapse_whitespace = true});
    }

    if (finding.count == 0) {
      continue;
    }
    const auto &info = technique_info(compiled.family->kind);
    finding.kind = compiled.family->kind;
    finding.description = info.description;
    finding.severity = info.severity;
    finding.name = compiled.family->name;
    detection.findings.push_back(std::move(finding));
  }

  return detection;
}

bool contains_instruction_injection(const std::string_view text) {
  const MatchView view(text);
  for (const auto &compiled : compiled_families()) {
    if (compiled.family->kind != FindingKind::InstructionInjection) {
      continue;
    }
    if (std::regex_search(view.text, compiled.regex)) {
      return true;
    }
  }
  return false;
}

} // namespace textguard::detect
