#include "textguard/detect/cleaner.hpp"

#include "textguard/common/strings.hpp"
#include "textguard/common/utf8.hpp"
#include "textguard/detect/aggregator.hpp"
#include "textguard/detect/characters.hpp"
#include "textguard/detect/decoder.hpp"
#include "textguard/detect/homoglyphs.hpp"
#include "textguard/detect/patterns.hpp"
#include "textguard/detect/pipeline.hpp"

#include <algorithm>
#include <functional>

namespace textguard::detect {

namespace {

bool is_line_break(const char c) { return c == '\n' || c == '\r'; }

void collapse_after_deletion(const std::string_view text, std::size_t &cursor, std::string &out) {
  if (out.empty() || common::is_ascii_space(out.back()) || is_line_break(out.back())) {
    while (cursor < text.size() && common::is_ascii_space(text[cursor])) {
      ++cursor;
    }
  }
  if (cursor == text.size() || is_line_break(text[cursor])) {
    while (!out.empty() && common::is_ascii_space(out.back())) {
      out.pop_back();
    }
  }
}

using Phase = std::function<Detection(std::string_view)>;

} // namespace

std::string apply_spans(const std::string_view text, std::vector<Span> spans) {
  std::sort(spans.begin(), spans.end(), [](const Span &a, const Span &b) {
    if (a.begin != b.begin) {
      return a.begin < b.begin;
    }
    return a.end > b.end;
  });

  std::string out;
  out.reserve(text.size());
  std::size_t cursor = 0;
  std::size_t i = 0;
  while (i < spans.size()) {
    Span span = spans[i++];
    if (span.end <= cursor) {
      continue;
    }
    span.begin = std::max(span.begin, cursor);
    while (i < spans.size() && spans[i].begin < span.end) {
      if (spans[i].end > span.end) {
        span.end = spans[i].end;
      }
      span.replacement.clear();
      span.collapse_whitespace = span.collapse_whitespace || spans[i].collapse_whitespace;
      ++i;
    }

    out.append(text.substr(cursor, span.begin - cursor));
    out.append(span.replacement);
    cursor = std::min(span.end, text.size());
    if (span.collapse_whitespace && span.replacement.empty()) {
      collapse_after_deletion(text, cursor, out);
    }
  }
  if (cursor < text.size()) {
    out.append(text.substr(cursor));
  }
  return out;
}

CleanResult clean_text(const std::string_view text, const DetectOptions &options) {
  CleanResult result;
  result.original_length = common::utf8_length(text);
  result.threat_level_before = threat_level_of(run_detectors(text, options).findings);

  const std::vector<Phase> phases = {
      [](const std::string_view current) { return classify_characters(current); },
      [](const std::string_view current) { return detect_homoglyphs(current); },
      [&options](const std::string_view current) {
        return match_patterns(current, options.max_matches);
      },
      [&options](const std::string_view current) {
        Detection detection = decode_payloads(current, options);
        // Nested layers vanish with the top-level encoding that carries them.
        std::erase_if(detection.findings, [](const Finding &finding) {
          return finding.depth.has_value() && *finding.depth > 1;
        });
        return detection;
      },
  };

  std::vector<Finding> removed;
  std::string current(text);
  bool changed = true;
  while (changed) {
    changed = false;
    for (const auto &phase : phases) {
      Detection detection = phase(current);
      if (detection.spans.empty()) {
        continue;
      }
      std::string next = apply_spans(current, std::move(detection.spans));
      if (next == current) {
        continue;
      }
      changed = true;
      current = std::move(next);
      removed.insert(removed.end(), std::make_move_iterator(detection.findings.begin()),
                     std::make_move_iterator(detection.findings.end()));
    }
  }

  result.cleaned_length = common::utf8_length(current);
  result.characters_removed = result.original_length - result.cleaned_length;
  for (const auto &finding : group_by_kind(removed, options.max_matches)) {
    result.removed_details.push_back(RemovedDetail{finding.kind, finding.count});
  }
  result.cleaned_text = std::move(current);
  return result;
}

} // namespace textguard::detect
