#include "textguard/detect/characters.hpp"

#include "textguard/common/utf8.hpp"
#include "textguard/detect/catalog.hpp"

#include <optional>
#include <vector>

namespace textguard::detect {

namespace {

struct KindTally {
  FindingKind kind;
  std::optional<Finding> finding;

  void add(const std::string_view text, const common::Utf8Char &ch, const std::size_t position,
           const char *name) {
    if (finding.has_value()) {
      ++finding->count;
      record_position(*finding, position);
      return;
    }
    const auto &info = technique_info(kind);
    Finding first;
    first.kind = kind;
    first.description = info.description;
    first.severity = info.severity;
    first.count = 1;
    first.character = std::string(text.substr(ch.offset, ch.length));
    first.unicode = common::format_codepoint(ch.codepoint);
    first.name = name;
    first.positions.push_back(position);
    finding = std::move(first);
  }
};

Finding make_smuggling_finding(const std::string_view text, const std::size_t begin,
                               const std::size_t end, const std::uint64_t count,
                               const std::uint32_t first_cp,
                               std::vector<std::size_t> positions) {
  const auto &info = technique_info(FindingKind::AsciiSmuggling);
  Finding finding;
  finding.kind = FindingKind::AsciiSmuggling;
  finding.description = info.description;
  finding.severity = info.severity;
  finding.count = count;
  finding.unicode = common::format_codepoint(first_cp);
  finding.hidden_content = decode_tag_run(text.substr(begin, end - begin));
  finding.positions = std::move(positions);
  return finding;
}

} // namespace

std::string decode_tag_run(const std::string_view run) {
  std::string hidden;
  std::size_t index = 0;
  common::Utf8Char ch;
  while (common::next_utf8_char(run, index, ch)) {
    if (!is_tag_codepoint(ch.codepoint)) {
      continue;
    }
    const std::uint32_t ascii = ch.codepoint - TAG_CHARACTER_BASE;
    if (ascii >= 0x20U && ascii < 0x7FU) {
      hidden.push_back(static_cast<char>(ascii));
    }
  }
  return hidden;
}

Detection classify_characters(const std::string_view text) {
  Detection detection;
  KindTally zero_width{FindingKind::ZeroWidth, std::nullopt};
  KindTally bidi{FindingKind::BidiOverride, std::nullopt};
  KindTally control{FindingKind::ControlCharacter, std::nullopt};
  std::vector<Finding> smuggled;

  std::optional<std::size_t> run_begin;
  std::size_t run_end = 0;
  std::uint64_t run_count = 0;
  std::uint32_t run_first_cp = 0;
  std::vector<std::size_t> run_positions;

  auto close_run = [&] {
    if (run_begin.has_value()) {
      smuggled.push_back(
          make_smuggling_finding(text, *run_begin, run_end, run_count, run_first_cp,
                                 std::move(run_positions)));
      run_begin.reset();
      run_count = 0;
      run_positions.clear();
    }
  };

  std::size_t index = 0;
  std::size_t position = 0;
  common::Utf8Char ch;
  for (; common::next_utf8_char(text, index, ch); ++position) {
    if (!ch.valid) {
      close_run();
      continue;
    }

    const std::uint32_t cp = ch.codepoint;
    if (is_tag_codepoint(cp)) {
      if (!run_begin.has_value()) {
        run_begin = ch.offset;
        run_first_cp = cp;
      }
      run_end = ch.offset + ch.length;
      ++run_count;
      if (run_positions.size() < MAX_POSITIONS) {
        run_positions.push_back(position);
      }
      detection.spans.push_back(Span{.begin = ch.offset, .end = ch.offset + ch.length});
      continue;
    }
    close_run();

    if (const auto *invisible = find_zero_width(cp); invisible != nullptr) {
      zero_width.add(text, ch, position, invisible->name);
    } else if (const auto *direction = find_bidi(cp); direction != nullptr) {
      bidi.add(text, ch, position, direction->name);
    } else if (is_control_codepoint(cp)) {
      control.add(text, ch, position, "Control character");
    } else {
      continue;
    }
    detection.spans.push_back(Span{.begin = ch.offset, .end = ch.offset + ch.length});
  }
  close_run();

  for (auto *tally : {&zero_width, &bidi, &control}) {
    if (tally->finding.has_value()) {
      detection.findings.push_back(std::move(*tally->finding));
    }
  }
  for (auto &finding : smuggled) {
    detection.findings.push_back(std::move(finding));
  }
  return detection;
}

} // namespace textguard::detect
