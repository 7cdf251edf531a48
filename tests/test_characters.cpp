#include "test_framework.hpp"

#include "tests/helpers/test_helpers.hpp"
#include "textguard/detect/characters.hpp"

void register_characters_tests(std::vector<textguard::tests::TestCase> &tests) {
  using textguard::tests::require;
  namespace detect = textguard::detect;
  using textguard::testing::find_kind;
  using textguard::testing::count_kind;

  tests.push_back({"characters_plain_text_has_no_findings", [] {
                     const auto detection =
                         detect::classify_characters("Plain text,\twith tabs\r\nand newlines.");
                     require(detection.findings.empty(), "plain text should be clean");
                     require(detection.spans.empty(), "no spans expected");
                   }});

  tests.push_back({"characters_zero_width_counts_and_first_details", [] {
                     const auto detection =
                         detect::classify_characters("a\u200Bb\u200Dc\u200Bd");
                     const auto *finding =
                         find_kind(detection.findings, detect::FindingKind::ZeroWidth);
                     require(finding != nullptr, "zero_width finding expected");
                     require(finding->count == 3, "all three occurrences merged");
                     require(finding->unicode == "U+200B", "first occurrence reported");
                     require(finding->character == "\u200B", "literal glyph reported");
                     require(finding->severity == detect::Severity::High, "zero_width is high");
                     require(detection.spans.size() == 3, "one span per codepoint");
                   }});

  tests.push_back({"characters_bidi_override_is_high", [] {
                     const auto detection =
                         detect::classify_characters("invoice\u202Efdp.exe and \u2066x\u2069");
                     const auto *finding =
                         find_kind(detection.findings, detect::FindingKind::BidiOverride);
                     require(finding != nullptr, "bidi finding expected");
                     require(finding->count == 3, "override and isolates counted");
                     require(finding->severity == detect::Severity::High, "bidi is high");
                     require(finding->unicode == "U+202E", "first is RLO");
                   }});

  tests.push_back({"characters_control_excludes_common_whitespace", [] {
                     const auto detection = detect::classify_characters("a\tb\nc\rd\x01" "e\x7F");
                     const auto *finding =
                         find_kind(detection.findings, detect::FindingKind::ControlCharacter);
                     require(finding != nullptr, "control finding expected");
                     require(finding->count == 2, "SOH and DEL only");
                     require(finding->severity == detect::Severity::Medium, "control is medium");
                     require(finding->unicode == "U+0001", "first control codepoint");
                   }});

  tests.push_back({"characters_c1_control_detected", [] {
                     const auto detection = detect::classify_characters("x\u0085y");
                     require(count_kind(detection.findings,
                                        detect::FindingKind::ControlCharacter) == 1,
                             "NEL is a C1 control");
                   }});

  tests.push_back({"characters_tag_run_decodes_hidden_ascii", [] {
                     const std::string text =
                         "Hello\U000E0068\U000E0069\U000E0021 world";
                     const auto detection = detect::classify_characters(text);
                     const auto *finding =
                         find_kind(detection.findings, detect::FindingKind::AsciiSmuggling);
                     require(finding != nullptr, "ascii_smuggling expected");
                     require(finding->hidden_content == "hi!", "tag payload recovered");
                     require(finding->count == 3, "three tag codepoints");
                     require(finding->severity == detect::Severity::Critical,
                             "smuggling is critical");
                   }});

  tests.push_back({"characters_one_smuggling_finding_per_run", [] {
                     const std::string text = "\U000E0061\U000E0062 gap \U000E0063";
                     const auto detection = detect::classify_characters(text);
                     require(count_kind(detection.findings,
                                        detect::FindingKind::AsciiSmuggling) == 2,
                             "two separate runs");
                     require(detection.findings[0].hidden_content == "ab", "first run");
                     require(detection.findings[1].hidden_content == "c", "second run");
                   }});

  tests.push_back({"characters_tag_run_drops_unprintable_tags", [] {
                     require(detect::decode_tag_run("\U000E0001\U000E0041\U000E007F") == "A",
                             "language tag and cancel tag are dropped");
                   }});

  tests.push_back({"characters_invalid_utf8_is_not_flagged", [] {
                     const auto detection = detect::classify_characters("ab\xC3(\xFF" "cd");
                     require(detection.findings.empty(), "malformed bytes are not a technique");
                   }});

  tests.push_back({"characters_findings_in_phase_order", [] {
                     const auto detection =
                         detect::classify_characters("\U000E0041\x02\u202E\u200B");
                     require(detection.findings.size() == 4, "four findings");
                     require(detection.findings[0].kind == detect::FindingKind::ZeroWidth,
                             "zero_width first");
                     require(detection.findings[1].kind == detect::FindingKind::BidiOverride,
                             "bidi second");
                     require(detection.findings[2].kind == detect::FindingKind::ControlCharacter,
                             "control third");
                     require(detection.findings[3].kind == detect::FindingKind::AsciiSmuggling,
                             "smuggling last");
                   }});

  tests.push_back({"characters_positions_are_codepoint_offsets", [] {
                     const auto detection =
                         detect::classify_characters("\u00E9\u200Bx\u200By \U000E0068\U000E0069");
                     const auto *zero_width =
                         find_kind(detection.findings, detect::FindingKind::ZeroWidth);
                     require(zero_width != nullptr, "zero_width finding expected");
                     require(zero_width->positions == std::vector<std::size_t>{1, 3},
                             "positions count codepoints, not bytes");
                     const auto *smuggled =
                         find_kind(detection.findings, detect::FindingKind::AsciiSmuggling);
                     require(smuggled != nullptr, "tag run expected");
                     require(smuggled->positions == std::vector<std::size_t>{6, 7},
                             "every tag character located");
                   }});

  tests.push_back({"characters_positions_capped_at_ten", [] {
                     std::string text;
                     for (int i = 0; i < 12; ++i) {
                       text += "a\u200B";
                     }
                     const auto detection = detect::classify_characters(text);
                     const auto *finding =
                         find_kind(detection.findings, detect::FindingKind::ZeroWidth);
                     require(finding != nullptr, "zero_width finding expected");
                     require(finding->count == 12, "all occurrences counted");
                     require(finding->positions.size() == detect::MAX_POSITIONS,
                             "only the first positions kept");
                     require(finding->positions.front() == 1 && finding->positions.back() == 19,
                             "first ten occurrences");
                   }});
}
