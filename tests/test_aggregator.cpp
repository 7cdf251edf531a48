#include "test_framework.hpp"

#include "textguard/detect/aggregator.hpp"

namespace {

textguard::detect::Finding make_finding(const textguard::detect::FindingKind kind,
                                        const std::uint64_t count,
                                        const textguard::detect::Severity severity,
                                        std::vector<std::string> matches = {}) {
  textguard::detect::Finding finding;
  finding.kind = kind;
  finding.description = "test";
  finding.count = count;
  finding.severity = severity;
  finding.matches = std::move(matches);
  return finding;
}

} // namespace

void register_aggregator_tests(std::vector<textguard::tests::TestCase> &tests) {
  using textguard::tests::require;
  namespace detect = textguard::detect;
  using detect::FindingKind;
  using detect::Severity;

  tests.push_back({"aggregator_empty_is_safe", [] {
                     const auto result = detect::aggregate({}, 5);
                     require(result.threat_level == detect::ThreatLevel::Safe, "safe");
                     require(result.total_findings == 0, "no findings");
                     require(result.summary.empty(), "empty summary");
                     require(result.id.empty(), "id is assigned by the caller");
                   }});

  tests.push_back({"aggregator_groups_by_kind_and_sums_counts", [] {
                     const std::vector<detect::Finding> findings = {
                         make_finding(FindingKind::InstructionInjection, 2, Severity::High,
                                      {"ignore previous instructions"}),
                         make_finding(FindingKind::ZeroWidth, 3, Severity::High),
                         make_finding(FindingKind::InstructionInjection, 1, Severity::High,
                                      {"you are now"}),
                     };
                     const auto result = detect::aggregate(findings, 5);
                     require(result.findings.size() == 2, "two kinds");
                     require(result.findings[0].kind == FindingKind::ZeroWidth,
                             "phase order restored");
                     require(result.findings[1].count == 3, "instruction counts summed");
                     require(result.findings[1].matches.size() == 2, "matches merged");
                     require(result.findings[1].matches[0] == "ignore previous instructions",
                             "first match first");
                     require(result.total_findings == 6, "sum of grouped counts");
                     require(result.summary.at(FindingKind::ZeroWidth).count == 3, "summary");
                   }});

  tests.push_back({"aggregator_threat_level_is_max_severity", [] {
                     const std::vector<detect::Finding> findings = {
                         make_finding(FindingKind::ControlCharacter, 1, Severity::Medium),
                         make_finding(FindingKind::AsciiSmuggling, 1, Severity::Critical),
                         make_finding(FindingKind::Homoglyph, 1, Severity::Medium),
                     };
                     require(detect::threat_level_of(findings) == detect::ThreatLevel::Critical,
                             "critical wins");
                     require(detect::aggregate(findings, 5).summary.at(FindingKind::Homoglyph)
                                     .severity == Severity::Medium,
                             "per-kind severity kept");
                   }});

  tests.push_back({"aggregator_payload_group_takes_highest_severity", [] {
                     const std::vector<detect::Finding> findings = {
                         make_finding(FindingKind::Base64Payload, 1, Severity::High),
                         make_finding(FindingKind::Base64Payload, 1, Severity::Critical),
                     };
                     const auto result = detect::aggregate(findings, 5);
                     require(result.findings.size() == 1, "one group");
                     require(result.findings[0].severity == Severity::Critical, "max severity");
                   }});

  tests.push_back({"aggregator_caps_merged_matches", [] {
                     const std::vector<detect::Finding> findings = {
                         make_finding(FindingKind::DelimiterInjection, 2, Severity::Medium,
                                      {"[INST]", "<<SYS>>"}),
                         make_finding(FindingKind::DelimiterInjection, 2, Severity::Medium,
                                      {"<|im_start|>", "Human:"}),
                     };
                     const auto result = detect::aggregate(findings, 3);
                     require(result.findings[0].matches.size() == 3, "capped at max_matches");
                   }});

  tests.push_back({"aggregator_is_deterministic", [] {
                     const std::vector<detect::Finding> findings = {
                         make_finding(FindingKind::Rot13Payload, 1, Severity::High),
                         make_finding(FindingKind::Base64Payload, 1, Severity::High),
                         make_finding(FindingKind::ZeroWidth, 1, Severity::High),
                     };
                     const auto first = detect::aggregate(findings, 5);
                     const auto second = detect::aggregate(findings, 5);
                     require(first.findings.size() == second.findings.size(), "same size");
                     for (std::size_t i = 0; i < first.findings.size(); ++i) {
                       require(first.findings[i].kind == second.findings[i].kind, "same order");
                     }
                     require(first.findings[1].kind == FindingKind::Base64Payload,
                             "base64 before rot13");
                   }});

  tests.push_back({"aggregator_merges_positions_in_order", [] {
                     auto first = make_finding(detect::FindingKind::InstructionInjection, 2,
                                               detect::Severity::High);
                     first.positions = {40, 90};
                     auto second = make_finding(detect::FindingKind::InstructionInjection, 12,
                                                detect::Severity::High);
                     second.positions = {0, 5, 10, 15, 20, 25, 30, 35, 40, 45};
                     const auto grouped = detect::group_by_kind({first, second}, 5);
                     require(grouped.size() == 1, "one group");
                     require(grouped.front().positions ==
                                 std::vector<std::size_t>{0, 5, 10, 15, 20, 25, 30, 35, 40, 45},
                             "sorted, deduplicated, first ten kept");
                   }});
}
