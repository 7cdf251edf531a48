#include "textguard/detect/aggregator.hpp"

#include <algorithm>
#include <cassert>

namespace textguard::detect {

namespace {

void merge_into(Finding &group, const Finding &finding, const std::size_t max_matches) {
  group.count += finding.count;
  group.severity = std::max(group.severity, finding.severity);
  for (const auto &match : finding.matches) {
    if (group.matches.size() >= max_matches) {
      break;
    }
    if (std::find(group.matches.begin(), group.matches.end(), match) == group.matches.end()) {
      group.matches.push_back(match);
    }
  }
  // Each finding keeps its own first positions, so the smallest of the union are the first
  // occurrences of the kind.
  group.positions.insert(group.positions.end(), finding.positions.begin(),
                         finding.positions.end());
  std::sort(group.positions.begin(), group.positions.end());
  group.positions.erase(std::unique(group.positions.begin(), group.positions.end()),
                        group.positions.end());
  if (group.positions.size() > MAX_POSITIONS) {
    group.positions.resize(MAX_POSITIONS);
  }
  for (const auto kind : finding.inner_kinds) {
    if (std::find(group.inner_kinds.begin(), group.inner_kinds.end(), kind) ==
        group.inner_kinds.end()) {
      group.inner_kinds.push_back(kind);
    }
  }
}

} // namespace

std::vector<Finding> group_by_kind(const std::vector<Finding> &findings,
                                   const std::size_t max_matches) {
  std::vector<Finding> grouped;
  for (const auto &finding : findings) {
    assert(finding.count >= 1);
    auto it = std::find_if(grouped.begin(), grouped.end(),
                           [&](const Finding &group) { return group.kind == finding.kind; });
    if (it == grouped.end()) {
      Finding first = finding;
      if (first.matches.size() > max_matches) {
        first.matches.resize(max_matches);
      }
      grouped.push_back(std::move(first));
      continue;
    }
    merge_into(*it, finding, max_matches);
  }

  std::stable_sort(grouped.begin(), grouped.end(),
                   [](const Finding &a, const Finding &b) { return a.kind < b.kind; });
  return grouped;
}

ThreatLevel threat_level_of(const std::vector<Finding> &findings) {
  if (findings.empty()) {
    return ThreatLevel::Safe;
  }
  Severity highest = Severity::Low;
  for (const auto &finding : findings) {
    highest = std::max(highest, finding.severity);
  }
  return threat_level_for(highest);
}

ScanResult aggregate(const std::vector<Finding> &findings, const std::size_t max_matches) {
  ScanResult result;
  result.findings = group_by_kind(findings, max_matches);
  result.threat_level = threat_level_of(result.findings);
  for (const auto &finding : result.findings) {
    result.total_findings += finding.count;
    result.summary[finding.kind] = KindSummary{finding.count, finding.severity};
  }
  return result;
}

} // namespace textguard::detect
