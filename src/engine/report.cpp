#include "textguard/engine/report.hpp"

#include "textguard/common/json_util.hpp"

#include <optional>
#include <sstream>

namespace textguard::engine {

namespace {

void write_optional(std::ostringstream &out, const char *key,
                    const std::optional<std::string> &value) {
  if (value.has_value()) {
    out << ",\"" << key << "\":" << common::json_string(*value);
  }
}

template <typename T, typename Writer>
void write_array(std::ostringstream &out, const std::vector<T> &items, Writer writer) {
  out << '[';
  for (std::size_t i = 0; i < items.size(); ++i) {
    if (i > 0) {
      out << ',';
    }
    writer(items[i]);
  }
  out << ']';
}

} // namespace

std::string finding_json(const detect::Finding &finding) {
  std::ostringstream out;
  out << "{\"kind\":" << common::json_string(detect::kind_name(finding.kind))
      << ",\"description\":" << common::json_string(finding.description)
      << ",\"count\":" << finding.count
      << ",\"severity\":" << common::json_string(detect::severity_name(finding.severity));
  write_optional(out, "character", finding.character);
  write_optional(out, "unicode", finding.unicode);
  write_optional(out, "name", finding.name);
  write_optional(out, "looks_like", finding.looks_like);
  if (!finding.matches.empty()) {
    out << ",\"matches\":";
    write_array(out, finding.matches,
                [&out](const std::string &match) { out << common::json_string(match); });
  }
  write_optional(out, "hidden_content", finding.hidden_content);
  if (!finding.positions.empty()) {
    out << ",\"positions\":";
    write_array(out, finding.positions, [&out](const std::size_t position) { out << position; });
  }
  if (finding.depth.has_value()) {
    out << ",\"depth\":" << *finding.depth;
  }
  if (!finding.inner_kinds.empty()) {
    out << ",\"inner_kinds\":";
    write_array(out, finding.inner_kinds, [&out](const detect::FindingKind kind) {
      out << common::json_string(detect::kind_name(kind));
    });
  }
  out << '}';
  return out.str();
}

std::string scan_result_json(const detect::ScanResult &result) {
  std::ostringstream out;
  out << "{\"id\":" << common::json_string(result.id)
      << ",\"threat_level\":" << common::json_string(detect::threat_level_name(result.threat_level))
      << ",\"total_findings\":" << result.total_findings
      << ",\"original_length\":" << result.original_length << ",\"findings\":";
  write_array(out, result.findings,
              [&out](const detect::Finding &finding) { out << finding_json(finding); });

  out << ",\"summary\":{";
  bool first = true;
  for (const auto &[kind, summary] : result.summary) {
    if (!first) {
      out << ',';
    }
    first = false;
    out << common::json_string(detect::kind_name(kind)) << ":{\"count\":" << summary.count
        << ",\"severity\":" << common::json_string(detect::severity_name(summary.severity))
        << '}';
  }
  out << "}}";
  return out.str();
}

std::string clean_result_json(const detect::CleanResult &result) {
  std::ostringstream out;
  out << "{\"id\":" << common::json_string(result.id)
      << ",\"cleaned_text\":" << common::json_string(result.cleaned_text)
      << ",\"original_length\":" << result.original_length
      << ",\"cleaned_length\":" << result.cleaned_length
      << ",\"characters_removed\":" << result.characters_removed << ",\"removed_details\":";
  write_array(out, result.removed_details, [&out](const detect::RemovedDetail &detail) {
    out << "{\"kind\":" << common::json_string(detect::kind_name(detail.kind))
        << ",\"count\":" << detail.count << '}';
  });
  out << ",\"threat_level_before\":"
      << common::json_string(detect::threat_level_name(result.threat_level_before)) << '}';
  return out.str();
}

std::string techniques_json(const std::vector<detect::TechniqueInfo> &techniques) {
  std::ostringstream out;
  write_array(out, techniques, [&out](const detect::TechniqueInfo &info) {
    out << "{\"kind\":" << common::json_string(detect::kind_name(info.kind))
        << ",\"name\":" << common::json_string(info.title)
        << ",\"description\":" << common::json_string(info.description)
        << ",\"severity\":" << common::json_string(detect::severity_name(info.severity))
        << ",\"examples\":";
    write_array(out, info.examples,
                [&out](const char *example) { out << common::json_string(example); });
    out << '}';
  });
  return out.str();
}

} // namespace textguard::engine
