#include "textguard/detect/types.hpp"

#include <array>
#include <iterator>
#include <utility>

namespace textguard::detect {

namespace {

constexpr std::array<std::pair<FindingKind, std::string_view>, FINDING_KIND_COUNT> kKindNames = {{
    {FindingKind::ZeroWidth, "zero_width"},
    {FindingKind::BidiOverride, "bidi_override"},
    {FindingKind::ControlCharacter, "control_character"},
    {FindingKind::AsciiSmuggling, "ascii_smuggling"},
    {FindingKind::Homoglyph, "homoglyph"},
    {FindingKind::InstructionInjection, "instruction_injection"},
    {FindingKind::DelimiterInjection, "delimiter_injection"},
    {FindingKind::Base64Payload, "base64_payload"},
    {FindingKind::HexPayload, "hex_payload"},
    {FindingKind::Rot13Payload, "rot13_payload"},
}};

constexpr std::array<std::pair<ThreatLevel, std::string_view>, 5> kThreatNames = {{
    {ThreatLevel::Safe, "safe"},
    {ThreatLevel::Low, "low"},
    {ThreatLevel::Medium, "medium"},
    {ThreatLevel::High, "high"},
    {ThreatLevel::Critical, "critical"},
}};

} // namespace

std::string_view kind_name(const FindingKind kind) {
  for (const auto &[value, name] : kKindNames) {
    if (value == kind) {
      return name;
    }
  }
  return "unknown";
}

std::string_view severity_name(const Severity severity) {
  switch (severity) {
  case Severity::Low:
    return "low";
  case Severity::Medium:
    return "medium";
  case Severity::High:
    return "high";
  case Severity::Critical:
    return "critical";
  }
  return "low";
}

std::string_view threat_level_name(const ThreatLevel level) {
  for (const auto &[value, name] : kThreatNames) {
    if (value == level) {
      return name;
    }
  }
  return "safe";
}

std::optional<ThreatLevel> parse_threat_level(const std::string_view name) {
  for (const auto &[value, label] : kThreatNames) {
    if (label == name) {
      return value;
    }
  }
  return std::nullopt;
}

ThreatLevel threat_level_for(const Severity severity) {
  switch (severity) {
  case Severity::Low:
    return ThreatLevel::Low;
  case Severity::Medium:
    return ThreatLevel::Medium;
  case Severity::High:
    return ThreatLevel::High;
  case Severity::Critical:
    return ThreatLevel::Critical;
  }
  return ThreatLevel::Low;
}

void Detection::append(Detection other) {
  findings.insert(findings.end(), std::make_move_iterator(other.findings.begin()),
                  std::make_move_iterator(other.findings.end()));
  spans.insert(spans.end(), std::make_move_iterator(other.spans.begin()),
               std::make_move_iterator(other.spans.end()));
}

} // namespace textguard::detect
