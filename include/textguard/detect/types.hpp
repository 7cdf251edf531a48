#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace textguard::detect {

/// Vocabulary of techniques. Declaration order is the detection phase order.
enum class FindingKind {
  ZeroWidth,
  BidiOverride,
  ControlCharacter,
  AsciiSmuggling,
  Homoglyph,
  InstructionInjection,
  DelimiterInjection,
  Base64Payload,
  HexPayload,
  Rot13Payload,
};

inline constexpr std::size_t FINDING_KIND_COUNT = 10;

/// A finding lists at most this many occurrence positions.
inline constexpr std::size_t MAX_POSITIONS = 10;

/// Ordered: Low < Medium < High < Critical.
enum class Severity { Low, Medium, High, Critical };

enum class ThreatLevel { Safe, Low, Medium, High, Critical };

[[nodiscard]] std::string_view kind_name(FindingKind kind);
[[nodiscard]] std::string_view severity_name(Severity severity);
[[nodiscard]] std::string_view threat_level_name(ThreatLevel level);
[[nodiscard]] std::optional<ThreatLevel> parse_threat_level(std::string_view name);
[[nodiscard]] ThreatLevel threat_level_for(Severity severity);

struct Finding {
  FindingKind kind = FindingKind::ZeroWidth;
  std::string description;
  std::uint64_t count = 1;
  Severity severity = Severity::Low;

  std::optional<std::string> character;
  std::optional<std::string> unicode;
  /// Catalog name of the first offending codepoint or of the matched phrase family.
  std::optional<std::string> name;
  std::optional<std::string> looks_like;
  std::vector<std::string> matches;
  std::optional<std::string> hidden_content;
  /// Codepoint offsets of the first occurrences in the scanned text, ascending.
  std::vector<std::size_t> positions;

  /// Decode layer (1-based) for payload findings.
  std::optional<std::uint32_t> depth;
  /// Techniques found inside a decoded payload.
  std::vector<FindingKind> inner_kinds;
};

inline void record_position(Finding &finding, const std::size_t position) {
  if (finding.positions.size() < MAX_POSITIONS) {
    finding.positions.push_back(position);
  }
}

struct KindSummary {
  std::uint64_t count = 0;
  Severity severity = Severity::Low;
};

struct ScanResult {
  std::string id;
  ThreatLevel threat_level = ThreatLevel::Safe;
  std::uint64_t total_findings = 0;
  std::size_t original_length = 0;
  std::vector<Finding> findings;
  std::map<FindingKind, KindSummary> summary;
};

struct RemovedDetail {
  FindingKind kind = FindingKind::ZeroWidth;
  std::uint64_t count = 0;
};

struct CleanResult {
  std::string id;
  std::string cleaned_text;
  std::size_t original_length = 0;
  std::size_t cleaned_length = 0;
  std::uint64_t characters_removed = 0;
  std::vector<RemovedDetail> removed_details;
  ThreatLevel threat_level_before = ThreatLevel::Safe;
};

/// Byte range of the source text that a finding covers. An empty replacement deletes it.
struct Span {
  std::size_t begin = 0;
  std::size_t end = 0;
  std::string replacement;
  /// Collapse the whitespace left behind when the span is deleted.
  bool collapse_whitespace = false;
};

/// Output of one detector pass: findings for reporting, spans for cleaning.
struct Detection {
  std::vector<Finding> findings;
  std::vector<Span> spans;

  void append(Detection other);
};

struct DetectOptions {
  std::uint32_t max_decode_depth = 5;
  std::size_t min_base64_length = 16;
  std::size_t min_hex_digits = 16;
  std::size_t max_matches = 5;
};

} // namespace textguard::detect
