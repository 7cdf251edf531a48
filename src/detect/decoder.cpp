#include "textguard/detect/decoder.hpp"

#include "textguard/common/utf8.hpp"
#include "textguard/detect/catalog.hpp"
#include "textguard/detect/characters.hpp"
#include "textguard/detect/homoglyphs.hpp"
#include "textguard/detect/patterns.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <cctype>
#include <deque>
#include <functional>

namespace textguard::detect {

namespace {

constexpr double MIN_PRINTABLE_RATIO = 0.7;
constexpr std::size_t MIN_DECODED_CHARS = 4;
constexpr std::size_t MIN_ROT13_LETTERS = 4;
// Shorter runs of letters only are almost always plain words.
constexpr std::size_t MIN_ALPHA_ONLY_BASE64 = 30;
constexpr std::size_t MAX_MATCH_PREVIEW = 128;
constexpr std::size_t MIN_WORD_DISTINCT_LETTERS = 3;

bool is_base64_char(const char c) {
  const auto uc = static_cast<unsigned char>(c);
  return std::isalnum(uc) != 0 || c == '+' || c == '/';
}

bool is_hex_digit(const char c) { return std::isxdigit(static_cast<unsigned char>(c)) != 0; }

bool is_ascii_letter(const char c) {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

bool is_word_char(const char c) {
  return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

bool is_rot13_run_char(const char c) {
  switch (c) {
  case ' ':
  case ',':
  case '.':
  case '\'':
  case '!':
  case '?':
  case ':':
  case ';':
  case '-':
    return true;
  default:
    return is_ascii_letter(c);
  }
}

bool is_hex_separator(const char c) {
  return c == ' ' || c == '\t' || c == ',' || c == ';' || c == ':' || c == '-';
}

int hex_value(const char c) {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  }
  if (c >= 'A' && c <= 'F') {
    return c - 'A' + 10;
  }
  return -1;
}

bool is_printable(const common::Utf8Char &ch) {
  if (!ch.valid) {
    return false;
  }
  const auto cp = ch.codepoint;
  if (cp == '\t' || cp == '\n' || cp == '\r') {
    return true;
  }
  return cp >= 0x20U && cp != 0x7FU && !(cp >= 0x80U && cp <= 0x9FU);
}

void find_base64_runs(const std::string_view text, const std::size_t min_length,
                      std::vector<Candidate> &out) {
  std::size_t i = 0;
  while (i < text.size()) {
    if (!is_base64_char(text[i])) {
      ++i;
      continue;
    }
    std::size_t j = i;
    bool alpha_only = true;
    while (j < text.size() && is_base64_char(text[j])) {
      alpha_only = alpha_only && is_ascii_letter(text[j]);
      ++j;
    }
    std::size_t k = j;
    while (k < text.size() && k - j < 2 && text[k] == '=') {
      ++k;
    }
    const std::size_t data_length = j - i;
    if (data_length >= min_length && !(alpha_only && data_length < MIN_ALPHA_ONLY_BASE64)) {
      out.push_back(Candidate{i, k});
    }
    i = k;
  }
}

void find_raw_hex_runs(const std::string_view text, const std::size_t min_digits,
                       std::vector<Candidate> &out) {
  std::size_t i = 0;
  while (i < text.size()) {
    if (!is_hex_digit(text[i]) || (i > 0 && is_word_char(text[i - 1]))) {
      ++i;
      continue;
    }
    std::size_t j = i;
    while (j < text.size() && is_hex_digit(text[j])) {
      ++j;
    }
    const bool bounded = j == text.size() || !is_word_char(text[j]);
    if (bounded && j - i >= min_digits) {
      out.push_back(Candidate{i, j});
    }
    i = j;
  }
}

// Length of the escape prefix at `pos` ("0x", "\x" or "%") when two hex digits follow.
std::size_t hex_prefix_at(const std::string_view text, const std::size_t pos) {
  std::size_t prefix = 0;
  if (text[pos] == '%') {
    prefix = 1;
  } else if (pos + 1 < text.size() && (text[pos] == '0' || text[pos] == '\\') &&
             (text[pos + 1] == 'x' || (text[pos] == '0' && text[pos + 1] == 'X'))) {
    prefix = 2;
  } else {
    return 0;
  }
  if (pos + prefix + 1 >= text.size() || !is_hex_digit(text[pos + prefix]) ||
      !is_hex_digit(text[pos + prefix + 1])) {
    return 0;
  }
  return prefix;
}

void find_prefixed_hex_runs(const std::string_view text, const std::size_t min_digits,
                            std::vector<Candidate> &out) {
  std::size_t i = 0;
  while (i < text.size()) {
    if (hex_prefix_at(text, i) == 0 || (text[i] == '0' && i > 0 && is_word_char(text[i - 1]))) {
      ++i;
      continue;
    }
    std::size_t pos = i;
    std::size_t last_end = i;
    std::size_t pairs = 0;
    while (pos < text.size()) {
      const std::size_t prefix = hex_prefix_at(text, pos);
      if (prefix == 0) {
        break;
      }
      const bool wide_token = text[pos] == '0';
      pos += prefix + 2;
      // "0x4142" style tokens may carry more than one pair.
      while (wide_token && pos + 1 < text.size() && is_hex_digit(text[pos]) &&
             is_hex_digit(text[pos + 1])) {
        pos += 2;
        ++pairs;
      }
      ++pairs;
      last_end = pos;
      while (pos < text.size() && is_hex_separator(text[pos])) {
        ++pos;
      }
    }
    if (pairs * 2 >= min_digits) {
      out.push_back(Candidate{i, last_end});
      i = last_end;
    } else {
      i = std::max(last_end, i + 1);
    }
  }
}

void find_rot13_runs(const std::string_view text, std::vector<Candidate> &out) {
  std::size_t i = 0;
  while (i < text.size()) {
    if (!is_ascii_letter(text[i]) || (i > 0 && is_word_char(text[i - 1]))) {
      ++i;
      continue;
    }
    std::size_t j = i;
    std::size_t letters = 0;
    std::size_t last_letter = i;
    while (j < text.size() && is_rot13_run_char(text[j])) {
      if (is_ascii_letter(text[j])) {
        ++letters;
        last_letter = j;
      }
      ++j;
    }
    // A run glued to digits or other word characters is part of a token, not prose.
    const bool bounded = j == text.size() || !is_word_char(text[j]);
    if (bounded && letters >= MIN_ROT13_LETTERS) {
      out.push_back(Candidate{i, last_letter + 1});
    }
    i = std::max(j, i + 1);
  }
}

// A letter run with at least three distinct letters.
bool has_word(const std::string_view decoded) {
  std::size_t i = 0;
  while (i < decoded.size()) {
    if (!is_ascii_letter(decoded[i])) {
      ++i;
      continue;
    }
    std::string distinct;
    while (i < decoded.size() && is_ascii_letter(decoded[i])) {
      const char lower = static_cast<char>(std::tolower(static_cast<unsigned char>(decoded[i])));
      if (distinct.find(lower) == std::string::npos) {
        distinct.push_back(lower);
      }
      ++i;
    }
    if (distinct.size() >= MIN_WORD_DISTINCT_LETTERS) {
      return true;
    }
  }
  return false;
}

std::vector<std::string_view> words_of(const std::string &lowered) {
  std::vector<std::string_view> words;
  const std::string_view view(lowered);
  std::size_t i = 0;
  while (i < view.size()) {
    if (!is_ascii_letter(view[i])) {
      ++i;
      continue;
    }
    std::size_t j = i;
    while (j < view.size() && is_ascii_letter(view[j])) {
      ++j;
    }
    words.push_back(view.substr(i, j - i));
    i = j;
  }
  return words;
}

int suspicion_score(const std::string_view text) {
  std::string lowered(text);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
  const auto &vocabulary = suspicious_words();
  int score = 0;
  for (const auto word : words_of(lowered)) {
    if (std::find(vocabulary.begin(), vocabulary.end(), word) != vocabulary.end()) {
      ++score;
    }
  }
  if (contains_instruction_injection(text)) {
    score += 2;
  }
  return score;
}

std::optional<std::string> try_decode(const Codec codec, const std::string_view candidate) {
  switch (codec) {
  case Codec::Base64:
    return decode_base64(candidate);
  case Codec::Hex:
    return decode_hex(candidate);
  case Codec::Rot13:
    return decode_rot13(candidate);
  }
  return std::nullopt;
}

bool within_size_bound(const Codec codec, const std::string_view candidate,
                       const std::string &decoded) {
  switch (codec) {
  case Codec::Base64:
    return decoded.size() <= (candidate.size() + 3) / 4 * 3;
  case Codec::Hex:
    return decoded.size() <= candidate.size() / 2;
  case Codec::Rot13:
    return decoded.size() == candidate.size();
  }
  return false;
}

std::string match_preview(const std::string_view candidate) {
  if (candidate.size() <= MAX_MATCH_PREVIEW) {
    return std::string(candidate);
  }
  return std::string(candidate.substr(0, MAX_MATCH_PREVIEW)) + "...";
}

Finding payload_finding(const Codec codec, const std::string_view candidate,
                        const std::string &decoded, const std::uint32_t depth,
                        const std::size_t max_matches) {
  Detection inner = classify_characters(decoded);
  inner.append(detect_homoglyphs(decoded));
  inner.append(match_patterns(decoded, max_matches));

  const auto kind = payload_kind(codec);
  const auto &info = technique_info(kind);
  Finding finding;
  finding.kind = kind;
  finding.description = info.description;
  finding.severity = std::max(Severity::High, info.severity);
  finding.hidden_content = decoded;
  finding.depth = depth;
  finding.matches.push_back(match_preview(candidate));
  for (const auto &inner_finding : inner.findings) {
    finding.severity = std::max(finding.severity, inner_finding.severity);
    if (std::find(finding.inner_kinds.begin(), finding.inner_kinds.end(), inner_finding.kind) ==
        finding.inner_kinds.end()) {
      finding.inner_kinds.push_back(inner_finding.kind);
    }
  }
  return finding;
}

struct WorkItem {
  std::string text;
  std::uint32_t depth = 0;
  /// Hashes of this text and every layer that encoded it.
  std::vector<std::size_t> lineage;
};

} // namespace

FindingKind payload_kind(const Codec codec) {
  switch (codec) {
  case Codec::Base64:
    return FindingKind::Base64Payload;
  case Codec::Hex:
    return FindingKind::HexPayload;
  case Codec::Rot13:
    return FindingKind::Rot13Payload;
  }
  return FindingKind::Base64Payload;
}

std::vector<Candidate> find_candidates(const std::string_view text, const DetectOptions &options) {
  std::vector<Candidate> candidates;
  find_base64_runs(text, options.min_base64_length, candidates);
  find_raw_hex_runs(text, options.min_hex_digits, candidates);
  find_prefixed_hex_runs(text, options.min_hex_digits, candidates);
  find_rot13_runs(text, candidates);

  std::sort(candidates.begin(), candidates.end(), [](const Candidate &a, const Candidate &b) {
    if (a.begin != b.begin) {
      return a.begin < b.begin;
    }
    return a.end > b.end;
  });
  candidates.erase(std::unique(candidates.begin(), candidates.end(),
                               [](const Candidate &a, const Candidate &b) {
                                 return a.begin == b.begin && a.end == b.end;
                               }),
                   candidates.end());
  return candidates;
}

std::optional<std::string> decode_base64(const std::string_view candidate) {
  const std::size_t data_length = std::min(candidate.find('='), candidate.size());
  const std::size_t padding = candidate.size() - data_length;
  if (data_length == 0 || padding > 2) {
    return std::nullopt;
  }
  for (std::size_t i = 0; i < candidate.size(); ++i) {
    const bool valid = i < data_length ? is_base64_char(candidate[i]) : candidate[i] == '=';
    if (!valid) {
      return std::nullopt;
    }
  }
  if (data_length % 4 == 1 || (padding > 0 && candidate.size() % 4 != 0)) {
    return std::nullopt;
  }

  const std::size_t fill = (4 - data_length % 4) % 4;
  std::string padded(candidate.substr(0, data_length));
  padded.append(fill, '=');

  std::vector<unsigned char> decoded(padded.size() / 4 * 3);
  const int len = EVP_DecodeBlock(decoded.data(),
                                  reinterpret_cast<const unsigned char *>(padded.data()),
                                  static_cast<int>(padded.size()));
  if (len < 0 || static_cast<std::size_t>(len) < fill) {
    return std::nullopt;
  }
  std::string output(decoded.begin(), decoded.begin() + (len - static_cast<int>(fill)));
  if (!looks_like_text(output)) {
    return std::nullopt;
  }
  return output;
}

std::optional<std::string> decode_hex(const std::string_view candidate) {
  std::string digits;
  digits.reserve(candidate.size());
  std::size_t i = 0;
  while (i < candidate.size()) {
    const char c = candidate[i];
    if (c == '%') {
      ++i;
    } else if (i + 1 < candidate.size() && (c == '\\' || c == '0') &&
               (candidate[i + 1] == 'x' || (c == '0' && candidate[i + 1] == 'X'))) {
      i += 2;
    } else if (is_hex_separator(c)) {
      ++i;
    } else if (is_hex_digit(c)) {
      digits.push_back(c);
      ++i;
    } else {
      return std::nullopt;
    }
  }
  if (digits.empty() || digits.size() % 2 != 0) {
    return std::nullopt;
  }
  // Bare digit runs must also decode to a word.
  const bool bare = digits.size() == candidate.size();

  std::string output;
  output.reserve(digits.size() / 2);
  for (std::size_t pos = 0; pos < digits.size(); pos += 2) {
    output.push_back(static_cast<char>(hex_value(digits[pos]) * 16 + hex_value(digits[pos + 1])));
  }
  if (!looks_like_text(output) || (bare && !has_word(output))) {
    return std::nullopt;
  }
  return output;
}

std::string rot13(const std::string_view text) {
  std::string output(text);
  for (auto &c : output) {
    if (c >= 'a' && c <= 'z') {
      c = static_cast<char>('a' + (c - 'a' + 13) % 26);
    } else if (c >= 'A' && c <= 'Z') {
      c = static_cast<char>('A' + (c - 'A' + 13) % 26);
    }
  }
  return output;
}

std::optional<std::string> decode_rot13(const std::string_view candidate) {
  std::string decoded = rot13(candidate);
  if (decoded == candidate) {
    return std::nullopt;
  }
  const int after = suspicion_score(decoded);
  if (after == 0 || after <= suspicion_score(candidate)) {
    return std::nullopt;
  }
  return decoded;
}

bool looks_like_text(const std::string_view decoded) {
  std::size_t total = 0;
  std::size_t printable = 0;
  std::size_t index = 0;
  common::Utf8Char ch;
  while (common::next_utf8_char(decoded, index, ch)) {
    ++total;
    if (is_printable(ch)) {
      ++printable;
    }
  }
  if (total < MIN_DECODED_CHARS) {
    return false;
  }
  return static_cast<double>(printable) >= MIN_PRINTABLE_RATIO * static_cast<double>(total);
}

Detection decode_payloads(const std::string_view text, const DetectOptions &options) {
  Detection detection;
  if (text.empty() || options.max_decode_depth == 0) {
    return detection;
  }

  static constexpr Codec CODEC_ORDER[] = {Codec::Base64, Codec::Hex, Codec::Rot13};
  const std::hash<std::string_view> hasher;

  std::deque<WorkItem> work;
  work.push_back(WorkItem{std::string(text), 0, {hasher(text)}});

  while (!work.empty()) {
    WorkItem item = std::move(work.front());
    work.pop_front();
    if (item.depth >= options.max_decode_depth) {
      continue;
    }

    const std::string_view current(item.text);
    std::size_t consumed_until = 0;
    common::CodepointCounter positions(current);
    for (const auto &candidate : find_candidates(current, options)) {
      if (candidate.begin < consumed_until) {
        continue;
      }
      const auto encoded = current.substr(candidate.begin, candidate.end - candidate.begin);

      for (const auto codec : CODEC_ORDER) {
        auto decoded = try_decode(codec, encoded);
        if (!decoded.has_value() || !within_size_bound(codec, encoded, *decoded)) {
          continue;
        }
        // A layer that decodes back to itself or to an enclosing layer makes no progress.
        const auto decoded_hash = hasher(*decoded);
        if (*decoded == encoded || std::find(item.lineage.begin(), item.lineage.end(),
                                             decoded_hash) != item.lineage.end()) {
          continue;
        }

        Finding finding =
            payload_finding(codec, encoded, *decoded, item.depth + 1, options.max_matches);
        if (item.depth == 0) {
          record_position(finding, positions.at(candidate.begin));
          detection.spans.push_back(Span{.begin = candidate.begin, .end = candidate.end});
        }
        detection.findings.push_back(std::move(finding));
        consumed_until = candidate.end;

        auto lineage = item.lineage;
        lineage.push_back(decoded_hash);
        work.push_back(WorkItem{std::move(*decoded), item.depth + 1, std::move(lineage)});
        break;
      }
    }
  }

  return detection;
}

} // namespace textguard::detect
