#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace textguard::common {

inline constexpr std::uint32_t REPLACEMENT_CODEPOINT = 0xFFFDU;

/// One decoded codepoint and the byte range it occupies in the source text.
struct Utf8Char {
  std::uint32_t codepoint = 0;
  std::size_t offset = 0;
  std::size_t length = 0;
  /// False when the bytes at `offset` were not well-formed UTF-8; `codepoint` is then
  /// U+FFFD and `length` is 1.
  bool valid = true;
};

/// Decodes the codepoint starting at `index` and advances `index` past it.
/// Returns false only at end of input; malformed bytes are reported as invalid chars.
bool next_utf8_char(std::string_view text, std::size_t &index, Utf8Char &out);

/// "U+200B" style label, at least four hex digits.
[[nodiscard]] std::string format_codepoint(std::uint32_t codepoint);

/// Length in codepoints; each malformed byte counts as one.
[[nodiscard]] std::size_t utf8_length(std::string_view text);

/// Converts byte offsets into codepoint offsets. Queries must not decrease; each call
/// only decodes the bytes since the previous one.
class CodepointCounter {
public:
  explicit CodepointCounter(std::string_view text) : text_(text) {}

  [[nodiscard]] std::size_t at(std::size_t byte_offset);

private:
  std::string_view text_;
  std::size_t byte_ = 0;
  std::size_t position_ = 0;
};

} // namespace textguard::common
