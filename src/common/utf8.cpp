#include "textguard/common/utf8.hpp"

#include <iomanip>
#include <sstream>

namespace textguard::common {

namespace {

void mark_invalid(const std::size_t index, Utf8Char &out) {
  out.codepoint = REPLACEMENT_CODEPOINT;
  out.offset = index;
  out.length = 1;
  out.valid = false;
}

} // namespace

bool next_utf8_char(const std::string_view text, std::size_t &index, Utf8Char &out) {
  if (index >= text.size()) {
    return false;
  }

  const unsigned char lead = static_cast<unsigned char>(text[index]);
  if (lead < 0x80U) {
    out.codepoint = lead;
    out.offset = index;
    out.length = 1;
    out.valid = true;
    ++index;
    return true;
  }

  std::size_t extra = 0;
  std::uint32_t value = 0;
  std::uint32_t minimum = 0;
  if ((lead & 0xE0U) == 0xC0U) {
    extra = 1;
    value = lead & 0x1FU;
    minimum = 0x80U;
  } else if ((lead & 0xF0U) == 0xE0U) {
    extra = 2;
    value = lead & 0x0FU;
    minimum = 0x800U;
  } else if ((lead & 0xF8U) == 0xF0U) {
    extra = 3;
    value = lead & 0x07U;
    minimum = 0x10000U;
  } else {
    mark_invalid(index, out);
    ++index;
    return true;
  }

  if (index + extra >= text.size()) {
    mark_invalid(index, out);
    ++index;
    return true;
  }

  for (std::size_t i = 1; i <= extra; ++i) {
    const unsigned char cont = static_cast<unsigned char>(text[index + i]);
    if ((cont & 0xC0U) != 0x80U) {
      mark_invalid(index, out);
      ++index;
      return true;
    }
    value = (value << 6U) | static_cast<std::uint32_t>(cont & 0x3FU);
  }

  // Overlong forms, UTF-16 surrogates and values past U+10FFFF are not text.
  if (value < minimum || value > 0x10FFFFU || (value >= 0xD800U && value <= 0xDFFFU)) {
    mark_invalid(index, out);
    ++index;
    return true;
  }

  out.codepoint = value;
  out.offset = index;
  out.length = extra + 1;
  out.valid = true;
  index += extra + 1;
  return true;
}

std::string format_codepoint(const std::uint32_t codepoint) {
  std::ostringstream stream;
  stream << "U+" << std::uppercase << std::hex << std::setfill('0') << std::setw(4)
         << codepoint;
  return stream.str();
}

std::size_t utf8_length(const std::string_view text) {
  std::size_t count = 0;
  std::size_t index = 0;
  Utf8Char ch;
  while (next_utf8_char(text, index, ch)) {
    ++count;
  }
  return count;
}

std::size_t CodepointCounter::at(const std::size_t byte_offset) {
  if (byte_offset > byte_) {
    position_ += utf8_length(text_.substr(byte_, byte_offset - byte_));
    byte_ = byte_offset;
  }
  return position_;
}

} // namespace textguard::common
