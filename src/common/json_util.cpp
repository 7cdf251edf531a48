#include "textguard/common/json_util.hpp"

#include "textguard/common/utf8.hpp"

#include <cstdio>

namespace textguard::common {

namespace {

void append_unicode_escape(std::string &out, const std::uint32_t unit) {
  char buffer[8];
  std::snprintf(buffer, sizeof(buffer), "\\u%04x", static_cast<unsigned>(unit & 0xFFFFU));
  out += buffer;
}

} // namespace

std::string json_escape(const std::string_view value) {
  std::string escaped;
  escaped.reserve(value.size() + 8);

  std::size_t index = 0;
  Utf8Char ch;
  while (next_utf8_char(value, index, ch)) {
    const std::uint32_t cp = ch.codepoint;
    switch (cp) {
    case '"':
      escaped += "\\\"";
      continue;
    case '\\':
      escaped += "\\\\";
      continue;
    case '\n':
      escaped += "\\n";
      continue;
    case '\r':
      escaped += "\\r";
      continue;
    case '\t':
      escaped += "\\t";
      continue;
    default:
      break;
    }

    if (cp >= 0x20U && cp < 0x7FU) {
      escaped.push_back(static_cast<char>(cp));
    } else if (cp < 0x10000U) {
      append_unicode_escape(escaped, cp);
    } else {
      const std::uint32_t v = cp - 0x10000U;
      append_unicode_escape(escaped, 0xD800U + (v >> 10U));
      append_unicode_escape(escaped, 0xDC00U + (v & 0x3FFU));
    }
  }
  return escaped;
}

std::string json_string(const std::string_view value) {
  return "\"" + json_escape(value) + "\"";
}

} // namespace textguard::common
