#pragma once

#include <string>
#include <string_view>

namespace textguard::common {

/// Escape a string for embedding inside a JSON string literal. The output is pure ASCII:
/// every non-ASCII codepoint becomes a \uXXXX escape (surrogate pairs above U+FFFF) so
/// invisible characters stay visible in reports. Malformed UTF-8 bytes become U+FFFD.
[[nodiscard]] std::string json_escape(std::string_view value);

/// `"escaped"` including the surrounding quotes.
[[nodiscard]] std::string json_string(std::string_view value);

} // namespace textguard::common
