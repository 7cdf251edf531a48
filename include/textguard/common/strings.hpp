#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace textguard::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] std::vector<std::string> split(const std::string &value, char delimiter);
[[nodiscard]] std::string join(const std::vector<std::string> &parts, const std::string &sep);
[[nodiscard]] bool is_ascii_space(char ch);

} // namespace textguard::common
