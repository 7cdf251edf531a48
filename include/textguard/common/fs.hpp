#pragma once

#include "textguard/common/result.hpp"

#include <filesystem>
#include <string>

namespace textguard::common {

[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path);
[[nodiscard]] std::string expand_path(std::string value);
[[nodiscard]] Result<std::string> read_text_file(const std::filesystem::path &path);

} // namespace textguard::common
