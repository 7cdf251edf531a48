#pragma once

#include "textguard/common/result.hpp"
#include "textguard/config/schema.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace textguard::config {

[[nodiscard]] common::Result<std::filesystem::path> config_dir();
[[nodiscard]] common::Result<std::filesystem::path> config_path();
[[nodiscard]] bool config_exists();
/// Pins the config file path; `std::nullopt` falls back to TEXTGUARD_CONFIG_PATH, then
/// ~/.textguard/config.toml.
void set_config_path_override(std::optional<std::filesystem::path> path);
[[nodiscard]] std::optional<std::filesystem::path> config_path_override();

[[nodiscard]] common::Result<Config> parse_config(const std::string &toml);
[[nodiscard]] std::string render_config(const Config &config);

[[nodiscard]] common::Result<Config> load_config();
[[nodiscard]] common::Status save_config(const Config &config);

/// Errors for out-of-range values, warnings for legal but risky ones.
[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);

void apply_env_overrides(Config &config);

/// Read/write a single dotted key (`scanner.max_decode_depth`) as text.
[[nodiscard]] common::Result<std::string> get_config_value(const Config &config,
                                                           const std::string &key);
[[nodiscard]] common::Status set_config_value(Config &config, const std::string &key,
                                              const std::string &value);

} // namespace textguard::config
