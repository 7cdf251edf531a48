#include "textguard/config/config.hpp"

#include "textguard/common/fs.hpp"
#include "textguard/common/strings.hpp"
#include "textguard/common/toml.hpp"
#include "textguard/observability/factory.hpp"

#include <array>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <functional>
#include <sstream>

namespace textguard::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".textguard";
constexpr const char *CONFIG_FILENAME = "config.toml";
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return std::filesystem::path(common::expand_path(g_config_path_override->string()));
  }
  if (const char *env = std::getenv("TEXTGUARD_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::optional<std::uint64_t> parse_u64(const std::string &raw) {
  const std::string value = common::trim(raw);
  std::uint64_t parsed = 0;
  const auto *first = value.data();
  const auto *last = first + value.size();
  auto [ptr, ec] = std::from_chars(first, last, parsed);
  if (value.empty() || ec != std::errc() || ptr != last) {
    return std::nullopt;
  }
  return parsed;
}

struct NumericKey {
  const char *name;
  std::function<std::uint64_t(const Config &)> get;
  std::function<void(Config &, std::uint64_t)> set;
};

const std::array<NumericKey, 5> &numeric_keys() {
  static const std::array<NumericKey, 5> keys = {
      NumericKey{"scanner.max_input_bytes",
                 [](const Config &c) { return static_cast<std::uint64_t>(c.scanner.max_input_bytes); },
                 [](Config &c, std::uint64_t v) { c.scanner.max_input_bytes = static_cast<std::size_t>(v); }},
      NumericKey{"scanner.max_decode_depth",
                 [](const Config &c) { return static_cast<std::uint64_t>(c.scanner.max_decode_depth); },
                 [](Config &c, std::uint64_t v) { c.scanner.max_decode_depth = static_cast<std::uint32_t>(v); }},
      NumericKey{"scanner.min_base64_length",
                 [](const Config &c) { return static_cast<std::uint64_t>(c.scanner.min_base64_length); },
                 [](Config &c, std::uint64_t v) { c.scanner.min_base64_length = static_cast<std::size_t>(v); }},
      NumericKey{"scanner.min_hex_digits",
                 [](const Config &c) { return static_cast<std::uint64_t>(c.scanner.min_hex_digits); },
                 [](Config &c, std::uint64_t v) { c.scanner.min_hex_digits = static_cast<std::size_t>(v); }},
      NumericKey{"scanner.max_matches",
                 [](const Config &c) { return static_cast<std::uint64_t>(c.scanner.max_matches); },
                 [](Config &c, std::uint64_t v) { c.scanner.max_matches = static_cast<std::size_t>(v); }},
  };
  return keys;
}

const NumericKey *find_numeric_key(const std::string &name) {
  for (const auto &key : numeric_keys()) {
    if (name == key.name) {
      return &key;
    }
  }
  return nullptr;
}

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path);
    }
    auto parent = override_path->parent_path();
    if (parent.empty()) {
      parent = std::filesystem::current_path(ec);
      if (ec) {
        return common::Result<std::filesystem::path>::failure(
            "unable to resolve current directory");
      }
    }
    return common::Result<std::filesystem::path>::success(parent);
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.error());
  }
  return common::Result<std::filesystem::path>::success(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path / CONFIG_FILENAME);
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto cfg_dir = config_dir();
  if (!cfg_dir.ok()) {
    return common::Result<std::filesystem::path>::failure(cfg_dir.error());
  }
  return common::Result<std::filesystem::path>::success(cfg_dir.value() / CONFIG_FILENAME);
}

bool config_exists() {
  const auto path = config_path();
  std::error_code ec;
  return path.ok() && std::filesystem::exists(path.value(), ec);
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

std::optional<std::filesystem::path> config_path_override() {
  return resolved_config_path_override();
}

common::Result<Config> parse_config(const std::string &toml) {
  auto doc = common::parse_toml(toml);
  if (!doc.ok()) {
    return common::Result<Config>::failure(doc.error(), doc.code());
  }

  Config config;
  for (const auto &key : numeric_keys()) {
    auto value = doc.value().get_u64(key.name, key.get(config));
    if (!value.ok()) {
      return common::Result<Config>::failure(value.error(), value.code());
    }
    key.set(config, value.value());
  }
  config.observability.backend =
      doc.value().get_string("observability.backend", config.observability.backend);

  return common::Result<Config>::success(std::move(config));
}

std::string render_config(const Config &config) {
  std::ostringstream out;
  out << "[scanner]\n";
  for (const auto &key : numeric_keys()) {
    const std::string name = key.name;
    out << name.substr(name.find('.') + 1) << " = " << key.get(config) << "\n";
  }
  out << "\n[observability]\n";
  out << "backend = " << common::quote_toml_string(config.observability.backend) << "\n";
  return out.str();
}

void apply_env_overrides(Config &config) {
  if (const char *raw = std::getenv("TEXTGUARD_MAX_INPUT_BYTES"); raw != nullptr && *raw) {
    if (const auto value = parse_u64(raw); value.has_value()) {
      config.scanner.max_input_bytes = static_cast<std::size_t>(*value);
    }
  }

  if (const char *raw = std::getenv("TEXTGUARD_MAX_DECODE_DEPTH"); raw != nullptr && *raw) {
    if (const auto value = parse_u64(raw); value.has_value()) {
      config.scanner.max_decode_depth = static_cast<std::uint32_t>(*value);
    }
  }

  if (const char *backend = std::getenv("TEXTGUARD_OBSERVABILITY");
      backend != nullptr && *backend) {
    config.observability.backend = backend;
  }
}

common::Result<Config> load_config() {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Result<Config>::failure(cfg_path_result.error());
  }

  const auto path = cfg_path_result.value();
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    Config config;
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  auto content = common::read_text_file(path);
  if (!content.ok()) {
    return common::Result<Config>::failure(content.error(), content.code());
  }

  auto parsed = parse_config(content.value());
  if (!parsed.ok()) {
    return common::Result<Config>::failure(path.string() + ": " + parsed.error(),
                                           parsed.code());
  }

  Config config = std::move(parsed.value());
  apply_env_overrides(config);
  return common::Result<Config>::success(std::move(config));
}

common::Status save_config(const Config &config) {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Status::error(cfg_path_result.error());
  }
  const auto path = cfg_path_result.value();

  if (path.has_parent_path()) {
    auto dir = common::ensure_dir(path.parent_path());
    if (!dir.ok()) {
      return common::Status::error(dir.error());
    }
  }

  const auto tmp_path = path.string() + ".tmp";
  std::ofstream file(tmp_path, std::ios::trunc);
  if (!file) {
    return common::Status::error("Unable to write temporary config file: " + tmp_path);
  }
  file << render_config(config);
  file.close();
  if (!file) {
    return common::Status::error("Failed writing temporary config file");
  }

  std::error_code ec;
  std::filesystem::rename(tmp_path, path, ec);
  if (ec) {
    return common::Status::error("Failed to atomically replace config: " + ec.message());
  }

  return common::Status::success();
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  using ValidationResult = common::Result<std::vector<std::string>>;
  std::vector<std::string> warnings;

  if (config.scanner.max_decode_depth == 0 ||
      config.scanner.max_decode_depth > MAX_DECODE_DEPTH_LIMIT) {
    return ValidationResult::failure("scanner.max_decode_depth must be between 1 and " +
                                         std::to_string(MAX_DECODE_DEPTH_LIMIT),
                                     common::ErrorCode::InvalidConfig);
  }

  if (config.scanner.min_base64_length < 8) {
    return ValidationResult::failure("scanner.min_base64_length must be at least 8",
                                     common::ErrorCode::InvalidConfig);
  }

  if (config.scanner.min_hex_digits < 8 || config.scanner.min_hex_digits % 2 != 0) {
    return ValidationResult::failure("scanner.min_hex_digits must be an even number >= 8",
                                     common::ErrorCode::InvalidConfig);
  }

  if (config.scanner.max_matches == 0) {
    return ValidationResult::failure("scanner.max_matches must be > 0",
                                     common::ErrorCode::InvalidConfig);
  }

  if (config.scanner.max_input_bytes == 0) {
    warnings.push_back("scanner.max_input_bytes is 0; input size is not limited");
  } else if (config.scanner.max_input_bytes > 10'000'000) {
    warnings.push_back("scanner.max_input_bytes above 10MB makes scans slow");
  }

  for (const auto &backend : observability::backend_names(config.observability.backend)) {
    if (!observability::is_known_backend(backend)) {
      return ValidationResult::failure("Invalid observability.backend: " +
                                           config.observability.backend,
                                       common::ErrorCode::InvalidConfig);
    }
  }

  return ValidationResult::success(std::move(warnings));
}

common::Result<std::string> get_config_value(const Config &config, const std::string &key) {
  if (const auto *numeric = find_numeric_key(key); numeric != nullptr) {
    return common::Result<std::string>::success(std::to_string(numeric->get(config)));
  }
  if (key == "observability.backend") {
    return common::Result<std::string>::success(config.observability.backend);
  }
  return common::Result<std::string>::failure("unknown key: " + key, common::ErrorCode::Usage);
}

common::Status set_config_value(Config &config, const std::string &key, const std::string &value) {
  if (const auto *numeric = find_numeric_key(key); numeric != nullptr) {
    const auto parsed = parse_u64(value);
    if (!parsed.has_value()) {
      return common::Status::error(key + " must be a non-negative integer",
                                   common::ErrorCode::InvalidConfig);
    }
    numeric->set(config, *parsed);
    return common::Status::success();
  }
  if (key == "observability.backend") {
    config.observability.backend = value;
    return common::Status::success();
  }
  return common::Status::error("unknown key: " + key, common::ErrorCode::Usage);
}

} // namespace textguard::config
