#include "tests/helpers/test_helpers.hpp"

#include "textguard/config/config.hpp"

#include <openssl/evp.h>

#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <random>
#include <sstream>

namespace textguard::testing {

config::Config mock_config() {
  config::Config config;
  config.scanner.max_input_bytes = 4096;
  config.observability.backend = "none";
  return config;
}

std::string base64_encode(const std::string_view text, const int layers) {
  std::string current(text);
  for (int layer = 0; layer < layers; ++layer) {
    std::string output(4 * ((current.size() + 2) / 3), '\0');
    EVP_EncodeBlock(reinterpret_cast<unsigned char *>(output.data()),
                    reinterpret_cast<const unsigned char *>(current.data()),
                    static_cast<int>(current.size()));
    current = std::move(output);
  }
  return current;
}

std::string hex_encode(const std::string_view text) {
  std::ostringstream stream;
  stream << std::hex << std::setfill('0');
  for (const char c : text) {
    stream << std::setw(2) << static_cast<int>(static_cast<unsigned char>(c));
  }
  return stream.str();
}

const detect::Finding *find_kind(const std::vector<detect::Finding> &findings,
                                 const detect::FindingKind kind) {
  for (const auto &finding : findings) {
    if (finding.kind == kind) {
      return &finding;
    }
  }
  return nullptr;
}

std::size_t count_kind(const std::vector<detect::Finding> &findings,
                       const detect::FindingKind kind) {
  std::size_t count = 0;
  for (const auto &finding : findings) {
    if (finding.kind == kind) {
      ++count;
    }
  }
  return count;
}

TempWorkspace::TempWorkspace() {
  static std::mt19937_64 rng{std::random_device{}()};
  path_ = std::filesystem::temp_directory_path() /
          ("textguard-test-workspace-" + std::to_string(rng()));
  std::filesystem::create_directories(path_);
}

TempWorkspace::~TempWorkspace() {
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
}

void TempWorkspace::create_file(const std::string &name, const std::string &content) const {
  const auto file_path = path_ / name;
  std::error_code ec;
  std::filesystem::create_directories(file_path.parent_path(), ec);
  std::ofstream out(file_path, std::ios::trunc);
  out << content;
}

EnvGuard::EnvGuard(std::string key_, std::optional<std::string> value) : key(std::move(key_)) {
  if (const char *existing = std::getenv(key.c_str()); existing != nullptr) {
    old_value = existing;
  }
  if (value.has_value()) {
    setenv(key.c_str(), value->c_str(), 1);
  } else {
    unsetenv(key.c_str());
  }
}

EnvGuard::~EnvGuard() {
  if (old_value.has_value()) {
    setenv(key.c_str(), old_value->c_str(), 1);
  } else {
    unsetenv(key.c_str());
  }
}

ConfigOverrideGuard::ConfigOverrideGuard(std::optional<std::filesystem::path> next) {
  old_override = config::config_path_override();
  if (next.has_value()) {
    config::set_config_path_override(*next);
  } else {
    config::set_config_path_override(std::nullopt);
  }
}

ConfigOverrideGuard::~ConfigOverrideGuard() {
  if (old_override.has_value()) {
    config::set_config_path_override(*old_override);
  } else {
    config::set_config_path_override(std::nullopt);
  }
}

} // namespace textguard::testing
