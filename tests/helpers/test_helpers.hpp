#pragma once

#include "textguard/config/schema.hpp"
#include "textguard/detect/types.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace textguard::testing {

config::Config mock_config();

/// Standard padded Base64, `layers` times over.
std::string base64_encode(std::string_view text, int layers = 1);
std::string hex_encode(std::string_view text);

/// First finding of `kind`, or nullptr.
const detect::Finding *find_kind(const std::vector<detect::Finding> &findings,
                                 detect::FindingKind kind);
std::size_t count_kind(const std::vector<detect::Finding> &findings, detect::FindingKind kind);

class TempWorkspace {
public:
  TempWorkspace();
  ~TempWorkspace();

  TempWorkspace(const TempWorkspace &) = delete;
  TempWorkspace &operator=(const TempWorkspace &) = delete;

  [[nodiscard]] const std::filesystem::path &path() const { return path_; }
  void create_file(const std::string &name, const std::string &content) const;

private:
  std::filesystem::path path_;
};

struct EnvGuard {
  std::string key;
  std::optional<std::string> old_value;

  EnvGuard(std::string key_, std::optional<std::string> value);
  ~EnvGuard();
};

/// Points the config path at `next` (or clears the override) for the guard's lifetime.
struct ConfigOverrideGuard {
  std::optional<std::filesystem::path> old_override;

  explicit ConfigOverrideGuard(std::optional<std::filesystem::path> next = std::nullopt);
  ~ConfigOverrideGuard();
};

} // namespace textguard::testing
