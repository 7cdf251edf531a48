#pragma once

#include "textguard/common/result.hpp"
#include "textguard/config/schema.hpp"
#include "textguard/detect/catalog.hpp"
#include "textguard/detect/types.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace textguard::engine {

/// Scans `text` and aggregates the findings. Accepts any input, including empty text;
/// the result is identical across calls except for `id`, which is left empty.
[[nodiscard]] detect::ScanResult scan(std::string_view text, const detect::DetectOptions &options);

/// Sanitizes `text`. `threat_level_before` always equals `scan(text).threat_level`.
[[nodiscard]] detect::CleanResult clean(std::string_view text,
                                        const detect::DetectOptions &options);

/// One entry per finding kind, in phase order.
[[nodiscard]] const std::vector<detect::TechniqueInfo> &techniques();

/// Random RFC 4122 version 4 identifier.
[[nodiscard]] common::Result<std::string> generate_scan_id();

[[nodiscard]] detect::DetectOptions options_from_config(const config::ScannerConfig &config);

class Engine {
public:
  explicit Engine(const config::ScannerConfig &config);

  /// Rejects empty input and input above the configured byte cap, then scans and assigns
  /// a fresh `id`. Scan outcomes are reported to the global observer.
  [[nodiscard]] common::Result<detect::ScanResult> scan(const std::string &text) const;
  [[nodiscard]] common::Result<detect::CleanResult> clean(const std::string &text) const;

  [[nodiscard]] const detect::DetectOptions &options() const { return options_; }
  [[nodiscard]] std::size_t max_input_bytes() const { return max_input_bytes_; }

private:
  [[nodiscard]] common::Status validate_input(const std::string &operation,
                                              const std::string &text) const;

  detect::DetectOptions options_;
  std::size_t max_input_bytes_ = 0;
};

} // namespace textguard::engine
