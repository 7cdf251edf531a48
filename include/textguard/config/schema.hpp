#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace textguard::config {

inline constexpr std::uint32_t MAX_DECODE_DEPTH_LIMIT = 5;

struct ScannerConfig {
  /// Request-layer cap on input size in bytes; 0 disables it.
  std::size_t max_input_bytes = 100'000;
  std::uint32_t max_decode_depth = MAX_DECODE_DEPTH_LIMIT;
  std::size_t min_base64_length = 16;
  std::size_t min_hex_digits = 16;
  std::size_t max_matches = 5;
};

struct ObservabilityConfig {
  std::string backend = "none";
};

struct Config {
  ScannerConfig scanner;
  ObservabilityConfig observability;
};

} // namespace textguard::config
