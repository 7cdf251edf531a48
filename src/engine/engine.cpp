#include "textguard/engine/engine.hpp"

#include "textguard/common/utf8.hpp"
#include "textguard/detect/aggregator.hpp"
#include "textguard/detect/cleaner.hpp"
#include "textguard/detect/pipeline.hpp"
#include "textguard/observability/global.hpp"

#include <openssl/rand.h>

#include <array>
#include <chrono>
#include <iomanip>
#include <sstream>

namespace textguard::engine {

namespace {

std::chrono::microseconds elapsed_since(const std::chrono::steady_clock::time_point start) {
  return std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() -
                                                               start);
}

} // namespace

detect::ScanResult scan(const std::string_view text, const detect::DetectOptions &options) {
  detect::ScanResult result =
      detect::aggregate(detect::run_detectors(text, options).findings, options.max_matches);
  result.original_length = common::utf8_length(text);
  return result;
}

detect::CleanResult clean(const std::string_view text, const detect::DetectOptions &options) {
  return detect::clean_text(text, options);
}

const std::vector<detect::TechniqueInfo> &techniques() { return detect::technique_catalog(); }

common::Result<std::string> generate_scan_id() {
  std::array<unsigned char, 16> bytes{};
  if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
    return common::Result<std::string>::failure("Failed to gather random bytes for scan id");
  }
  bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0FU) | 0x40U);
  bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3FU) | 0x80U);

  std::ostringstream stream;
  stream << std::hex << std::setfill('0');
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) {
      stream << '-';
    }
    stream << std::setw(2) << static_cast<int>(bytes[i]);
  }
  return common::Result<std::string>::success(stream.str());
}

detect::DetectOptions options_from_config(const config::ScannerConfig &config) {
  return detect::DetectOptions{.max_decode_depth = config.max_decode_depth,
                               .min_base64_length = config.min_base64_length,
                               .min_hex_digits = config.min_hex_digits,
                               .max_matches = config.max_matches};
}

Engine::Engine(const config::ScannerConfig &config)
    : options_(options_from_config(config)), max_input_bytes_(config.max_input_bytes) {}

common::Status Engine::validate_input(const std::string &operation,
                                      const std::string &text) const {
  common::Status status = common::Status::success();
  if (text.empty()) {
    status = common::Status::error("Input text is empty", common::ErrorCode::EmptyInput);
  } else if (max_input_bytes_ > 0 && text.size() > max_input_bytes_) {
    status = common::Status::error("Input text is " + std::to_string(text.size()) +
                                       " bytes, limit is " + std::to_string(max_input_bytes_),
                                   common::ErrorCode::InputTooLarge);
  }
  if (!status.ok()) {
    observability::record_input_rejected(operation, status.error());
  }
  return status;
}

common::Result<detect::ScanResult> Engine::scan(const std::string &text) const {
  const auto valid = validate_input("scan", text);
  if (!valid.ok()) {
    return common::Result<detect::ScanResult>::failure(valid);
  }
  auto id = generate_scan_id();
  if (!id.ok()) {
    observability::record_error("engine", id.error());
    return common::Result<detect::ScanResult>::failure(id.error());
  }

  const auto start = std::chrono::steady_clock::now();
  detect::ScanResult result = engine::scan(text, options_);
  result.id = std::move(id.value());

  observability::record_metric(observability::InputSizeMetric{text.size()});
  observability::record_scan_completed("scan",
                                       std::string(detect::threat_level_name(result.threat_level)),
                                       result.total_findings, elapsed_since(start));
  return common::Result<detect::ScanResult>::success(std::move(result));
}

common::Result<detect::CleanResult> Engine::clean(const std::string &text) const {
  const auto valid = validate_input("clean", text);
  if (!valid.ok()) {
    return common::Result<detect::CleanResult>::failure(valid);
  }
  auto id = generate_scan_id();
  if (!id.ok()) {
    observability::record_error("engine", id.error());
    return common::Result<detect::CleanResult>::failure(id.error());
  }

  const auto start = std::chrono::steady_clock::now();
  detect::CleanResult result = engine::clean(text, options_);
  result.id = std::move(id.value());

  std::uint64_t edits = 0;
  for (const auto &detail : result.removed_details) {
    edits += detail.count;
  }
  observability::record_metric(observability::InputSizeMetric{text.size()});
  observability::record_scan_completed(
      "clean", std::string(detect::threat_level_name(result.threat_level_before)), edits,
      elapsed_since(start));
  return common::Result<detect::CleanResult>::success(std::move(result));
}

} // namespace textguard::engine
