#include "textguard/common/result.hpp"

namespace textguard::common {

const char *error_code_name(const ErrorCode code) {
  switch (code) {
  case ErrorCode::None:
    return "none";
  case ErrorCode::EmptyInput:
    return "empty_input";
  case ErrorCode::InputTooLarge:
    return "input_too_large";
  case ErrorCode::InvalidConfig:
    return "invalid_config";
  case ErrorCode::Io:
    return "io";
  case ErrorCode::Usage:
    return "usage";
  }
  return "unknown";
}

} // namespace textguard::common
