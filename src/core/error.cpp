#include <railwatch/core/error.hpp>

namespace railwatch::core {

std::string_view to_string(ErrorCode code) noexcept {
  switch (code) {
    case ErrorCode::Validation:
      return "ValidationError";
    case ErrorCode::Decode:
      return "DecodeError";
    case ErrorCode::NotFound:
      return "NotFoundError";
    case ErrorCode::Storage:
      return "StorageError";
    case ErrorCode::InvalidFrame:
      return "InvalidFrame";
    case ErrorCode::InvalidConfig:
      return "InvalidConfig";
  }
  return "Unknown";
}

}  // namespace railwatch::core
