#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace railwatch::core {

/// Error codes; used with std::expected for recoverable failures.
enum class ErrorCode : std::uint8_t {
  Validation,     // malformed caller input
  Decode,         // image bytes unreadable
  NotFound,       // unknown inspection id
  Storage,        // repository or image store failure
  InvalidFrame,   // stage received a frame it cannot process
  InvalidConfig,  // pipeline or detector misconfigured
};

/// Error code plus a human-readable reason.
struct Error {
  ErrorCode code{ErrorCode::Validation};
  std::string message;
};

[[nodiscard]] std::string_view to_string(ErrorCode code) noexcept;

inline Error make_error(ErrorCode code, std::string message) {
  return Error{code, std::move(message)};
}

}  // namespace railwatch::core
