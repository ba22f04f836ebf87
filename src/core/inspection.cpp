#include <railwatch/core/inspection.hpp>
#include <format>

namespace railwatch::core {

std::string format_timestamp(Timestamp ts) {
  return std::format("{:%FT%T}Z", ts);
}

Timestamp now_timestamp() {
  return std::chrono::time_point_cast<std::chrono::microseconds>(
      std::chrono::system_clock::now());
}

}  // namespace railwatch::core
