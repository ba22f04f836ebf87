#pragma once

#include <railwatch/core/error.hpp>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace railwatch::core {

/// Coarse severity bucket derived from the anomaly count.
enum class CriticalityLevel : std::uint8_t {
  Low,
  Medium,
  High,
};

[[nodiscard]] std::string_view to_string(CriticalityLevel level) noexcept;

/// Parses "low" / "medium" / "high" (case-insensitive).
[[nodiscard]] std::expected<CriticalityLevel, Error> parse_criticality_level(
    std::string_view text);

/// Score, level and advisory text for one anomaly count.
struct CriticalityAssessment {
  double score{0.0};
  CriticalityLevel level{CriticalityLevel::Low};
  std::string notes;
};

/// Maps an anomaly count to a calibrated criticality.
///
/// Buckets (closed ranges, level decided by bucket only):
///   0-10  low     0.05 + 0.03 * n                      (0.05 .. 0.35)
///   11-30 medium  0.40 + 0.30 * (n - 11) / 19          (0.40 .. 0.70)
///   31+   high    0.71 + 0.29 * (n - 31) / 29, <= 1.0  (1.00 from n = 60)
///
/// Stateless; safe to call from any number of threads.
class CriticalityScorer {
 public:
  static constexpr std::uint32_t kLowMaxCount = 10;
  static constexpr std::uint32_t kMediumMaxCount = 30;
  static constexpr std::uint32_t kSaturationCount = 60;

  [[nodiscard]] CriticalityAssessment score(std::uint32_t anomalies_count) const;

  [[nodiscard]] static CriticalityLevel level_for(std::uint32_t anomalies_count) noexcept;
  [[nodiscard]] static double score_for(std::uint32_t anomalies_count) noexcept;
  [[nodiscard]] static std::string notes_for(CriticalityLevel level,
                                             std::uint32_t anomalies_count);
};

}  // namespace railwatch::core
