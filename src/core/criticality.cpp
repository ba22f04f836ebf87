#include <railwatch/core/criticality.hpp>
#include <algorithm>
#include <cctype>
#include <format>

namespace railwatch::core {

namespace {

struct Bucket {
  std::uint32_t first_count;
  std::uint32_t last_count;  // count at which score_high is reached
  double score_low;
  double score_high;
};

constexpr Bucket kLow{0, CriticalityScorer::kLowMaxCount, 0.05, 0.35};
constexpr Bucket kMedium{CriticalityScorer::kLowMaxCount + 1,
                         CriticalityScorer::kMediumMaxCount, 0.40, 0.70};
constexpr Bucket kHigh{CriticalityScorer::kMediumMaxCount + 1,
                       CriticalityScorer::kSaturationCount, 0.71, 1.00};

double interpolate(const Bucket& b, std::uint32_t count) {
  const double span = static_cast<double>(b.last_count - b.first_count);
  const double pos = static_cast<double>(std::min(count, b.last_count) - b.first_count);
  return b.score_low + (b.score_high - b.score_low) * (pos / span);
}

bool iequals(std::string_view a, std::string_view b) {
  return std::ranges::equal(a, b, [](char x, char y) {
    return std::tolower(static_cast<unsigned char>(x)) ==
           std::tolower(static_cast<unsigned char>(y));
  });
}

}  // namespace

std::string_view to_string(CriticalityLevel level) noexcept {
  switch (level) {
    case CriticalityLevel::Low:
      return "low";
    case CriticalityLevel::Medium:
      return "medium";
    case CriticalityLevel::High:
      return "high";
  }
  return "low";
}

std::expected<CriticalityLevel, Error> parse_criticality_level(std::string_view text) {
  for (auto level : {CriticalityLevel::Low, CriticalityLevel::Medium, CriticalityLevel::High}) {
    if (iequals(text, to_string(level))) return level;
  }
  return std::unexpected(make_error(
      ErrorCode::Validation,
      std::format("unknown criticality level '{}' (expected low, medium or high)", text)));
}

CriticalityLevel CriticalityScorer::level_for(std::uint32_t anomalies_count) noexcept {
  if (anomalies_count <= kLowMaxCount) return CriticalityLevel::Low;
  if (anomalies_count <= kMediumMaxCount) return CriticalityLevel::Medium;
  return CriticalityLevel::High;
}

double CriticalityScorer::score_for(std::uint32_t anomalies_count) noexcept {
  switch (level_for(anomalies_count)) {
    case CriticalityLevel::Low:
      return interpolate(kLow, anomalies_count);
    case CriticalityLevel::Medium:
      return interpolate(kMedium, anomalies_count);
    case CriticalityLevel::High:
      if (anomalies_count >= kSaturationCount) return 1.0;
      return std::clamp(interpolate(kHigh, anomalies_count), 0.0, 1.0);
  }
  return 0.0;
}

std::string CriticalityScorer::notes_for(CriticalityLevel level,
                                         std::uint32_t anomalies_count) {
  switch (level) {
    case CriticalityLevel::High:
      return std::format(
          "CRITICAL: {} anomalies detected. Urgent intervention required.",
          anomalies_count);
    case CriticalityLevel::Medium:
      return std::format(
          "WARNING: {} anomalies detected. Schedule an inspection soon.",
          anomalies_count);
    case CriticalityLevel::Low:
      return std::format(
          "INFO: {} anomalies detected. Routine monitoring at next maintenance.",
          anomalies_count);
  }
  return {};
}

CriticalityAssessment CriticalityScorer::score(std::uint32_t anomalies_count) const {
  CriticalityAssessment out;
  out.level = level_for(anomalies_count);
  out.score = score_for(anomalies_count);
  out.notes = notes_for(out.level, anomalies_count);
  return out;
}

}  // namespace railwatch::core
