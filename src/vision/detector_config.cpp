#include <railwatch/vision/detector_config.hpp>
#include <format>

namespace railwatch::vision {

namespace rc = railwatch::core;

std::expected<void, rc::Error> validate(const DetectorConfig& config) {
  if (config.blur_kernel_size <= 0 || config.blur_kernel_size % 2 == 0) {
    return std::unexpected(rc::make_error(
        rc::ErrorCode::Validation,
        std::format("blur_kernel_size must be odd and positive, got {}", config.blur_kernel_size)));
  }
  if (config.canny_low_threshold < 0.0 ||
      config.canny_low_threshold >= config.canny_high_threshold) {
    return std::unexpected(rc::make_error(
        rc::ErrorCode::Validation,
        std::format("canny thresholds must satisfy 0 <= low < high, got {} / {}",
                    config.canny_low_threshold, config.canny_high_threshold)));
  }
  if (config.min_contour_area < 0.0) {
    return std::unexpected(rc::make_error(
        rc::ErrorCode::Validation,
        std::format("min_contour_area must be >= 0, got {}", config.min_contour_area)));
  }
  return {};
}

}  // namespace railwatch::vision
