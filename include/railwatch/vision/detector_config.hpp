#pragma once

#include <railwatch/core/error.hpp>
#include <expected>

namespace railwatch::vision {

/// Calibration constants of the detection pipeline. Fixed per detector
/// instance; identical constants and input give identical regions.
struct DetectorConfig {
  int blur_kernel_size{5};        // odd, > 0
  double canny_low_threshold{50.0};
  double canny_high_threshold{150.0};
  double min_contour_area{500.0};  // regions must be strictly larger (px²)
};

/// Rejects even or non-positive kernels, inverted thresholds and negative areas.
[[nodiscard]] std::expected<void, railwatch::core::Error> validate(
    const DetectorConfig& config);

}  // namespace railwatch::vision
