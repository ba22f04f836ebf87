#pragma once

#include <railwatch/core/anomaly.hpp>
#include <railwatch/core/error.hpp>
#include <railwatch/core/frame.hpp>
#include <railwatch/core/pipeline.hpp>
#include <railwatch/vision/detector_config.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>
#include <vector>

namespace railwatch::vision {

/// Output of one detect() call.
struct DetectionReport {
  std::vector<railwatch::core::AnomalyRegion> regions;
  railwatch::core::Frame annotated;  // BGR8 copy of the input with regions drawn
  double processing_time{0.0};       // seconds, decode through annotation
  std::uint32_t width{0};
  std::uint32_t height{0};

  [[nodiscard]] std::uint32_t anomalies_count() const noexcept {
    return static_cast<std::uint32_t>(regions.size());
  }
};

/// Edge-based anomaly detector:
/// decode -> grayscale -> Gaussian blur -> Canny -> external contours ->
/// area filter -> annotated copy.
///
/// Holds no per-call state; detect() is safe to call from multiple threads.
/// Input bytes are only borrowed; all intermediate buffers are released
/// before detect() returns, on success and on error.
class AnomalyDetector {
 public:
  explicit AnomalyDetector(DetectorConfig config = {});

  [[nodiscard]] std::expected<DetectionReport, railwatch::core::Error> detect(
      std::span<const std::byte> image_bytes,
      const railwatch::core::StageTimingCallback* timing_cb = nullptr) const;

  /// Runs grayscale..contours on an already decoded frame (no annotation).
  [[nodiscard]] std::expected<railwatch::core::AnomalyResult, railwatch::core::Error>
  detect_frame(const railwatch::core::Frame& frame,
               const railwatch::core::StageTimingCallback* timing_cb = nullptr) const;

  [[nodiscard]] const DetectorConfig& config() const noexcept { return config_; }
  [[nodiscard]] const railwatch::core::Pipeline& pipeline() const noexcept { return pipeline_; }

 private:
  DetectorConfig config_;
  railwatch::core::Pipeline pipeline_;
};

/// Validates config, then builds a detector.
[[nodiscard]] std::expected<AnomalyDetector, railwatch::core::Error> make_detector(
    const DetectorConfig& config);

}  // namespace railwatch::vision
