#include <railwatch/vision/anomaly_detector.hpp>
#include <railwatch/vision/annotate.hpp>
#include <railwatch/vision/canny_edge_stage.hpp>
#include <railwatch/vision/contour_stage.hpp>
#include <railwatch/vision/gaussian_blur_stage.hpp>
#include <railwatch/vision/grayscale_stage.hpp>
#include <railwatch/vision/image_codec.hpp>
#include <chrono>
#include <format>
#include <memory>

namespace railwatch::vision {

namespace rc = railwatch::core;

AnomalyDetector::AnomalyDetector(DetectorConfig config) : config_(config) {
  pipeline_.add_stage(std::make_unique<GrayscaleStage>());
  pipeline_.add_stage(std::make_unique<GaussianBlurStage>(config_.blur_kernel_size));
  pipeline_.add_stage(std::make_unique<CannyEdgeStage>(config_.canny_low_threshold,
                                                       config_.canny_high_threshold));
  pipeline_.add_stage(std::make_unique<ContourStage>(config_.min_contour_area));
}

std::expected<rc::AnomalyResult, rc::Error> AnomalyDetector::detect_frame(
    const rc::Frame& frame, const rc::StageTimingCallback* timing_cb) const {
  if (frame.empty()) {
    return std::unexpected(rc::make_error(rc::ErrorCode::InvalidFrame, "empty frame"));
  }
  return pipeline_.run(frame, timing_cb);
}

std::expected<DetectionReport, rc::Error> AnomalyDetector::detect(
    std::span<const std::byte> image_bytes,
    const rc::StageTimingCallback* timing_cb) const {
  const auto start = std::chrono::steady_clock::now();

  auto frame = decode_frame(image_bytes);
  if (!frame) {
    return std::unexpected(frame.error());
  }

  auto result = detect_frame(*frame, timing_cb);
  if (!result) {
    return std::unexpected(result.error());
  }

  auto annotated = render_annotations(*frame, result->regions);
  if (!annotated) {
    return std::unexpected(annotated.error());
  }

  DetectionReport report;
  report.width = frame->width();
  report.height = frame->height();
  report.regions = std::move(result->regions);
  report.annotated = std::move(*annotated);
  report.processing_time =
      std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
  return report;
}

std::expected<AnomalyDetector, rc::Error> make_detector(const DetectorConfig& config) {
  if (auto ok = validate(config); !ok) {
    return std::unexpected(ok.error());
  }
  return AnomalyDetector(config);
}

}  // namespace railwatch::vision
