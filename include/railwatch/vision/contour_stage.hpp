#pragma once

#include <railwatch/core/anomaly_result.hpp>
#include <railwatch/core/error.hpp>
#include <railwatch/core/frame.hpp>
#include <railwatch/core/pipeline_stage.hpp>
#include <expected>
#include <string_view>

namespace railwatch::vision {

/// Terminal stage: extracts external contours from a binary edge map and keeps
/// those whose enclosed area is strictly greater than min_area -> AnomalyResult.
class ContourStage : public railwatch::core::IPipelineStage {
 public:
  explicit ContourStage(double min_area);

  [[nodiscard]] std::expected<railwatch::core::StageOutput, railwatch::core::Error>
  process(const railwatch::core::Frame& input) const override;

  [[nodiscard]] std::string_view name() const noexcept override { return "contours"; }

  [[nodiscard]] double min_area() const noexcept { return min_area_; }

 private:
  double min_area_;
};

}  // namespace railwatch::vision
