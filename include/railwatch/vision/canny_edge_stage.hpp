#pragma once

#include <railwatch/core/error.hpp>
#include <railwatch/core/frame.hpp>
#include <railwatch/core/pipeline_stage.hpp>
#include <expected>
#include <string_view>

namespace railwatch::vision {

/// Dual-threshold gradient edge detector (Canny). Output is a binary edge map
/// in a Grayscale8 frame: 255 on edges, 0 elsewhere.
class CannyEdgeStage : public railwatch::core::IPipelineStage {
 public:
  CannyEdgeStage(double low_threshold, double high_threshold);

  [[nodiscard]] std::expected<railwatch::core::StageOutput, railwatch::core::Error>
  process(const railwatch::core::Frame& input) const override;

  [[nodiscard]] std::string_view name() const noexcept override { return "canny_edges"; }

 private:
  double low_threshold_;
  double high_threshold_;
};

}  // namespace railwatch::vision
