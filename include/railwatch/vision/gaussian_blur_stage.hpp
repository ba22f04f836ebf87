#pragma once

#include <railwatch/core/error.hpp>
#include <railwatch/core/frame.hpp>
#include <railwatch/core/pipeline_stage.hpp>
#include <expected>
#include <string_view>

namespace railwatch::vision {

/// Smooths a grayscale frame with a square Gaussian kernel (sigma derived
/// from the kernel size) to suppress noise before edge detection.
class GaussianBlurStage : public railwatch::core::IPipelineStage {
 public:
  explicit GaussianBlurStage(int kernel_size);

  [[nodiscard]] std::expected<railwatch::core::StageOutput, railwatch::core::Error>
  process(const railwatch::core::Frame& input) const override;

  [[nodiscard]] std::string_view name() const noexcept override { return "gaussian_blur"; }

  [[nodiscard]] int kernel_size() const noexcept { return kernel_size_; }

 private:
  int kernel_size_;
};

}  // namespace railwatch::vision
