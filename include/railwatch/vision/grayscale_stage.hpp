#pragma once

#include <railwatch/core/error.hpp>
#include <railwatch/core/frame.hpp>
#include <railwatch/core/pipeline_stage.hpp>
#include <expected>
#include <string_view>

namespace railwatch::vision {

/// Reduces BGR8 / BGRA8 input to single-channel intensity. Grayscale input
/// passes through as a copy.
class GrayscaleStage : public railwatch::core::IPipelineStage {
 public:
  [[nodiscard]] std::expected<railwatch::core::StageOutput, railwatch::core::Error>
  process(const railwatch::core::Frame& input) const override;

  [[nodiscard]] std::string_view name() const noexcept override { return "grayscale"; }
};

}  // namespace railwatch::vision
