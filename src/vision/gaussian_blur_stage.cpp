#include <railwatch/vision/gaussian_blur_stage.hpp>
#include "frame_cv_utils.hpp"
#include <opencv2/imgproc.hpp>

namespace railwatch::vision {

GaussianBlurStage::GaussianBlurStage(int kernel_size) : kernel_size_(kernel_size) {}

std::expected<railwatch::core::StageOutput, railwatch::core::Error>
GaussianBlurStage::process(const railwatch::core::Frame& input) const {
  using namespace railwatch::core;

  if (input.format() != PixelFormat::Grayscale8) {
    return std::unexpected(make_error(ErrorCode::InvalidFrame, "blur: expected grayscale frame"));
  }
  if (kernel_size_ <= 0 || kernel_size_ % 2 == 0) {
    return std::unexpected(make_error(ErrorCode::InvalidConfig, "blur: kernel must be odd and positive"));
  }

  auto mat_in = detail::frame_to_mat(input);
  if (!mat_in) {
    return std::unexpected(make_error(ErrorCode::InvalidFrame, "blur: unreadable frame"));
  }

  cv::Mat blurred;
  cv::GaussianBlur(*mat_in, blurred, cv::Size(kernel_size_, kernel_size_), 0);
  return StageOutput{detail::mat_to_frame(blurred)};
}

}  // namespace railwatch::vision
