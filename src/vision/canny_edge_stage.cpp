#include <railwatch/vision/canny_edge_stage.hpp>
#include "frame_cv_utils.hpp"
#include <opencv2/imgproc.hpp>

namespace railwatch::vision {

CannyEdgeStage::CannyEdgeStage(double low_threshold, double high_threshold)
    : low_threshold_(low_threshold), high_threshold_(high_threshold) {}

std::expected<railwatch::core::StageOutput, railwatch::core::Error>
CannyEdgeStage::process(const railwatch::core::Frame& input) const {
  using namespace railwatch::core;

  if (input.format() != PixelFormat::Grayscale8) {
    return std::unexpected(make_error(ErrorCode::InvalidFrame, "canny: expected grayscale frame"));
  }

  auto mat_in = detail::frame_to_mat(input);
  if (!mat_in) {
    return std::unexpected(make_error(ErrorCode::InvalidFrame, "canny: unreadable frame"));
  }

  cv::Mat edges;
  cv::Canny(*mat_in, edges, low_threshold_, high_threshold_);
  return StageOutput{detail::mat_to_frame(edges)};
}

}  // namespace railwatch::vision
