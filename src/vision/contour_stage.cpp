#include <railwatch/vision/contour_stage.hpp>
#include "frame_cv_utils.hpp"
#include <opencv2/imgproc.hpp>
#include <vector>

namespace railwatch::vision {

ContourStage::ContourStage(double min_area) : min_area_(min_area) {}

std::expected<railwatch::core::StageOutput, railwatch::core::Error>
ContourStage::process(const railwatch::core::Frame& input) const {
  using namespace railwatch::core;

  if (input.format() != PixelFormat::Grayscale8) {
    return std::unexpected(make_error(ErrorCode::InvalidFrame, "contours: expected edge map"));
  }

  auto edges = detail::frame_to_mat(input);
  if (!edges) {
    return std::unexpected(make_error(ErrorCode::InvalidFrame, "contours: unreadable frame"));
  }

  // findContours may modify its input on older OpenCV releases.
  cv::Mat work = edges->clone();
  std::vector<std::vector<cv::Point>> contours;
  cv::findContours(work, contours, cv::RETR_EXTERNAL, cv::CHAIN_APPROX_SIMPLE);

  AnomalyResult out;
  out.source_width = input.width();
  out.source_height = input.height();
  for (const auto& contour : contours) {
    const double area = cv::contourArea(contour);
    if (area <= min_area_) {
      continue;
    }
    const cv::Rect r = cv::boundingRect(contour);
    out.regions.push_back(AnomalyRegion{BBox{r.x, r.y, r.width, r.height}, area});
  }
  return StageOutput{std::move(out)};
}

}  // namespace railwatch::vision
