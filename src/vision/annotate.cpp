#include <railwatch/vision/annotate.hpp>
#include "frame_cv_utils.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <format>
#include <string>

namespace railwatch::vision {

namespace {

const cv::Scalar kRegionColor{0, 0, 255};  // BGR red
const cv::Scalar kBannerColor{0, 255, 0};  // BGR green
constexpr int kBoxThickness = 2;

}  // namespace

std::expected<railwatch::core::Frame, railwatch::core::Error>
render_annotations(const railwatch::core::Frame& original,
                   const std::vector<railwatch::core::AnomalyRegion>& regions) {
  using namespace railwatch::core;

  auto mat_in = detail::frame_to_mat(original);
  if (!mat_in) {
    return std::unexpected(make_error(ErrorCode::InvalidFrame, "annotate: unreadable frame"));
  }

  cv::Mat canvas;
  switch (original.format()) {
    case PixelFormat::Grayscale8:
      cv::cvtColor(*mat_in, canvas, cv::COLOR_GRAY2BGR);
      break;
    case PixelFormat::BGRA8:
      cv::cvtColor(*mat_in, canvas, cv::COLOR_BGRA2BGR);
      break;
    default:
      canvas = mat_in->clone();
      break;
  }

  for (std::size_t i = 0; i < regions.size(); ++i) {
    const BBox& b = regions[i].bbox;
    cv::rectangle(canvas, cv::Point(b.x, b.y), cv::Point(b.x + b.w, b.y + b.h),
                  kRegionColor, kBoxThickness);
    const int label_y = std::max(b.y - 10, 12);
    cv::putText(canvas, std::format("#{}", i + 1), cv::Point(b.x, label_y),
                cv::FONT_HERSHEY_SIMPLEX, 0.6, kRegionColor, 2);
  }

  cv::putText(canvas, std::format("Anomalies detected: {}", regions.size()),
              cv::Point(10, 30), cv::FONT_HERSHEY_SIMPLEX, 1.0, kBannerColor, 2);

  return detail::mat_to_frame(canvas);
}

}  // namespace railwatch::vision
