#include "frame_cv_utils.hpp"
#include <railwatch/core/frame.hpp>
#include <opencv2/core.hpp>
#include <cstddef>
#include <cstring>
#include <vector>

namespace railwatch::vision::detail {

namespace rc = railwatch::core;

std::optional<cv::Mat> frame_to_mat(const rc::Frame& frame) {
  if (!frame.is_consistent()) return std::nullopt;

  const int w = static_cast<int>(frame.width());
  const int h = static_cast<int>(frame.height());
  auto* data = const_cast<std::byte*>(frame.data().data());

  switch (frame.format()) {
    case rc::PixelFormat::Grayscale8:
      return cv::Mat(h, w, CV_8UC1, data);
    case rc::PixelFormat::BGR8:
      return cv::Mat(h, w, CV_8UC3, data);
    case rc::PixelFormat::BGRA8:
      return cv::Mat(h, w, CV_8UC4, data);
    case rc::PixelFormat::Unknown:
    default:
      return std::nullopt;
  }
}

rc::Frame mat_to_frame(const cv::Mat& mat) {
  if (mat.empty() || mat.depth() != CV_8U) return rc::Frame();

  rc::PixelFormat format = rc::PixelFormat::Unknown;
  switch (mat.channels()) {
    case 1:
      format = rc::PixelFormat::Grayscale8;
      break;
    case 3:
      format = rc::PixelFormat::BGR8;
      break;
    case 4:
      format = rc::PixelFormat::BGRA8;
      break;
    default:
      return rc::Frame();
  }

  // Frames are tightly packed; clone() drops any ROI stride.
  const cv::Mat packed = mat.isContinuous() ? mat : mat.clone();
  const std::size_t len = packed.total() * packed.elemSize();
  std::vector<std::byte> buffer(len);
  std::memcpy(buffer.data(), packed.ptr(), len);
  return rc::Frame(static_cast<std::uint32_t>(packed.cols),
                   static_cast<std::uint32_t>(packed.rows), format, std::move(buffer));
}

}  // namespace railwatch::vision::detail
