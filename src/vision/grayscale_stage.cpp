#include <railwatch/vision/grayscale_stage.hpp>
#include "frame_cv_utils.hpp"
#include <opencv2/imgproc.hpp>
#include <vector>

namespace railwatch::vision {

std::expected<railwatch::core::StageOutput, railwatch::core::Error>
GrayscaleStage::process(const railwatch::core::Frame& input) const {
  using namespace railwatch::core;

  auto mat_in = detail::frame_to_mat(input);
  if (!mat_in) {
    return std::unexpected(make_error(ErrorCode::InvalidFrame, "grayscale: unreadable frame"));
  }

  if (input.format() == PixelFormat::Grayscale8) {
    std::vector<std::byte> buf(input.data().begin(), input.data().end());
    return StageOutput{
        Frame(input.width(), input.height(), PixelFormat::Grayscale8, std::move(buf))};
  }

  const int code = input.format() == PixelFormat::BGRA8 ? cv::COLOR_BGRA2GRAY
                                                         : cv::COLOR_BGR2GRAY;
  cv::Mat gray;
  cv::cvtColor(*mat_in, gray, code);
  return StageOutput{detail::mat_to_frame(gray)};
}

}  // namespace railwatch::vision
