#pragma once

#include <railwatch/core/frame.hpp>
#include <opencv2/core/mat.hpp>
#include <optional>

namespace railwatch::vision::detail {

/// Non-owning cv::Mat view over a Frame. The Frame must outlive the view.
/// Returns nullopt if the format is unsupported or the buffer is short.
std::optional<cv::Mat> frame_to_mat(const railwatch::core::Frame& frame);

/// Deep copy of a cv::Mat into a Frame. The format follows the channel count
/// (1 -> Grayscale8, 3 -> BGR8, 4 -> BGRA8); 8-bit mats only.
railwatch::core::Frame mat_to_frame(const cv::Mat& mat);

}  // namespace railwatch::vision::detail
