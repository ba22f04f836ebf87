#include <railwatch/vision/image_codec.hpp>
#include "frame_cv_utils.hpp"
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <cstring>
#include <format>
#include <fstream>
#include <iterator>
#include <limits>

namespace railwatch::vision {

namespace rc = railwatch::core;

std::expected<rc::Frame, rc::Error> decode_frame(std::span<const std::byte> bytes) {
  if (bytes.empty()) {
    return std::unexpected(rc::make_error(rc::ErrorCode::Decode, "image buffer is empty"));
  }
  // cv::Mat dimensions are int.
  if (bytes.size() > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
    return std::unexpected(rc::make_error(
        rc::ErrorCode::Decode, std::format("image buffer of {} bytes is too large", bytes.size())));
  }

  const cv::Mat raw(1, static_cast<int>(bytes.size()), CV_8UC1,
                    const_cast<std::byte*>(bytes.data()));
  cv::Mat mat;
  try {
    mat = cv::imdecode(raw, cv::IMREAD_COLOR);
  } catch (const cv::Exception& e) {
    return std::unexpected(rc::make_error(
        rc::ErrorCode::Decode, std::format("image decode failed: {}", e.what())));
  }
  if (mat.empty() || mat.cols == 0 || mat.rows == 0) {
    return std::unexpected(rc::make_error(
        rc::ErrorCode::Decode,
        std::format("{} bytes do not form a readable image", bytes.size())));
  }

  rc::Frame frame = detail::mat_to_frame(mat);
  if (frame.empty()) {
    return std::unexpected(rc::make_error(rc::ErrorCode::Decode, "unsupported pixel layout"));
  }
  return frame;
}

std::expected<rc::Frame, rc::Error> load_frame_from_image(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return std::unexpected(rc::make_error(
        rc::ErrorCode::Decode, std::format("cannot open image file {}", path)));
  }
  std::vector<char> raw{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
  std::vector<std::byte> bytes(raw.size());
  std::memcpy(bytes.data(), raw.data(), raw.size());
  return decode_frame(bytes);
}

std::expected<std::vector<std::byte>, rc::Error> encode_frame(const rc::Frame& frame,
                                                            std::string_view extension) {
  auto mat = detail::frame_to_mat(frame);
  if (!mat) {
    return std::unexpected(rc::make_error(rc::ErrorCode::InvalidFrame, "frame cannot be encoded"));
  }

  std::vector<uchar> encoded;
  try {
    if (!cv::imencode(std::string(extension), *mat, encoded)) {
      return std::unexpected(rc::make_error(
          rc::ErrorCode::Storage, std::format("encoding as '{}' failed", extension)));
    }
  } catch (const cv::Exception& e) {
    return std::unexpected(rc::make_error(
        rc::ErrorCode::Storage,
        std::format("encoding as '{}' failed: {}", extension, e.what())));
  }

  std::vector<std::byte> out(encoded.size());
  std::memcpy(out.data(), encoded.data(), encoded.size());
  return out;
}

}  // namespace railwatch::vision
