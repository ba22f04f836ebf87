#pragma once

#include <railwatch/core/frame.hpp>
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstring>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace railwatch::test {

inline std::vector<std::byte> encode(const cv::Mat& mat, const std::string& ext = ".png") {
  std::vector<uchar> buf;
  cv::imencode(ext, mat, buf);
  std::vector<std::byte> out(buf.size());
  std::memcpy(out.data(), buf.data(), buf.size());
  return out;
}

/// Uniform light-grey BGR canvas (no edges).
inline cv::Mat blank_canvas(int width = 1000, int height = 800) {
  return cv::Mat(height, width, CV_8UC3, cv::Scalar(200, 200, 200));
}

/// Canvas with count filled black squares (side px) on a 7-column grid,
/// far enough apart that each square yields one contour. count <= 35.
inline cv::Mat squares_canvas(int count, int side = 50) {
  cv::Mat img = blank_canvas();
  for (int i = 0; i < count; ++i) {
    const int x = 40 + (i % 7) * 130;
    const int y = 60 + (i / 7) * 140;
    cv::rectangle(img, cv::Point(x, y), cv::Point(x + side, y + side), cv::Scalar(0, 0, 0),
                  cv::FILLED);
  }
  return img;
}

inline std::vector<std::byte> squares_png(int count, int side = 50) {
  return encode(squares_canvas(count, side));
}

/// Deep copy of an 8-bit 1- or 3-channel mat into a Frame.
inline railwatch::core::Frame to_frame(const cv::Mat& mat) {
  const cv::Mat packed = mat.isContinuous() ? mat : mat.clone();
  std::vector<std::byte> buf(packed.total() * packed.elemSize());
  std::memcpy(buf.data(), packed.ptr(), buf.size());
  const auto format = packed.channels() == 1 ? railwatch::core::PixelFormat::Grayscale8
                                             : railwatch::core::PixelFormat::BGR8;
  return railwatch::core::Frame(static_cast<std::uint32_t>(packed.cols),
                                static_cast<std::uint32_t>(packed.rows), format, std::move(buf));
}

/// Creates a fresh directory under the system temp dir; removed on destruction.
class TempDir {
 public:
  TempDir() {
    static std::atomic<int> counter{0};
    const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    path_ = std::filesystem::temp_directory_path() /
            ("railwatch_test_" + std::to_string(stamp) + "_" + std::to_string(counter++));
    std::filesystem::create_directories(path_);
  }
  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }
  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

  [[nodiscard]] std::size_t file_count() const {
    std::size_t n = 0;
    for (const auto& entry : std::filesystem::directory_iterator(path_)) {
      if (entry.is_regular_file()) ++n;
    }
    return n;
  }

 private:
  std::filesystem::path path_;
};

}  // namespace railwatch::test
