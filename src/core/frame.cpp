#include <railwatch/core/frame.hpp>
#include <cstddef>

namespace railwatch::core {

std::size_t Frame::channels(PixelFormat format) noexcept {
  switch (format) {
    case PixelFormat::Grayscale8:
      return 1;
    case PixelFormat::BGR8:
      return 3;
    case PixelFormat::BGRA8:
      return 4;
    case PixelFormat::Unknown:
      return 0;
  }
  return 0;
}

std::size_t Frame::min_bytes(std::uint32_t width,
                             std::uint32_t height,
                             PixelFormat format) noexcept {
  return static_cast<std::size_t>(width) * height * channels(format);
}

bool Frame::is_consistent() const noexcept {
  if (empty() || format_ == PixelFormat::Unknown) return false;
  return buffer_.size() >= min_bytes(width_, height_, format_);
}

}  // namespace railwatch::core
