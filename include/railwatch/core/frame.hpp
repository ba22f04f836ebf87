#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace railwatch::core {

/// Memory: Frame owns a single contiguous, tightly packed buffer
/// (std::vector<std::byte>); move semantics and RAII throughout. Use data()
/// for std::span views (non-owning).
/// Thread-safety: distinct Frame instances are independent; sharing one Frame
/// across threads requires external synchronization.

/// Pixel layout. Grayscale8 also carries binary edge maps (0 / 255).
enum class PixelFormat : std::uint8_t {
  Unknown,
  Grayscale8,
  BGR8,
  BGRA8,
};

/// Single decoded image: dimensions, format and owned pixel buffer.
class Frame {
 public:
  Frame() = default;

  Frame(std::uint32_t width,
        std::uint32_t height,
        PixelFormat format,
        std::vector<std::byte> buffer)
      : width_(width),
        height_(height),
        format_(format),
        buffer_(std::move(buffer)) {}

  [[nodiscard]] std::uint32_t width() const noexcept { return width_; }
  [[nodiscard]] std::uint32_t height() const noexcept { return height_; }
  [[nodiscard]] PixelFormat format() const noexcept { return format_; }

  [[nodiscard]] std::span<std::byte> data() noexcept {
    return std::span<std::byte>(buffer_.data(), buffer_.size());
  }
  [[nodiscard]] std::span<const std::byte> data() const noexcept {
    return std::span<const std::byte>(buffer_.data(), buffer_.size());
  }

  [[nodiscard]] bool empty() const noexcept {
    return buffer_.empty() || width_ == 0 || height_ == 0;
  }
  [[nodiscard]] std::size_t size_bytes() const noexcept { return buffer_.size(); }

  /// True when the buffer holds at least width * height * channels bytes.
  [[nodiscard]] bool is_consistent() const noexcept;

  [[nodiscard]] static std::size_t channels(PixelFormat format) noexcept;

  /// Minimum bytes required for given dimensions and format (for validation).
  [[nodiscard]] static std::size_t min_bytes(std::uint32_t width,
                                             std::uint32_t height,
                                             PixelFormat format) noexcept;

 private:
  std::uint32_t width_{0};
  std::uint32_t height_{0};
  PixelFormat format_{PixelFormat::Unknown};
  std::vector<std::byte> buffer_;
};

}  // namespace railwatch::core
