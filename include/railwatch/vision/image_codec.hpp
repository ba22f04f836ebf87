#pragma once

#include <railwatch/core/error.hpp>
#include <railwatch/core/frame.hpp>
#include <cstddef>
#include <expected>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace railwatch::vision {

/// Decode encoded image bytes (PNG, JPEG, ...) into a BGR8 or Grayscale8 Frame.
/// Fails with ErrorCode::Decode on empty or unreadable input.
[[nodiscard]] std::expected<railwatch::core::Frame, railwatch::core::Error>
decode_frame(std::span<const std::byte> bytes);

/// Load an image file into a Frame. Fails with ErrorCode::Decode if the file
/// is missing or cannot be decoded.
[[nodiscard]] std::expected<railwatch::core::Frame, railwatch::core::Error>
load_frame_from_image(const std::string& path);

/// Encode a Frame in the format named by extension (".png", ".jpg", ...).
[[nodiscard]] std::expected<std::vector<std::byte>, railwatch::core::Error>
encode_frame(const railwatch::core::Frame& frame, std::string_view extension);

}  // namespace railwatch::vision
