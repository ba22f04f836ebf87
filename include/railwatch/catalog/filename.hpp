#pragma once

#include <railwatch/core/inspection.hpp>
#include <span>
#include <string>
#include <string_view>

namespace railwatch::catalog {

/// A file name split at its real extension.
struct FilenameParts {
  std::string stem;
  std::string extension;  // includes the leading dot; empty when there is none
};

/// Splits the final path component at its last dot.
///
///   "rail.track.v2.JPG"      -> {"rail.track.v2", ".JPG"}
///   "../uploads/a.b/img.png" -> {"img", ".png"}
///   ".hidden"                -> {".hidden", ""}
///   "archive."               -> {"archive.", ""}
///
/// Both '/' and '\\' are treated as directory separators.
[[nodiscard]] FilenameParts split_extension(std::string_view name);

/// Keeps [A-Za-z0-9._-], maps everything else to '_', trims leading and
/// trailing '.' / '_'. Returns "image" if nothing survives.
[[nodiscard]] std::string sanitize_filename_stem(std::string_view stem);

/// "<stem>_annotated<ext>" for the final component of name.
[[nodiscard]] std::string annotated_name(std::string_view name);

/// "<YYYYmmdd_HHMMSS>_<sanitized stem><lower-case ext>".
[[nodiscard]] std::string storage_name(std::string_view original_filename,
                                       railwatch::core::Timestamp uploaded_at);

[[nodiscard]] std::string to_lower_ascii(std::string_view text);

/// Case-insensitive check of name's extension against allowed (".png", ...).
[[nodiscard]] bool has_allowed_extension(std::string_view name,
                                         std::span<const std::string> allowed);

}  // namespace railwatch::catalog
