#include <railwatch/catalog/filename.hpp>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <format>

namespace railwatch::catalog {

namespace {

std::string_view final_component(std::string_view name) {
  const auto sep = name.find_last_of("/\\");
  return sep == std::string_view::npos ? name : name.substr(sep + 1);
}

bool is_safe_char(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '.' || c == '_' || c == '-';
}

}  // namespace

FilenameParts split_extension(std::string_view name) {
  const std::string_view base = final_component(name);
  if (base == "." || base == "..") {
    return {std::string(base), {}};
  }

  const auto dot = base.find_last_of('.');
  if (dot == std::string_view::npos || dot == 0 || dot + 1 == base.size()) {
    return {std::string(base), {}};
  }
  return {std::string(base.substr(0, dot)), std::string(base.substr(dot))};
}

std::string sanitize_filename_stem(std::string_view stem) {
  std::string out;
  out.reserve(stem.size());
  for (char c : stem) {
    out.push_back(is_safe_char(c) ? c : '_');
  }

  const auto first = out.find_first_not_of("._");
  if (first == std::string::npos) {
    return "image";
  }
  const auto last = out.find_last_not_of("._");
  return out.substr(first, last - first + 1);
}

std::string annotated_name(std::string_view name) {
  const FilenameParts parts = split_extension(name);
  return parts.stem + "_annotated" + parts.extension;
}

std::string storage_name(std::string_view original_filename,
                         railwatch::core::Timestamp uploaded_at) {
  const FilenameParts parts = split_extension(original_filename);
  const auto seconds = std::chrono::floor<std::chrono::seconds>(uploaded_at);
  return std::format("{:%Y%m%d_%H%M%S}_{}{}", seconds, sanitize_filename_stem(parts.stem),
                     to_lower_ascii(parts.extension));
}

std::string to_lower_ascii(std::string_view text) {
  std::string out(text);
  std::ranges::transform(out, out.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return out;
}

bool has_allowed_extension(std::string_view name, std::span<const std::string> allowed) {
  const std::string ext = to_lower_ascii(split_extension(name).extension);
  if (ext.empty()) return false;
  return std::ranges::any_of(allowed, [&ext](const std::string& a) {
    return to_lower_ascii(a) == ext;
  });
}

}  // namespace railwatch::catalog
