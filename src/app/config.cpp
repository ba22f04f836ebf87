#include <railwatch/app/config.hpp>
#include <railwatch/core/log.hpp>
#include <format>
#include <fstream>
#include <stdexcept>
#include <string_view>

namespace railwatch::app {

namespace {

void trim(std::string& s) {
  const auto start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) {
    s.clear();
    return;
  }
  const auto end = s.find_last_not_of(" \t\r\n");
  s = s.substr(start, end == std::string::npos ? std::string::npos : end - start + 1);
}

bool parse_line(std::string_view line, std::string& key, std::string& value) {
  const auto pos = line.find('=');
  if (pos == std::string_view::npos) return false;
  key.assign(line.substr(0, pos));
  value.assign(line.substr(pos + 1));
  trim(key);
  trim(value);
  return !key.empty();
}

/// Applies one key; throws std::invalid_argument / std::out_of_range on bad numbers.
bool apply(AppConfig& c, const std::string& key, const std::string& value) {
  if (key == "database_path") c.database_path = value;
  else if (key == "upload_dir") c.upload_dir = value;
  else if (key == "blur_kernel_size") c.detector.blur_kernel_size = std::stoi(value);
  else if (key == "canny_low_threshold") c.detector.canny_low_threshold = std::stod(value);
  else if (key == "canny_high_threshold") c.detector.canny_high_threshold = std::stod(value);
  else if (key == "min_contour_area") c.detector.min_contour_area = std::stod(value);
  else if (key == "max_list_limit") c.max_list_limit = static_cast<std::size_t>(std::stoull(value));
  else if (key == "max_upload_bytes") c.max_upload_bytes = static_cast<std::size_t>(std::stoull(value));
  else return false;
  return true;
}

}  // namespace

AppConfig default_config() {
  AppConfig c;
  c.database_path = "database/inspections.db";
  c.upload_dir = "uploads";
  c.detector = railwatch::vision::DetectorConfig{};
  c.max_list_limit = 500;
  c.max_upload_bytes = 10 * 1024 * 1024;
  return c;
}

AppConfig load_config(const std::string& path) {
  AppConfig c = default_config();
  std::ifstream f(path);
  if (!f) {
    railwatch::core::log::warn(std::format("Config {} not readable; using defaults", path));
    return c;
  }

  std::string line;
  std::string key;
  std::string value;
  std::size_t line_no = 0;
  while (std::getline(f, line)) {
    ++line_no;
    trim(line);
    if (line.empty() || line[0] == '#') continue;
    if (!parse_line(line, key, value)) {
      railwatch::core::log::warn(std::format("{}:{}: expected key=value", path, line_no));
      continue;
    }

    try {
      if (!apply(c, key, value)) {
        railwatch::core::log::warn(std::format("{}:{}: unknown key '{}'", path, line_no, key));
      }
    } catch (const std::invalid_argument&) {
      railwatch::core::log::warn(
          std::format("{}:{}: invalid value '{}' for {}", path, line_no, value, key));
    } catch (const std::out_of_range&) {
      railwatch::core::log::warn(
          std::format("{}:{}: value '{}' for {} is out of range", path, line_no, value, key));
    }
  }
  return c;
}

railwatch::catalog::CatalogOptions catalog_options(const AppConfig& config) {
  railwatch::catalog::CatalogOptions options;
  options.max_list_limit = config.max_list_limit;
  options.max_upload_bytes = config.max_upload_bytes;
  return options;
}

}  // namespace railwatch::app
