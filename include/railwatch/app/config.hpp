#pragma once

#include <railwatch/catalog/inspection_catalog.hpp>
#include <railwatch/vision/detector_config.hpp>
#include <cstddef>
#include <string>

namespace railwatch::app {

/// Application configuration: storage locations, detector calibration,
/// catalog limits.
struct AppConfig {
  std::string database_path;
  std::string upload_dir;
  railwatch::vision::DetectorConfig detector;
  std::size_t max_list_limit{500};
  std::size_t max_upload_bytes{10 * 1024 * 1024};
};

/// Load config from a simple key=value file (one per line, '#' comments).
/// Missing file -> defaults. Unknown keys and unparsable values are logged
/// and skipped.
AppConfig load_config(const std::string& path);

/// Default config when no file is provided.
AppConfig default_config();

/// Catalog options derived from the config.
railwatch::catalog::CatalogOptions catalog_options(const AppConfig& config);

}  // namespace railwatch::app
