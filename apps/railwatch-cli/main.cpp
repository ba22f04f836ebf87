/**
 * railwatch-cli — Analyze rail inspection photos and query the inspection catalog.
 * Build: cmake -B build && cmake --build build
 * Run:   ./build/apps/railwatch-cli/railwatch_cli [--config path] <command> [args]
 */

#include <railwatch/app/config.hpp>
#include <railwatch/app/ingest_runner.hpp>
#include <railwatch/catalog/filesystem_image_store.hpp>
#include <railwatch/catalog/inspection_catalog.hpp>
#include <railwatch/catalog/sqlite_inspection_repository.hpp>
#include <railwatch/core/criticality.hpp>
#include <railwatch/core/error.hpp>
#include <railwatch/core/inspection.hpp>
#include <railwatch/vision/anomaly_detector.hpp>
#ifdef RAILWATCH_HAS_TBB
#include <railwatch/app/ingest_runner_tbb.hpp>
#endif

#include <cstdint>
#include <expected>
#include <filesystem>
#include <format>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace {

namespace rc = railwatch::core;

void print_usage() {
  std::cout << "Usage: railwatch_cli [--config <path>] <command> [args]\n"
            << "Commands:\n"
            << "  analyze <image>... [--workers N]   Detect anomalies and record inspections\n"
            << "  get <id>                           Show one inspection\n"
            << "  list [--level L] [--page N] [--page-size N]\n"
            << "                                     List inspections, newest first\n"
            << "  search <query> [--limit N]         Case-insensitive name search\n"
            << "  delete <id>                        Delete an inspection and its images\n"
            << "  stats                              Aggregate statistics\n"
            << "Options:\n"
            << "  --config <path>   key=value config (database_path, upload_dir, blur_kernel_size,\n"
            << "                    canny_low_threshold, canny_high_threshold, min_contour_area,\n"
            << "                    max_list_limit, max_upload_bytes)\n";
}

void print_inspection(const rc::Inspection& r) {
  std::cout << std::format(
      "id={} file={} original={} uploaded={} anomalies={} score={:.2f} level={} "
      "time={:.3f}s size={}x{} annotated={}\n  {}\n",
      r.id, r.filename, r.original_filename, rc::format_timestamp(r.upload_date),
      r.anomalies_count, r.criticality_score, rc::to_string(r.criticality_level),
      r.processing_time, r.image_width, r.image_height, r.annotated_image_ref, r.notes);
}

int report_error(const rc::Error& e) {
  std::cerr << rc::to_string(e.code) << ": " << e.message << "\n";
  return 1;
}

std::optional<std::size_t> parse_size(const std::string& text) {
  try {
    std::size_t pos = 0;
    const unsigned long long v = std::stoull(text, &pos);
    if (pos != text.size()) return std::nullopt;
    return static_cast<std::size_t>(v);
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

std::optional<std::int64_t> parse_id(const std::string& text) {
  try {
    std::size_t pos = 0;
    const long long v = std::stoll(text, &pos);
    if (pos != text.size()) return std::nullopt;
    return static_cast<std::int64_t>(v);
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

std::expected<std::unique_ptr<railwatch::catalog::InspectionCatalog>, rc::Error> open_catalog(
    const railwatch::app::AppConfig& cfg) {
  auto detector = railwatch::vision::make_detector(cfg.detector);
  if (!detector) return std::unexpected(detector.error());

  const std::filesystem::path db_path(cfg.database_path);
  if (db_path.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(db_path.parent_path(), ec);
  }
  auto repository = railwatch::catalog::SqliteInspectionRepository::open(cfg.database_path);
  if (!repository) return std::unexpected(repository.error());

  auto images = railwatch::catalog::FileSystemImageStore::open(cfg.upload_dir);
  if (!images) return std::unexpected(images.error());

  return std::make_unique<railwatch::catalog::InspectionCatalog>(
      std::move(*detector), std::move(*repository),
      std::shared_ptr<railwatch::catalog::IImageStore>(std::move(*images)),
      railwatch::app::catalog_options(cfg));
}

int cmd_analyze(railwatch::catalog::InspectionCatalog& catalog,
                const std::vector<std::string>& args) {
  std::vector<std::string> paths;
  std::size_t workers = 1;
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == "--workers" && i + 1 < args.size()) {
      auto n = parse_size(args[++i]);
      if (!n) {
        std::cerr << "Invalid --workers " << args[i] << "\n";
        return 1;
      }
      workers = *n;
    } else {
      paths.push_back(args[i]);
    }
  }
  if (paths.empty()) {
    std::cerr << "analyze: no image given\n";
    return 1;
  }

  std::vector<railwatch::app::IngestItem> items;
  int failures = 0;
  for (const auto& p : paths) {
    auto item = railwatch::app::read_ingest_item(p);
    if (!item) {
      report_error(item.error());
      ++failures;
      continue;
    }
    items.push_back(std::move(*item));
  }

  std::mutex out_mutex;
  auto on_outcome = [&](const railwatch::app::IngestOutcome& outcome) {
    std::lock_guard lock(out_mutex);
    if (outcome.result) {
      print_inspection(*outcome.result);
    } else {
      std::cerr << outcome.original_filename << ": ";
      report_error(outcome.result.error());
      ++failures;
    }
  };

#ifdef RAILWATCH_HAS_TBB
  if (workers == 0) {
    railwatch::app::ingest_batch_tbb(catalog, items, on_outcome);
    return failures == 0 ? 0 : 1;
  }
#endif
  railwatch::app::ingest_batch_parallel(catalog, items, on_outcome, workers);
  return failures == 0 ? 0 : 1;
}

int cmd_list(const railwatch::catalog::InspectionCatalog& catalog,
             const std::vector<std::string>& args) {
  std::optional<rc::CriticalityLevel> level;
  std::size_t page = 1;
  std::size_t page_size = 20;
  for (std::size_t i = 0; i + 1 < args.size(); i += 2) {
    if (args[i] == "--level") {
      auto parsed = rc::parse_criticality_level(args[i + 1]);
      if (!parsed) return report_error(parsed.error());
      level = *parsed;
    } else if (args[i] == "--page" || args[i] == "--page-size") {
      auto n = parse_size(args[i + 1]);
      if (!n) {
        std::cerr << "Invalid " << args[i] << " " << args[i + 1] << "\n";
        return 1;
      }
      (args[i] == "--page" ? page : page_size) = *n;
    } else {
      std::cerr << "Unknown list option " << args[i] << "\n";
      return 1;
    }
  }

  auto result = catalog.list_page(level, page, page_size);
  if (!result) return report_error(result.error());
  for (const auto& r : result->items) print_inspection(r);
  std::cout << std::format("page {}/{} ({} inspections)\n", result->page, result->total_pages,
                           result->total_count);
  return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
  std::string config_path;
  std::vector<std::string> positional;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--help" || arg == "-h") {
      print_usage();
      return 0;
    } else {
      positional.push_back(arg);
    }
  }
  if (positional.empty()) {
    print_usage();
    return 1;
  }

  const railwatch::app::AppConfig cfg = config_path.empty()
                                            ? railwatch::app::default_config()
                                            : railwatch::app::load_config(config_path);

  auto catalog = open_catalog(cfg);
  if (!catalog) return report_error(catalog.error());

  const std::string command = positional.front();
  const std::vector<std::string> args(positional.begin() + 1, positional.end());

  if (command == "analyze") {
    return cmd_analyze(**catalog, args);
  }
  if (command == "list") {
    return cmd_list(**catalog, args);
  }
  if (command == "stats") {
    auto stats = (*catalog)->statistics();
    if (!stats) return report_error(stats.error());
    std::cout << std::format("total={} low={} medium={} high={} average_anomalies={:.2f}\n",
                             stats->total, stats->count(rc::CriticalityLevel::Low),
                             stats->count(rc::CriticalityLevel::Medium),
                             stats->count(rc::CriticalityLevel::High), stats->average_anomalies);
    return 0;
  }
  if (command == "search") {
    if (args.empty()) {
      std::cerr << "search: query required\n";
      return 1;
    }
    std::size_t limit = 100;
    if (args.size() >= 3 && args[1] == "--limit") {
      auto n = parse_size(args[2]);
      if (!n) {
        std::cerr << "Invalid --limit " << args[2] << "\n";
        return 1;
      }
      limit = *n;
    }
    auto found = (*catalog)->search(args[0], limit);
    if (!found) return report_error(found.error());
    for (const auto& r : *found) print_inspection(r);
    std::cout << found->size() << " match(es)\n";
    return 0;
  }
  if (command == "get" || command == "delete") {
    const auto id = args.empty() ? std::nullopt : parse_id(args[0]);
    if (!id) {
      std::cerr << command << ": numeric id required\n";
      return 1;
    }
    if (command == "get") {
      auto r = (*catalog)->get(*id);
      if (!r) return report_error(r.error());
      print_inspection(*r);
      return 0;
    }
    auto removed = (*catalog)->remove(*id);
    if (!removed) return report_error(removed.error());
    std::cout << "deleted " << *id << "\n";
    return 0;
  }

  std::cerr << "Unknown command " << command << "\n";
  print_usage();
  return 1;
}
