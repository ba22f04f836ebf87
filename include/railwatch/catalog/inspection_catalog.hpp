#pragma once

#include <railwatch/catalog/image_store.hpp>
#include <railwatch/catalog/inspection_repository.hpp>
#include <railwatch/core/criticality.hpp>
#include <railwatch/core/error.hpp>
#include <railwatch/core/inspection.hpp>
#include <railwatch/vision/anomaly_detector.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace railwatch::catalog {

/// Limits and policies applied at the catalog boundary.
struct CatalogOptions {
  std::size_t max_list_limit{500};
  std::size_t max_upload_bytes{10 * 1024 * 1024};
  std::vector<std::string> allowed_extensions{".png", ".jpg", ".jpeg"};
  /// Source of upload timestamps; defaults to the system clock.
  std::function<railwatch::core::Timestamp()> clock;
};

/// Authoritative collection of inspection records.
///
/// Concurrency: one writer lock. analyze_and_record runs detection without
/// the lock and holds it exclusively only while files and the record are
/// written; remove holds it exclusively; reads share it. Ids are allocated
/// by the repository under the writer lock, so concurrent writers never
/// produce duplicates and readers never see a record mid-construction.
class InspectionCatalog {
 public:
  InspectionCatalog(railwatch::vision::AnomalyDetector detector,
                    std::unique_ptr<IInspectionRepository> repository,
                    std::shared_ptr<IImageStore> images,
                    CatalogOptions options = {});

  InspectionCatalog(const InspectionCatalog&) = delete;
  InspectionCatalog& operator=(const InspectionCatalog&) = delete;

  /// Detect, score, store both images and persist one record.
  /// Errors: Validation (bad name/extension/size), Decode (unreadable image),
  /// Storage (file or record write failed; nothing is left behind).
  [[nodiscard]] std::expected<railwatch::core::Inspection, railwatch::core::Error>
  analyze_and_record(std::span<const std::byte> image_bytes, std::string_view original_filename);

  [[nodiscard]] std::expected<railwatch::core::Inspection, railwatch::core::Error> get(
      std::int64_t id) const;

  /// Newest first. limit is clamped to max_list_limit; limit == 0 is a
  /// Validation error.
  [[nodiscard]] std::expected<std::vector<railwatch::core::Inspection>, railwatch::core::Error>
  list(std::optional<railwatch::core::CriticalityLevel> filter_level,
       std::size_t limit,
       std::size_t offset = 0) const;

  /// 1-based page of a filtered listing; pages past the end are empty.
  [[nodiscard]] std::expected<railwatch::core::InspectionPage, railwatch::core::Error> list_page(
      std::optional<railwatch::core::CriticalityLevel> filter_level,
      std::size_t page,
      std::size_t page_size) const;

  /// Case-insensitive substring match on original_filename.
  [[nodiscard]] std::expected<std::vector<railwatch::core::Inspection>, railwatch::core::Error>
  search(std::string_view query, std::size_t limit) const;

  /// Removes the record and releases both image files. Files are staged
  /// inside the repository transaction and restored if it does not commit,
  /// so a failed delete leaves record and files untouched. A second call for
  /// the same id reports NotFound.
  [[nodiscard]] std::expected<void, railwatch::core::Error> remove(std::int64_t id);

  [[nodiscard]] std::expected<railwatch::core::InspectionStatistics, railwatch::core::Error>
  statistics() const;

  [[nodiscard]] const CatalogOptions& options() const noexcept { return options_; }
  [[nodiscard]] const railwatch::vision::AnomalyDetector& detector() const noexcept {
    return detector_;
  }

 private:
  [[nodiscard]] std::expected<void, railwatch::core::Error> validate_upload(
      std::span<const std::byte> image_bytes, std::string_view original_filename) const;
  [[nodiscard]] std::expected<std::size_t, railwatch::core::Error> clamp_limit(
      std::size_t limit) const;

  railwatch::vision::AnomalyDetector detector_;
  railwatch::core::CriticalityScorer scorer_;
  std::unique_ptr<IInspectionRepository> repository_;
  std::shared_ptr<IImageStore> images_;
  CatalogOptions options_;
  mutable std::shared_mutex mutex_;
};

}  // namespace railwatch::catalog
