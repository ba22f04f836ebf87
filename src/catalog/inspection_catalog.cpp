#include <railwatch/catalog/inspection_catalog.hpp>
#include <railwatch/catalog/filename.hpp>
#include <railwatch/core/log.hpp>
#include <railwatch/vision/image_codec.hpp>
#include <algorithm>
#include <format>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace railwatch::catalog {

namespace rc = railwatch::core;

namespace {

/// Anything that fails after detection is reported as a storage failure.
rc::Error as_storage_error(rc::Error e) {
  e.code = rc::ErrorCode::Storage;
  return e;
}

}  // namespace

InspectionCatalog::InspectionCatalog(railwatch::vision::AnomalyDetector detector,
                                     std::unique_ptr<IInspectionRepository> repository,
                                     std::shared_ptr<IImageStore> images,
                                     CatalogOptions options)
    : detector_(std::move(detector)),
      repository_(std::move(repository)),
      images_(std::move(images)),
      options_(std::move(options)) {
  if (!options_.clock) {
    options_.clock = rc::now_timestamp;
  }
  if (options_.max_list_limit == 0) {
    options_.max_list_limit = 1;
  }
}

std::expected<void, rc::Error> InspectionCatalog::validate_upload(
    std::span<const std::byte> image_bytes, std::string_view original_filename) const {
  if (original_filename.empty()) {
    return std::unexpected(rc::make_error(rc::ErrorCode::Validation, "no file name provided"));
  }
  if (!has_allowed_extension(original_filename, options_.allowed_extensions)) {
    std::string allowed;
    for (const auto& ext : options_.allowed_extensions) {
      if (!allowed.empty()) allowed += ", ";
      allowed += ext;
    }
    return std::unexpected(rc::make_error(
        rc::ErrorCode::Validation,
        std::format("invalid file type for '{}'; allowed: {}", original_filename, allowed)));
  }
  if (image_bytes.empty()) {
    return std::unexpected(rc::make_error(rc::ErrorCode::Validation, "image file is empty"));
  }
  if (image_bytes.size() > options_.max_upload_bytes) {
    return std::unexpected(rc::make_error(
        rc::ErrorCode::Validation,
        std::format("file too large: {} bytes, max {}", image_bytes.size(),
                    options_.max_upload_bytes)));
  }
  return {};
}

std::expected<std::size_t, rc::Error> InspectionCatalog::clamp_limit(std::size_t limit) const {
  if (limit == 0) {
    return std::unexpected(rc::make_error(rc::ErrorCode::Validation, "limit must be at least 1"));
  }
  return std::min(limit, options_.max_list_limit);
}

std::expected<rc::Inspection, rc::Error> InspectionCatalog::analyze_and_record(
    std::span<const std::byte> image_bytes, std::string_view original_filename) {
  if (auto ok = validate_upload(image_bytes, original_filename); !ok) {
    return std::unexpected(ok.error());
  }

  auto report = detector_.detect(image_bytes);
  if (!report) {
    rc::log::warn(std::format("Analyze '{}': {}", original_filename, report.error().message));
    return std::unexpected(report.error());
  }
  const rc::CriticalityAssessment assessment = scorer_.score(report->anomalies_count());

  const std::string extension = to_lower_ascii(split_extension(original_filename).extension);
  auto annotated_bytes = railwatch::vision::encode_frame(report->annotated, extension);
  if (!annotated_bytes) {
    return std::unexpected(as_storage_error(annotated_bytes.error()));
  }

  std::unique_lock lock(mutex_);

  const rc::Timestamp uploaded_at = options_.clock();
  auto original_ref = images_->save(image_bytes, storage_name(original_filename, uploaded_at));
  if (!original_ref) {
    rc::log::error(std::format("Analyze '{}': {}", original_filename, original_ref.error().message));
    return std::unexpected(as_storage_error(original_ref.error()));
  }

  auto annotated_ref = images_->save(*annotated_bytes, annotated_name(*original_ref));
  if (!annotated_ref) {
    rc::log::error(std::format("Analyze '{}': {}", original_filename, annotated_ref.error().message));
    if (auto undo = images_->remove(*original_ref); !undo) {
      rc::log::error(std::format("Rollback: {}", undo.error().message));
    }
    return std::unexpected(as_storage_error(annotated_ref.error()));
  }

  rc::NewInspection record;
  record.filename = *original_ref;
  record.original_filename = std::string(original_filename);
  record.upload_date = uploaded_at;
  record.anomalies_count = report->anomalies_count();
  record.criticality_score = assessment.score;
  record.criticality_level = assessment.level;
  record.processing_time = report->processing_time;
  record.notes = assessment.notes;
  record.annotated_image_ref = *annotated_ref;
  record.image_width = report->width;
  record.image_height = report->height;

  auto stored = repository_->insert(record);
  if (!stored) {
    rc::log::error(std::format("Analyze '{}': {}", original_filename, stored.error().message));
    for (const std::string& ref : {*annotated_ref, *original_ref}) {
      if (auto undo = images_->remove(ref); !undo) {
        rc::log::error(std::format("Rollback: {}", undo.error().message));
      }
    }
    return std::unexpected(as_storage_error(stored.error()));
  }

  rc::log::info(std::format("Inspection {} recorded: {} ({} anomalies, {} {:.2f}, {:.3f}s)",
                            stored->id, stored->original_filename, stored->anomalies_count,
                            rc::to_string(stored->criticality_level), stored->criticality_score,
                            stored->processing_time));
  return stored;
}

std::expected<rc::Inspection, rc::Error> InspectionCatalog::get(std::int64_t id) const {
  std::shared_lock lock(mutex_);
  return repository_->get(id);
}

std::expected<std::vector<rc::Inspection>, rc::Error> InspectionCatalog::list(
    std::optional<rc::CriticalityLevel> filter_level, std::size_t limit,
    std::size_t offset) const {
  auto clamped = clamp_limit(limit);
  if (!clamped) {
    return std::unexpected(clamped.error());
  }
  std::shared_lock lock(mutex_);
  return repository_->list(filter_level, *clamped, offset);
}

std::expected<rc::InspectionPage, rc::Error> InspectionCatalog::list_page(
    std::optional<rc::CriticalityLevel> filter_level, std::size_t page,
    std::size_t page_size) const {
  if (page == 0) {
    return std::unexpected(rc::make_error(rc::ErrorCode::Validation, "pages are numbered from 1"));
  }
  auto clamped = clamp_limit(page_size);
  if (!clamped) {
    return std::unexpected(clamped.error());
  }

  rc::InspectionPage out;
  out.page = page;
  out.page_size = *clamped;

  std::shared_lock lock(mutex_);
  auto total = repository_->count(filter_level);
  if (!total) {
    return std::unexpected(total.error());
  }
  out.total_count = *total;
  out.total_pages = (out.total_count + out.page_size - 1) / out.page_size;
  if (page > out.total_pages) {
    return out;
  }

  auto items = repository_->list(filter_level, out.page_size, (page - 1) * out.page_size);
  if (!items) {
    return std::unexpected(items.error());
  }
  out.items = std::move(*items);
  return out;
}

std::expected<std::vector<rc::Inspection>, rc::Error> InspectionCatalog::search(
    std::string_view query, std::size_t limit) const {
  if (query.empty()) {
    return std::unexpected(rc::make_error(rc::ErrorCode::Validation, "search query is empty"));
  }
  auto clamped = clamp_limit(limit);
  if (!clamped) {
    return std::unexpected(clamped.error());
  }
  std::shared_lock lock(mutex_);
  return repository_->search(query, *clamped);
}

std::expected<void, rc::Error> InspectionCatalog::remove(std::int64_t id) {
  std::unique_lock lock(mutex_);

  // Files are only hidden inside the transaction; they are discarded once the
  // row deletion has committed and put back on any failure.
  std::vector<std::string> staged;
  auto removed = repository_->remove(id, [this, &staged](const rc::Inspection& record)
                                             -> std::expected<void, rc::Error> {
    for (const std::string& ref : {record.annotated_image_ref, record.filename}) {
      if (ref.empty()) continue;
      if (auto hidden = images_->stage_removal(ref); !hidden) {
        return std::unexpected(as_storage_error(hidden.error()));
      }
      staged.push_back(ref);
    }
    return {};
  });

  if (!removed) {
    for (auto it = staged.rbegin(); it != staged.rend(); ++it) {
      if (auto back = images_->restore_removal(*it); !back) {
        rc::log::error(std::format("Delete inspection {}: {}", id, back.error().message));
      }
    }
    if (removed.error().code != rc::ErrorCode::NotFound) {
      rc::log::error(std::format("Delete inspection {}: {}", id, removed.error().message));
    }
    return std::unexpected(removed.error());
  }

  for (const std::string& ref : staged) {
    if (auto gone = images_->commit_removal(ref); !gone) {
      rc::log::warn(std::format("Delete inspection {}: {}", id, gone.error().message));
    }
  }
  rc::log::info(std::format("Inspection {} deleted", id));
  return {};
}

std::expected<rc::InspectionStatistics, rc::Error> InspectionCatalog::statistics() const {
  std::shared_lock lock(mutex_);
  return repository_->statistics();
}

}  // namespace railwatch::catalog
