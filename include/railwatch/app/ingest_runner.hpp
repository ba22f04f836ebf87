#pragma once

#include <railwatch/catalog/inspection_catalog.hpp>
#include <railwatch/core/error.hpp>
#include <railwatch/core/inspection.hpp>
#include <cstddef>
#include <expected>
#include <functional>
#include <string>
#include <vector>

namespace railwatch::app {

/// One image queued for analysis.
struct IngestItem {
  std::string original_filename;
  std::vector<std::byte> bytes;
};

/// Result for one item; index is the item's position in the submitted batch.
struct IngestOutcome {
  std::size_t index{0};
  std::string original_filename;
  std::expected<railwatch::core::Inspection, railwatch::core::Error> result;
};

/// Called once per item; may be invoked from worker threads and must be
/// thread-safe when used with the parallel runners.
using IngestCallback = std::function<void(const IngestOutcome&)>;

/// Reads path into an IngestItem named after the file's final component.
/// ErrorCode::Validation if the file cannot be read.
[[nodiscard]] std::expected<IngestItem, railwatch::core::Error> read_ingest_item(
    const std::string& path);

/// Analyzes items one after another, in order.
void ingest_batch(railwatch::catalog::InspectionCatalog& catalog,
                  const std::vector<IngestItem>& items,
                  const IngestCallback& callback);

/// Analyzes items on num_workers threads (0 = hardware concurrency). Detection
/// overlaps across workers; the catalog serializes the writes. All workers are
/// joined before returning.
void ingest_batch_parallel(railwatch::catalog::InspectionCatalog& catalog,
                           const std::vector<IngestItem>& items,
                           const IngestCallback& callback,
                           std::size_t num_workers = 0);

}  // namespace railwatch::app
