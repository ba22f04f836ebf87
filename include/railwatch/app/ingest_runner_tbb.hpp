#pragma once

#include <railwatch/app/ingest_runner.hpp>
#include <railwatch/catalog/inspection_catalog.hpp>
#include <vector>

#ifdef RAILWATCH_HAS_TBB

namespace railwatch::app {

/// Analyzes items with tbb::parallel_for over the shared catalog.
///
/// Detection runs concurrently on TBB worker threads; record writes are
/// serialized by the catalog's writer lock. The callback receives one outcome
/// per item (success or error) and must be thread-safe. Returns after every
/// item has been processed.
void ingest_batch_tbb(railwatch::catalog::InspectionCatalog& catalog,
                      const std::vector<IngestItem>& items,
                      const IngestCallback& callback);

}  // namespace railwatch::app

#endif  // RAILWATCH_HAS_TBB
