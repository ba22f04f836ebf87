#include <railwatch/app/ingest_runner_tbb.hpp>

#ifdef RAILWATCH_HAS_TBB

#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <cstddef>

namespace railwatch::app {

void ingest_batch_tbb(railwatch::catalog::InspectionCatalog& catalog,
                      const std::vector<IngestItem>& items,
                      const IngestCallback& callback) {
  if (items.empty()) return;

  tbb::parallel_for(
      tbb::blocked_range<std::size_t>(0, items.size()),
      [&catalog, &items, &callback](const tbb::blocked_range<std::size_t>& range) {
        for (std::size_t i = range.begin(); i != range.end(); ++i) {
          IngestOutcome outcome{i, items[i].original_filename,
                                catalog.analyze_and_record(items[i].bytes,
                                                           items[i].original_filename)};
          if (callback) callback(outcome);
        }
      });
}

}  // namespace railwatch::app

#endif  // RAILWATCH_HAS_TBB
