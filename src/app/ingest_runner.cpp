#include <railwatch/app/ingest_runner.hpp>
#include <railwatch/catalog/filename.hpp>
#include <algorithm>
#include <atomic>
#include <cstring>
#include <format>
#include <fstream>
#include <iterator>
#include <thread>
#include <vector>

namespace railwatch::app {

namespace rc = railwatch::core;

namespace {

std::size_t effective_workers(std::size_t num_workers) {
  if (num_workers > 0) return num_workers;
  const unsigned hw = std::thread::hardware_concurrency();
  return hw > 0 ? static_cast<std::size_t>(hw) : 1;
}

IngestOutcome ingest_one(railwatch::catalog::InspectionCatalog& catalog,
                         const IngestItem& item,
                         std::size_t index) {
  return IngestOutcome{index, item.original_filename,
                       catalog.analyze_and_record(item.bytes, item.original_filename)};
}

}  // namespace

std::expected<IngestItem, rc::Error> read_ingest_item(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return std::unexpected(
        rc::make_error(rc::ErrorCode::Validation, std::format("cannot read {}", path)));
  }
  std::vector<char> raw{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};

  IngestItem item;
  const auto parts = railwatch::catalog::split_extension(path);
  item.original_filename = parts.stem + parts.extension;
  item.bytes.resize(raw.size());
  std::memcpy(item.bytes.data(), raw.data(), raw.size());
  return item;
}

void ingest_batch(railwatch::catalog::InspectionCatalog& catalog,
                  const std::vector<IngestItem>& items,
                  const IngestCallback& callback) {
  for (std::size_t i = 0; i < items.size(); ++i) {
    IngestOutcome outcome = ingest_one(catalog, items[i], i);
    if (callback) callback(outcome);
  }
}

void ingest_batch_parallel(railwatch::catalog::InspectionCatalog& catalog,
                           const std::vector<IngestItem>& items,
                           const IngestCallback& callback,
                           std::size_t num_workers) {
  const std::size_t n = items.size();
  if (n == 0) return;

  const std::size_t workers = std::min(effective_workers(num_workers), n);
  if (workers <= 1) {
    ingest_batch(catalog, items, callback);
    return;
  }

  std::atomic<std::size_t> next{0};
  auto worker = [&]() {
    for (std::size_t idx = next.fetch_add(1); idx < n; idx = next.fetch_add(1)) {
      IngestOutcome outcome = ingest_one(catalog, items[idx], idx);
      if (callback) callback(outcome);
    }
  };

  std::vector<std::thread> threads;
  threads.reserve(workers);
  for (std::size_t i = 0; i < workers; ++i) {
    threads.emplace_back(worker);
  }
  for (auto& t : threads) {
    t.join();
  }
}

}  // namespace railwatch::app
