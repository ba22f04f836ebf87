#include <railwatch/app/ingest_runner.hpp>
#include <railwatch/catalog/filesystem_image_store.hpp>
#include <railwatch/catalog/sqlite_inspection_repository.hpp>
#include "support/synthetic_images.hpp"
#include <gtest/gtest.h>
#include <fstream>
#include <mutex>
#include <set>
#include <vector>

namespace rc = railwatch::core;
namespace ra = railwatch::app;
namespace rcat = railwatch::catalog;
namespace rt = railwatch::test;

namespace {

std::unique_ptr<rcat::InspectionCatalog> make_catalog(const rt::TempDir& dir) {
  auto repo = rcat::SqliteInspectionRepository::open(":memory:");
  auto store = rcat::FileSystemImageStore::open(dir.path() / "uploads");
  EXPECT_TRUE(repo.has_value());
  EXPECT_TRUE(store.has_value());
  return std::make_unique<rcat::InspectionCatalog>(
      railwatch::vision::AnomalyDetector{}, std::move(*repo),
      std::shared_ptr<rcat::IImageStore>(std::move(*store)));
}

std::vector<ra::IngestItem> make_items(std::size_t n) {
  std::vector<ra::IngestItem> items;
  for (std::size_t i = 0; i < n; ++i) {
    items.push_back({"km_" + std::to_string(i) + ".png",
                     rt::squares_png(static_cast<int>(i % 4))});
  }
  return items;
}

}  // namespace

TEST(IngestRunner, ReadItemUsesFinalComponent) {
  rt::TempDir dir;
  const auto path = dir.path() / "sector.7.png";
  const auto bytes = rt::squares_png(1);
  {
    std::ofstream out(path, std::ios::binary);
    out.write(reinterpret_cast<const char*>(bytes.data()),
              static_cast<std::streamsize>(bytes.size()));
  }
  auto item = ra::read_ingest_item(path.string());
  ASSERT_TRUE(item.has_value());
  EXPECT_EQ(item->original_filename, "sector.7.png");
  EXPECT_EQ(item->bytes, bytes);

  auto missing = ra::read_ingest_item((dir.path() / "missing.png").string());
  ASSERT_FALSE(missing.has_value());
  EXPECT_EQ(missing.error().code, rc::ErrorCode::Validation);
}

TEST(IngestRunner, SequentialReportsEveryItemInOrder) {
  rt::TempDir dir;
  auto catalog = make_catalog(dir);
  auto items = make_items(3);
  items.push_back({"notes.txt", rt::squares_png(1)});

  std::vector<std::size_t> order;
  std::size_t failures = 0;
  ra::ingest_batch(*catalog, items, [&](const ra::IngestOutcome& o) {
    order.push_back(o.index);
    if (!o.result) {
      ++failures;
      EXPECT_EQ(o.original_filename, "notes.txt");
      EXPECT_EQ(o.result.error().code, rc::ErrorCode::Validation);
    } else {
      EXPECT_EQ(o.result->anomalies_count, o.index % 4);
    }
  });
  EXPECT_EQ(order, (std::vector<std::size_t>{0, 1, 2, 3}));
  EXPECT_EQ(failures, 1u);
  EXPECT_EQ(catalog->statistics()->total, 3u);
}

TEST(IngestRunner, ParallelAssignsUniqueIds) {
  rt::TempDir dir;
  auto catalog = make_catalog(dir);
  const auto items = make_items(8);

  std::mutex mu;
  std::set<std::int64_t> ids;
  std::set<std::size_t> indices;
  ra::ingest_batch_parallel(*catalog, items, [&](const ra::IngestOutcome& o) {
    std::lock_guard lock(mu);
    ASSERT_TRUE(o.result.has_value()) << o.result.error().message;
    ids.insert(o.result->id);
    indices.insert(o.index);
  }, 4);

  EXPECT_EQ(ids.size(), 8u);
  EXPECT_EQ(indices.size(), 8u);
  EXPECT_EQ(catalog->statistics()->total, 8u);
  auto listed = catalog->list(std::nullopt, 100);
  ASSERT_TRUE(listed.has_value());
  EXPECT_EQ(listed->size(), 8u);
}

TEST(IngestRunner, EmptyBatchIsNoop) {
  rt::TempDir dir;
  auto catalog = make_catalog(dir);
  std::size_t calls = 0;
  ra::ingest_batch_parallel(*catalog, {}, [&](const ra::IngestOutcome&) { ++calls; });
  EXPECT_EQ(calls, 0u);
}
