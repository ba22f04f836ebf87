#include <railwatch/catalog/filesystem_image_store.hpp>
#include <railwatch/catalog/inspection_catalog.hpp>
#include <railwatch/catalog/sqlite_inspection_repository.hpp>
#include "support/synthetic_images.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace rc = railwatch::core;
namespace rcat = railwatch::catalog;
namespace rv = railwatch::vision;
namespace rt = railwatch::test;

namespace {

/// Deterministic clock: one second later on every call.
std::function<rc::Timestamp()> stepping_clock() {
  auto tick = std::make_shared<std::atomic<int>>(0);
  return [tick] {
    return rc::Timestamp{std::chrono::seconds{1'714'566'600 + (*tick)++}};
  };
}

/// Repository whose insert always fails; everything else is delegated.
class RejectingRepository : public rcat::IInspectionRepository {
 public:
  explicit RejectingRepository(std::unique_ptr<rcat::IInspectionRepository> inner)
      : inner_(std::move(inner)) {}

  std::expected<rc::Inspection, rc::Error> insert(const rc::NewInspection&) override {
    return std::unexpected(rc::make_error(rc::ErrorCode::Storage, "database is locked"));
  }
  std::expected<rc::Inspection, rc::Error> get(std::int64_t id) const override {
    return inner_->get(id);
  }
  std::expected<std::vector<rc::Inspection>, rc::Error> list(
      std::optional<rc::CriticalityLevel> level, std::size_t limit,
      std::size_t offset) const override {
    return inner_->list(level, limit, offset);
  }
  std::expected<std::size_t, rc::Error> count(
      std::optional<rc::CriticalityLevel> level) const override {
    return inner_->count(level);
  }
  std::expected<std::vector<rc::Inspection>, rc::Error> search(std::string_view query,
                                                                std::size_t limit) const override {
    return inner_->search(query, limit);
  }
  std::expected<void, rc::Error> remove(std::int64_t id,
                                        const rcat::BeforeCommitHook& hook) override {
    return inner_->remove(id, hook);
  }
  std::expected<rc::InspectionStatistics, rc::Error> statistics() const override {
    return inner_->statistics();
  }

 private:
  std::unique_ptr<rcat::IInspectionRepository> inner_;
};

/// Repository whose delete runs the hook and then fails as if the commit
/// was refused, leaving the row in place.
class UncommittableDeleteRepository : public rcat::IInspectionRepository {
 public:
  explicit UncommittableDeleteRepository(std::unique_ptr<rcat::IInspectionRepository> inner)
      : inner_(std::move(inner)) {}

  std::expected<rc::Inspection, rc::Error> insert(const rc::NewInspection& record) override {
    return inner_->insert(record);
  }
  std::expected<rc::Inspection, rc::Error> get(std::int64_t id) const override {
    return inner_->get(id);
  }
  std::expected<std::vector<rc::Inspection>, rc::Error> list(
      std::optional<rc::CriticalityLevel> level, std::size_t limit,
      std::size_t offset) const override {
    return inner_->list(level, limit, offset);
  }
  std::expected<std::size_t, rc::Error> count(
      std::optional<rc::CriticalityLevel> level) const override {
    return inner_->count(level);
  }
  std::expected<std::vector<rc::Inspection>, rc::Error> search(std::string_view query,
                                                                std::size_t limit) const override {
    return inner_->search(query, limit);
  }
  std::expected<void, rc::Error> remove(std::int64_t id,
                                        const rcat::BeforeCommitHook& hook) override {
    auto existing = inner_->get(id);
    if (!existing) return std::unexpected(existing.error());
    if (auto ran = hook(*existing); !ran) return std::unexpected(ran.error());
    return std::unexpected(rc::make_error(rc::ErrorCode::Storage, "commit failed"));
  }
  std::expected<rc::InspectionStatistics, rc::Error> statistics() const override {
    return inner_->statistics();
  }

 private:
  std::unique_ptr<rcat::IInspectionRepository> inner_;
};

/// Image store that fails the n-th save and/or the n-th staged removal
/// (1-based; 0 never fails).
class FlakyImageStore : public rcat::IImageStore {
 public:
  FlakyImageStore(std::shared_ptr<rcat::IImageStore> inner, int fail_save_on,
                  int fail_stage_on = 0)
      : inner_(std::move(inner)), fail_save_on_(fail_save_on), fail_stage_on_(fail_stage_on) {}

  std::expected<std::string, rc::Error> save(std::span<const std::byte> bytes,
                                             std::string_view name) override {
    if (++saves_ == fail_save_on_) {
      return std::unexpected(rc::make_error(rc::ErrorCode::Storage, "disk full"));
    }
    return inner_->save(bytes, name);
  }
  std::expected<void, rc::Error> remove(std::string_view reference) override {
    return inner_->remove(reference);
  }
  std::expected<void, rc::Error> stage_removal(std::string_view reference) override {
    if (++stages_ == fail_stage_on_) {
      return std::unexpected(rc::make_error(rc::ErrorCode::Storage, "permission denied"));
    }
    return inner_->stage_removal(reference);
  }
  std::expected<void, rc::Error> restore_removal(std::string_view reference) override {
    return inner_->restore_removal(reference);
  }
  std::expected<void, rc::Error> commit_removal(std::string_view reference) override {
    return inner_->commit_removal(reference);
  }
  bool contains(std::string_view reference) const override { return inner_->contains(reference); }

 private:
  std::shared_ptr<rcat::IImageStore> inner_;
  int fail_save_on_;
  int fail_stage_on_;
  int saves_{0};
  int stages_{0};
};

std::unique_ptr<rcat::IInspectionRepository> memory_repository() {
  auto repo = rcat::SqliteInspectionRepository::open(":memory:");
  EXPECT_TRUE(repo.has_value());
  return repo ? std::move(*repo) : nullptr;
}

std::shared_ptr<rcat::FileSystemImageStore> image_store(const rt::TempDir& dir) {
  auto store = rcat::FileSystemImageStore::open(dir.path());
  EXPECT_TRUE(store.has_value());
  return store ? std::shared_ptr<rcat::FileSystemImageStore>(std::move(*store)) : nullptr;
}

rcat::CatalogOptions test_options() {
  rcat::CatalogOptions options;
  options.clock = stepping_clock();
  return options;
}

rc::NewInspection seeded_record(int i, std::uint32_t anomalies) {
  const auto level = rc::CriticalityScorer::level_for(anomalies);
  rc::NewInspection r;
  r.original_filename = "seed_" + std::to_string(i) + ".png";
  r.filename = r.original_filename;
  r.upload_date = rc::Timestamp{std::chrono::seconds{1'700'000'000 + i}};
  r.anomalies_count = anomalies;
  r.criticality_score = rc::CriticalityScorer::score_for(anomalies);
  r.criticality_level = level;
  r.notes = rc::CriticalityScorer::notes_for(level, anomalies);
  return r;
}

}  // namespace

TEST(InspectionCatalog, AnalyzeRecordsAndGetReturnsSameRecord) {
  rt::TempDir dir;
  auto store = image_store(dir);
  rcat::InspectionCatalog catalog(rv::AnomalyDetector{}, memory_repository(), store,
                                  test_options());

  auto recorded = catalog.analyze_and_record(rt::squares_png(3), "Rail Image.PNG");
  ASSERT_TRUE(recorded.has_value()) << recorded.error().message;
  EXPECT_EQ(recorded->anomalies_count, 3u);
  EXPECT_EQ(recorded->criticality_level, rc::CriticalityLevel::Low);
  EXPECT_NEAR(recorded->criticality_score, 0.14, 1e-9);
  EXPECT_EQ(recorded->original_filename, "Rail Image.PNG");
  EXPECT_EQ(recorded->filename, "20240501_123000_Rail_Image.png");
  EXPECT_EQ(recorded->annotated_image_ref, "20240501_123000_Rail_Image_annotated.png");
  EXPECT_EQ(recorded->image_width, 1000u);
  EXPECT_EQ(recorded->image_height, 800u);
  EXPECT_TRUE(store->contains(recorded->filename));
  EXPECT_TRUE(store->contains(recorded->annotated_image_ref));

  auto fetched = catalog.get(recorded->id);
  ASSERT_TRUE(fetched.has_value());
  EXPECT_EQ(*fetched, *recorded);
}

TEST(InspectionCatalog, SameNameTwiceGetsDistinctFiles) {
  rt::TempDir dir;
  auto store = image_store(dir);
  rcat::CatalogOptions options;
  options.clock = [] { return rc::Timestamp{std::chrono::seconds{1'714'566'600}}; };
  rcat::InspectionCatalog catalog(rv::AnomalyDetector{}, memory_repository(), store, options);

  const auto bytes = rt::squares_png(1);
  auto a = catalog.analyze_and_record(bytes, "track.jpg");
  auto b = catalog.analyze_and_record(bytes, "track.jpg");
  ASSERT_TRUE(a && b);
  EXPECT_NE(a->id, b->id);
  EXPECT_NE(a->filename, b->filename);
  EXPECT_NE(a->annotated_image_ref, b->annotated_image_ref);
  EXPECT_EQ(dir.file_count(), 4u);
}

TEST(InspectionCatalog, ValidationRejectsBadUploads) {
  rt::TempDir dir;
  rcat::CatalogOptions options = test_options();
  options.max_upload_bytes = 100;
  rcat::InspectionCatalog catalog(rv::AnomalyDetector{}, memory_repository(), image_store(dir),
                                  options);

  const auto bytes = rt::squares_png(1);
  auto no_name = catalog.analyze_and_record(bytes, "");
  ASSERT_FALSE(no_name.has_value());
  EXPECT_EQ(no_name.error().code, rc::ErrorCode::Validation);

  auto gif = catalog.analyze_and_record(bytes, "track.gif");
  ASSERT_FALSE(gif.has_value());
  EXPECT_EQ(gif.error().code, rc::ErrorCode::Validation);

  auto empty = catalog.analyze_and_record({}, "track.png");
  ASSERT_FALSE(empty.has_value());
  EXPECT_EQ(empty.error().code, rc::ErrorCode::Validation);

  ASSERT_GT(bytes.size(), 100u);
  auto too_big = catalog.analyze_and_record(bytes, "track.png");
  ASSERT_FALSE(too_big.has_value());
  EXPECT_EQ(too_big.error().code, rc::ErrorCode::Validation);

  EXPECT_EQ(catalog.statistics()->total, 0u);
  EXPECT_EQ(dir.file_count(), 0u);
}

TEST(InspectionCatalog, UndecodableImageLeavesNothingBehind) {
  rt::TempDir dir;
  rcat::InspectionCatalog catalog(rv::AnomalyDetector{}, memory_repository(), image_store(dir),
                                  test_options());
  std::vector<std::byte> junk(256, std::byte{0x17});
  auto result = catalog.analyze_and_record(junk, "broken.png");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code, rc::ErrorCode::Decode);
  EXPECT_EQ(catalog.statistics()->total, 0u);
  EXPECT_EQ(dir.file_count(), 0u);
}

TEST(InspectionCatalog, RepositoryFailureRemovesSavedImages) {
  rt::TempDir dir;
  auto repo = std::make_unique<RejectingRepository>(memory_repository());
  rcat::InspectionCatalog catalog(rv::AnomalyDetector{}, std::move(repo), image_store(dir),
                                  test_options());

  auto result = catalog.analyze_and_record(rt::squares_png(2), "track.png");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code, rc::ErrorCode::Storage);
  EXPECT_EQ(catalog.statistics()->total, 0u);
  EXPECT_EQ(dir.file_count(), 0u);
}

TEST(InspectionCatalog, AnnotatedSaveFailureRemovesOriginal) {
  rt::TempDir dir;
  auto flaky = std::make_shared<FlakyImageStore>(image_store(dir), 2);
  rcat::InspectionCatalog catalog(rv::AnomalyDetector{}, memory_repository(), flaky,
                                  test_options());

  auto result = catalog.analyze_and_record(rt::squares_png(2), "track.png");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code, rc::ErrorCode::Storage);
  EXPECT_EQ(catalog.statistics()->total, 0u);
  EXPECT_EQ(dir.file_count(), 0u);
}

TEST(InspectionCatalog, DeleteRemovesRecordAndFiles) {
  rt::TempDir dir;
  auto store = image_store(dir);
  rcat::InspectionCatalog catalog(rv::AnomalyDetector{}, memory_repository(), store,
                                  test_options());

  auto recorded = catalog.analyze_and_record(rt::squares_png(1), "track.jpg");
  ASSERT_TRUE(recorded.has_value());
  ASSERT_EQ(dir.file_count(), 2u);

  ASSERT_TRUE(catalog.remove(recorded->id).has_value());
  EXPECT_EQ(dir.file_count(), 0u);

  auto lookup = catalog.get(recorded->id);
  ASSERT_FALSE(lookup.has_value());
  EXPECT_EQ(lookup.error().code, rc::ErrorCode::NotFound);

  auto again = catalog.remove(recorded->id);
  ASSERT_FALSE(again.has_value());
  EXPECT_EQ(again.error().code, rc::ErrorCode::NotFound);
}

TEST(InspectionCatalog, FailedFileReleaseKeepsRecordAndBothFiles) {
  rt::TempDir dir;
  auto store = image_store(dir);
  auto flaky = std::make_shared<FlakyImageStore>(store, 0, 2);
  rcat::InspectionCatalog catalog(rv::AnomalyDetector{}, memory_repository(), flaky,
                                  test_options());

  auto recorded = catalog.analyze_and_record(rt::squares_png(1), "track.png");
  ASSERT_TRUE(recorded.has_value());

  auto removed = catalog.remove(recorded->id);
  ASSERT_FALSE(removed.has_value());
  EXPECT_EQ(removed.error().code, rc::ErrorCode::Storage);

  auto still_there = catalog.get(recorded->id);
  ASSERT_TRUE(still_there.has_value());
  EXPECT_EQ(*still_there, *recorded);
  EXPECT_TRUE(store->contains(recorded->filename));
  EXPECT_TRUE(store->contains(recorded->annotated_image_ref));
  EXPECT_EQ(dir.file_count(), 2u);

  // The next attempt succeeds and releases everything.
  ASSERT_TRUE(catalog.remove(recorded->id).has_value());
  EXPECT_EQ(dir.file_count(), 0u);
}

TEST(InspectionCatalog, RefusedCommitRestoresFiles) {
  rt::TempDir dir;
  auto store = image_store(dir);
  auto repo = std::make_unique<UncommittableDeleteRepository>(memory_repository());
  rcat::InspectionCatalog catalog(rv::AnomalyDetector{}, std::move(repo), store,
                                  test_options());

  auto recorded = catalog.analyze_and_record(rt::squares_png(2), "switch.jpg");
  ASSERT_TRUE(recorded.has_value());

  auto removed = catalog.remove(recorded->id);
  ASSERT_FALSE(removed.has_value());
  EXPECT_EQ(removed.error().code, rc::ErrorCode::Storage);

  EXPECT_TRUE(catalog.get(recorded->id).has_value());
  EXPECT_TRUE(store->contains(recorded->filename));
  EXPECT_TRUE(store->contains(recorded->annotated_image_ref));
  EXPECT_EQ(dir.file_count(), 2u);
}

TEST(InspectionCatalog, PagesThroughFilteredListing) {
  rt::TempDir dir;
  auto repo = memory_repository();
  ASSERT_NE(repo, nullptr);
  for (int i = 0; i < 25; ++i) {
    ASSERT_TRUE(repo->insert(seeded_record(i, i < 12 ? 20u : 2u)).has_value());
  }
  rcat::InspectionCatalog catalog(rv::AnomalyDetector{}, std::move(repo), image_store(dir),
                                  test_options());

  auto first = catalog.list_page(rc::CriticalityLevel::Medium, 1, 10);
  ASSERT_TRUE(first.has_value());
  EXPECT_EQ(first->total_count, 12u);
  EXPECT_EQ(first->total_pages, 2u);
  EXPECT_EQ(first->items.size(), 10u);
  EXPECT_EQ(first->items.front().original_filename, "seed_11.png");

  auto second = catalog.list_page(rc::CriticalityLevel::Medium, 2, 10);
  ASSERT_TRUE(second.has_value());
  ASSERT_EQ(second->items.size(), 2u);
  EXPECT_EQ(second->items.back().original_filename, "seed_0.png");

  auto past_end = catalog.list_page(rc::CriticalityLevel::Medium, 3, 10);
  ASSERT_TRUE(past_end.has_value());
  EXPECT_TRUE(past_end->items.empty());
  EXPECT_EQ(past_end->total_pages, 2u);

  auto unfiltered = catalog.list_page(std::nullopt, 1, 10);
  ASSERT_TRUE(unfiltered.has_value());
  EXPECT_EQ(unfiltered->total_count, 25u);
  EXPECT_EQ(unfiltered->total_pages, 3u);

  auto page_zero = catalog.list_page(std::nullopt, 0, 10);
  ASSERT_FALSE(page_zero.has_value());
  EXPECT_EQ(page_zero.error().code, rc::ErrorCode::Validation);
}

TEST(InspectionCatalog, ListClampsLimit) {
  rt::TempDir dir;
  auto repo = memory_repository();
  ASSERT_NE(repo, nullptr);
  for (int i = 0; i < 5; ++i) {
    ASSERT_TRUE(repo->insert(seeded_record(i, 1)).has_value());
  }
  rcat::CatalogOptions options = test_options();
  options.max_list_limit = 3;
  rcat::InspectionCatalog catalog(rv::AnomalyDetector{}, std::move(repo), image_store(dir),
                                  options);

  auto listed = catalog.list(std::nullopt, 100);
  ASSERT_TRUE(listed.has_value());
  EXPECT_EQ(listed->size(), 3u);

  auto zero = catalog.list(std::nullopt, 0);
  ASSERT_FALSE(zero.has_value());
  EXPECT_EQ(zero.error().code, rc::ErrorCode::Validation);
}

TEST(InspectionCatalog, SearchMatchesCaseInsensitively) {
  rt::TempDir dir;
  rcat::InspectionCatalog catalog(rv::AnomalyDetector{}, memory_repository(), image_store(dir),
                                  test_options());
  const auto bytes = rt::encode(rt::blank_canvas(200, 100), ".jpg");
  ASSERT_TRUE(catalog.analyze_and_record(bytes, "rail_image.jpg").has_value());
  ASSERT_TRUE(catalog.analyze_and_record(bytes, "bridge.jpg").has_value());

  auto found = catalog.search("Rail", 10);
  ASSERT_TRUE(found.has_value());
  ASSERT_EQ(found->size(), 1u);
  EXPECT_EQ(found->front().original_filename, "rail_image.jpg");

  auto empty = catalog.search("", 10);
  ASSERT_FALSE(empty.has_value());
  EXPECT_EQ(empty.error().code, rc::ErrorCode::Validation);
}

TEST(InspectionCatalog, StatisticsOnEmptyCatalog) {
  rt::TempDir dir;
  rcat::InspectionCatalog catalog(rv::AnomalyDetector{}, memory_repository(), image_store(dir),
                                  test_options());
  auto stats = catalog.statistics();
  ASSERT_TRUE(stats.has_value());
  EXPECT_EQ(stats->total, 0u);
  EXPECT_DOUBLE_EQ(stats->average_anomalies, 0.0);
  EXPECT_EQ(stats->count(rc::CriticalityLevel::Low), 0u);
  EXPECT_EQ(stats->count(rc::CriticalityLevel::Medium), 0u);
  EXPECT_EQ(stats->count(rc::CriticalityLevel::High), 0u);
}
