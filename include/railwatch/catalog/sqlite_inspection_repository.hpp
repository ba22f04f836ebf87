#pragma once

#include <railwatch/catalog/inspection_repository.hpp>
#include <expected>
#include <memory>
#include <string>

struct sqlite3;

namespace railwatch::catalog {

/// SQLite-backed repository.
///
/// TABLE inspections
///   id INTEGER PRIMARY KEY AUTOINCREMENT, filename, original_filename,
///   upload_date (INTEGER, µs since epoch), anomalies_count, criticality_score,
///   criticality_level ('low' | 'medium' | 'high'), processing_time, notes,
///   annotated_image_ref, image_width, image_height
/// INDEX on (upload_date, id) and (criticality_level, upload_date).
///
/// One connection opened in serialized mode; every call prepares its own
/// statements, so concurrent const calls are safe. Mutations use
/// BEGIN IMMEDIATE transactions.
class SqliteInspectionRepository : public IInspectionRepository {
 public:
  /// Opens (creating if needed) the database at path; ":memory:" for a
  /// private in-memory database.
  [[nodiscard]] static std::expected<std::unique_ptr<SqliteInspectionRepository>, railwatch::core::Error>
  open(const std::string& path);

  ~SqliteInspectionRepository() override;

  SqliteInspectionRepository(const SqliteInspectionRepository&) = delete;
  SqliteInspectionRepository& operator=(const SqliteInspectionRepository&) = delete;

  [[nodiscard]] std::expected<railwatch::core::Inspection, railwatch::core::Error>
  insert(const railwatch::core::NewInspection& record) override;

  [[nodiscard]] std::expected<railwatch::core::Inspection, railwatch::core::Error>
  get(std::int64_t id) const override;

  [[nodiscard]] std::expected<std::vector<railwatch::core::Inspection>, railwatch::core::Error>
  list(std::optional<railwatch::core::CriticalityLevel> level,
       std::size_t limit,
       std::size_t offset) const override;

  [[nodiscard]] std::expected<std::size_t, railwatch::core::Error> count(
      std::optional<railwatch::core::CriticalityLevel> level) const override;

  [[nodiscard]] std::expected<std::vector<railwatch::core::Inspection>, railwatch::core::Error>
  search(std::string_view query, std::size_t limit) const override;

  [[nodiscard]] std::expected<void, railwatch::core::Error> remove(
      std::int64_t id, const BeforeCommitHook& before_commit) override;

  [[nodiscard]] std::expected<railwatch::core::InspectionStatistics, railwatch::core::Error>
  statistics() const override;

  [[nodiscard]] const std::string& path() const noexcept { return path_; }

 private:
  struct Closer {
    void operator()(sqlite3* db) const noexcept;
  };

  SqliteInspectionRepository(std::string path, std::unique_ptr<sqlite3, Closer> db);

  std::string path_;
  std::unique_ptr<sqlite3, Closer> db_;
};

}  // namespace railwatch::catalog
