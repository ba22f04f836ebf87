#include <railwatch/catalog/sqlite_inspection_repository.hpp>
#include <railwatch/core/log.hpp>
#include <sqlite3.h>
#include <chrono>
#include <format>
#include <limits>
#include <optional>
#include <string>
#include <utility>

namespace railwatch::catalog {

namespace rc = railwatch::core;

namespace {

constexpr const char* kSchema = R"sql(
CREATE TABLE IF NOT EXISTS inspections (
  id                  INTEGER PRIMARY KEY AUTOINCREMENT,
  filename            TEXT    NOT NULL,
  original_filename   TEXT    NOT NULL,
  upload_date         INTEGER NOT NULL,
  anomalies_count     INTEGER NOT NULL DEFAULT 0 CHECK (anomalies_count >= 0),
  criticality_score   REAL    NOT NULL DEFAULT 0.0,
  criticality_level   TEXT    NOT NULL CHECK (criticality_level IN ('low', 'medium', 'high')),
  processing_time     REAL    NOT NULL DEFAULT 0.0,
  notes               TEXT    NOT NULL DEFAULT '',
  annotated_image_ref TEXT    NOT NULL DEFAULT '',
  image_width         INTEGER NOT NULL DEFAULT 0,
  image_height        INTEGER NOT NULL DEFAULT 0
);
CREATE INDEX IF NOT EXISTS idx_inspections_upload ON inspections (upload_date DESC, id DESC);
CREATE INDEX IF NOT EXISTS idx_inspections_level ON inspections (criticality_level, upload_date DESC);
)sql";

constexpr const char* kColumns =
    "id, filename, original_filename, upload_date, anomalies_count, criticality_score, "
    "criticality_level, processing_time, notes, annotated_image_ref, image_width, image_height";

constexpr const char* kOrder = " ORDER BY upload_date DESC, id DESC";

rc::Error storage_error(sqlite3* db, std::string_view what) {
  return rc::make_error(rc::ErrorCode::Storage,
                        std::format("{}: {}", what, db ? sqlite3_errmsg(db) : "no database"));
}

/// Owns one prepared statement.
class Statement {
 public:
  Statement(sqlite3* db, const std::string& sql) {
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt_, nullptr) != SQLITE_OK) {
      stmt_ = nullptr;
    }
  }
  ~Statement() { sqlite3_finalize(stmt_); }

  Statement(const Statement&) = delete;
  Statement& operator=(const Statement&) = delete;

  [[nodiscard]] bool ok() const noexcept { return stmt_ != nullptr; }
  [[nodiscard]] sqlite3_stmt* get() const noexcept { return stmt_; }

  bool bind(int idx, std::int64_t v) { return sqlite3_bind_int64(stmt_, idx, v) == SQLITE_OK; }
  bool bind(int idx, double v) { return sqlite3_bind_double(stmt_, idx, v) == SQLITE_OK; }
  bool bind(int idx, std::string_view v) {
    return sqlite3_bind_text(stmt_, idx, v.data(), static_cast<int>(v.size()),
                             SQLITE_TRANSIENT) == SQLITE_OK;
  }

  /// SQLITE_ROW, SQLITE_DONE or an error code.
  int step() { return sqlite3_step(stmt_); }

 private:
  sqlite3_stmt* stmt_{nullptr};
};

/// BEGIN IMMEDIATE on construction; rolls back unless commit() succeeded.
class Transaction {
 public:
  explicit Transaction(sqlite3* db) : db_(db) {
    began_ = sqlite3_exec(db_, "BEGIN IMMEDIATE", nullptr, nullptr, nullptr) == SQLITE_OK;
  }
  ~Transaction() {
    if (began_ && !committed_) {
      sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr);
    }
  }

  Transaction(const Transaction&) = delete;
  Transaction& operator=(const Transaction&) = delete;

  [[nodiscard]] bool began() const noexcept { return began_; }

  [[nodiscard]] bool commit() {
    committed_ = sqlite3_exec(db_, "COMMIT", nullptr, nullptr, nullptr) == SQLITE_OK;
    return committed_;
  }

 private:
  sqlite3* db_;
  bool began_{false};
  bool committed_{false};
};

std::string column_text(sqlite3_stmt* stmt, int col) {
  const auto* text = sqlite3_column_text(stmt, col);
  return text ? std::string(reinterpret_cast<const char*>(text)) : std::string();
}

rc::Inspection read_row(sqlite3_stmt* stmt) {
  rc::Inspection r;
  r.id = sqlite3_column_int64(stmt, 0);
  r.filename = column_text(stmt, 1);
  r.original_filename = column_text(stmt, 2);
  r.upload_date = rc::Timestamp(std::chrono::microseconds(sqlite3_column_int64(stmt, 3)));
  r.anomalies_count = static_cast<std::uint32_t>(sqlite3_column_int64(stmt, 4));
  r.criticality_score = sqlite3_column_double(stmt, 5);
  // CHECK constraint guarantees a known level.
  r.criticality_level = rc::parse_criticality_level(column_text(stmt, 6)).value_or(rc::CriticalityLevel::Low);
  r.processing_time = sqlite3_column_double(stmt, 7);
  r.notes = column_text(stmt, 8);
  r.annotated_image_ref = column_text(stmt, 9);
  r.image_width = static_cast<std::uint32_t>(sqlite3_column_int64(stmt, 10));
  r.image_height = static_cast<std::uint32_t>(sqlite3_column_int64(stmt, 11));
  return r;
}

std::expected<std::vector<rc::Inspection>, rc::Error> collect_rows(sqlite3* db, Statement& stmt) {
  std::vector<rc::Inspection> out;
  int rc_step = SQLITE_ROW;
  while ((rc_step = stmt.step()) == SQLITE_ROW) {
    out.push_back(read_row(stmt.get()));
  }
  if (rc_step != SQLITE_DONE) {
    return std::unexpected(storage_error(db, "query failed"));
  }
  return out;
}

/// SQLite binds signed 64-bit; clamp huge unsigned limits.
std::int64_t to_sql_count(std::size_t n) {
  constexpr auto kMax = static_cast<std::size_t>(std::numeric_limits<std::int64_t>::max());
  return static_cast<std::int64_t>(n > kMax ? kMax : n);
}

}  // namespace

void SqliteInspectionRepository::Closer::operator()(sqlite3* db) const noexcept {
  sqlite3_close_v2(db);
}

SqliteInspectionRepository::SqliteInspectionRepository(std::string path,
                                                       std::unique_ptr<sqlite3, Closer> db)
    : path_(std::move(path)), db_(std::move(db)) {}

SqliteInspectionRepository::~SqliteInspectionRepository() = default;

std::expected<std::unique_ptr<SqliteInspectionRepository>, rc::Error>
SqliteInspectionRepository::open(const std::string& path) {
  sqlite3* raw = nullptr;
  const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
  const int rc_open = sqlite3_open_v2(path.c_str(), &raw, flags, nullptr);
  std::unique_ptr<sqlite3, Closer> db(raw);
  if (rc_open != SQLITE_OK) {
    return std::unexpected(storage_error(db.get(), std::format("cannot open database {}", path)));
  }

  sqlite3_busy_timeout(db.get(), 5000);

  char* err = nullptr;
  if (sqlite3_exec(db.get(), kSchema, nullptr, nullptr, &err) != SQLITE_OK) {
    std::string msg = err ? err : "unknown error";
    sqlite3_free(err);
    return std::unexpected(rc::make_error(
        rc::ErrorCode::Storage, std::format("cannot initialise schema in {}: {}", path, msg)));
  }
  rc::log::info(std::format("Inspection repository: opened {}", path));
  return std::unique_ptr<SqliteInspectionRepository>(
      new SqliteInspectionRepository(path, std::move(db)));
}

std::expected<rc::Inspection, rc::Error> SqliteInspectionRepository::insert(
    const rc::NewInspection& record) {
  Transaction tx(db_.get());
  if (!tx.began()) {
    return std::unexpected(storage_error(db_.get(), "cannot begin insert"));
  }

  Statement stmt(db_.get(),
                 "INSERT INTO inspections (filename, original_filename, upload_date, "
                 "anomalies_count, criticality_score, criticality_level, processing_time, notes, "
                 "annotated_image_ref, image_width, image_height) "
                 "VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?11)");
  if (!stmt.ok()) {
    return std::unexpected(storage_error(db_.get(), "cannot prepare insert"));
  }

  const bool bound =
      stmt.bind(1, std::string_view(record.filename)) &&
      stmt.bind(2, std::string_view(record.original_filename)) &&
      stmt.bind(3, static_cast<std::int64_t>(record.upload_date.time_since_epoch().count())) &&
      stmt.bind(4, static_cast<std::int64_t>(record.anomalies_count)) &&
      stmt.bind(5, record.criticality_score) &&
      stmt.bind(6, rc::to_string(record.criticality_level)) &&
      stmt.bind(7, record.processing_time) &&
      stmt.bind(8, std::string_view(record.notes)) &&
      stmt.bind(9, std::string_view(record.annotated_image_ref)) &&
      stmt.bind(10, static_cast<std::int64_t>(record.image_width)) &&
      stmt.bind(11, static_cast<std::int64_t>(record.image_height));
  if (!bound || stmt.step() != SQLITE_DONE) {
    return std::unexpected(storage_error(db_.get(), "insert failed"));
  }

  rc::Inspection out;
  out.id = sqlite3_last_insert_rowid(db_.get());
  out.filename = record.filename;
  out.original_filename = record.original_filename;
  out.upload_date = record.upload_date;
  out.anomalies_count = record.anomalies_count;
  out.criticality_score = record.criticality_score;
  out.criticality_level = record.criticality_level;
  out.processing_time = record.processing_time;
  out.notes = record.notes;
  out.annotated_image_ref = record.annotated_image_ref;
  out.image_width = record.image_width;
  out.image_height = record.image_height;

  if (!tx.commit()) {
    return std::unexpected(storage_error(db_.get(), "insert commit failed"));
  }
  return out;
}

std::expected<rc::Inspection, rc::Error> SqliteInspectionRepository::get(std::int64_t id) const {
  Statement stmt(db_.get(), std::format("SELECT {} FROM inspections WHERE id = ?1", kColumns));
  if (!stmt.ok() || !stmt.bind(1, id)) {
    return std::unexpected(storage_error(db_.get(), "cannot prepare lookup"));
  }
  const int step = stmt.step();
  if (step == SQLITE_ROW) {
    return read_row(stmt.get());
  }
  if (step == SQLITE_DONE) {
    return std::unexpected(rc::make_error(rc::ErrorCode::NotFound,
                                          std::format("inspection {} not found", id)));
  }
  return std::unexpected(storage_error(db_.get(), "lookup failed"));
}

std::expected<std::vector<rc::Inspection>, rc::Error> SqliteInspectionRepository::list(
    std::optional<rc::CriticalityLevel> level, std::size_t limit, std::size_t offset) const {
  const std::string where = level ? " WHERE criticality_level = ?3" : "";
  Statement stmt(db_.get(), std::format("SELECT {} FROM inspections{}{} LIMIT ?1 OFFSET ?2",
                                        kColumns, where, kOrder));
  if (!stmt.ok()) {
    return std::unexpected(storage_error(db_.get(), "cannot prepare listing"));
  }
  bool bound = stmt.bind(1, to_sql_count(limit)) && stmt.bind(2, to_sql_count(offset));
  if (level) bound = bound && stmt.bind(3, rc::to_string(*level));
  if (!bound) {
    return std::unexpected(storage_error(db_.get(), "cannot bind listing"));
  }
  return collect_rows(db_.get(), stmt);
}

std::expected<std::size_t, rc::Error> SqliteInspectionRepository::count(
    std::optional<rc::CriticalityLevel> level) const {
  Statement stmt(db_.get(), level ? "SELECT COUNT(*) FROM inspections WHERE criticality_level = ?1"
                                  : "SELECT COUNT(*) FROM inspections");
  if (!stmt.ok() || (level && !stmt.bind(1, rc::to_string(*level)))) {
    return std::unexpected(storage_error(db_.get(), "cannot prepare count"));
  }
  if (stmt.step() != SQLITE_ROW) {
    return std::unexpected(storage_error(db_.get(), "count failed"));
  }
  return static_cast<std::size_t>(sqlite3_column_int64(stmt.get(), 0));
}

std::expected<std::vector<rc::Inspection>, rc::Error> SqliteInspectionRepository::search(
    std::string_view query, std::size_t limit) const {
  // instr() on lower() keeps %, _ and \ literal (ASCII case folding).
  Statement stmt(db_.get(),
                 std::format("SELECT {} FROM inspections "
                             "WHERE instr(lower(original_filename), lower(?1)) > 0{} LIMIT ?2",
                             kColumns, kOrder));
  if (!stmt.ok() || !stmt.bind(1, query) || !stmt.bind(2, to_sql_count(limit))) {
    return std::unexpected(storage_error(db_.get(), "cannot prepare search"));
  }
  return collect_rows(db_.get(), stmt);
}

std::expected<void, rc::Error> SqliteInspectionRepository::remove(
    std::int64_t id, const BeforeCommitHook& before_commit) {
  Transaction tx(db_.get());
  if (!tx.began()) {
    return std::unexpected(storage_error(db_.get(), "cannot begin delete"));
  }

  auto existing = get(id);
  if (!existing) {
    return std::unexpected(existing.error());
  }

  Statement stmt(db_.get(), "DELETE FROM inspections WHERE id = ?1");
  if (!stmt.ok() || !stmt.bind(1, id) || stmt.step() != SQLITE_DONE) {
    return std::unexpected(storage_error(db_.get(), "delete failed"));
  }

  if (before_commit) {
    if (auto hook = before_commit(*existing); !hook) {
      return std::unexpected(hook.error());
    }
  }

  if (!tx.commit()) {
    return std::unexpected(storage_error(db_.get(), "delete commit failed"));
  }
  return {};
}

std::expected<rc::InspectionStatistics, rc::Error> SqliteInspectionRepository::statistics() const {
  rc::InspectionStatistics stats;

  Statement totals(db_.get(), "SELECT COUNT(*), COALESCE(AVG(anomalies_count), 0.0) FROM inspections");
  if (!totals.ok() || totals.step() != SQLITE_ROW) {
    return std::unexpected(storage_error(db_.get(), "statistics failed"));
  }
  stats.total = static_cast<std::size_t>(sqlite3_column_int64(totals.get(), 0));
  stats.average_anomalies = sqlite3_column_double(totals.get(), 1);

  Statement levels(db_.get(),
                   "SELECT criticality_level, COUNT(*) FROM inspections GROUP BY criticality_level");
  if (!levels.ok()) {
    return std::unexpected(storage_error(db_.get(), "cannot prepare level statistics"));
  }
  int step = SQLITE_ROW;
  while ((step = levels.step()) == SQLITE_ROW) {
    auto level = rc::parse_criticality_level(column_text(levels.get(), 0));
    if (!level) continue;
    stats.per_level[static_cast<std::size_t>(*level)] =
        static_cast<std::size_t>(sqlite3_column_int64(levels.get(), 1));
  }
  if (step != SQLITE_DONE) {
    return std::unexpected(storage_error(db_.get(), "level statistics failed"));
  }
  return stats;
}

}  // namespace railwatch::catalog
