#pragma once

#include <railwatch/core/criticality.hpp>
#include <railwatch/core/error.hpp>
#include <railwatch/core/inspection.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <optional>
#include <string_view>
#include <vector>

namespace railwatch::catalog {

/// Runs inside the delete transaction, after the row is gone but before commit.
/// An error rolls the deletion back. Work done by the hook must be reversible:
/// remove() may still fail after a successful hook if the commit fails.
using BeforeCommitHook =
    std::function<std::expected<void, railwatch::core::Error>(const railwatch::core::Inspection&)>;

/// Durable store of inspection records. Listings are ordered newest first
/// (upload_date descending, id descending on ties).
///
/// Implementations must support level filtering, case-insensitive name search
/// and upload-time ordering without loading the whole collection.
class IInspectionRepository {
 public:
  virtual ~IInspectionRepository() = default;

  /// Assigns a fresh id (never reused) and persists all fields in one transaction.
  [[nodiscard]] virtual std::expected<railwatch::core::Inspection, railwatch::core::Error>
  insert(const railwatch::core::NewInspection& record) = 0;

  /// ErrorCode::NotFound when no record has this id.
  [[nodiscard]] virtual std::expected<railwatch::core::Inspection, railwatch::core::Error>
  get(std::int64_t id) const = 0;

  [[nodiscard]] virtual std::expected<std::vector<railwatch::core::Inspection>, railwatch::core::Error>
  list(std::optional<railwatch::core::CriticalityLevel> level,
       std::size_t limit,
       std::size_t offset) const = 0;

  [[nodiscard]] virtual std::expected<std::size_t, railwatch::core::Error> count(
      std::optional<railwatch::core::CriticalityLevel> level) const = 0;

  /// Case-insensitive substring match on original_filename; query is literal.
  [[nodiscard]] virtual std::expected<std::vector<railwatch::core::Inspection>, railwatch::core::Error>
  search(std::string_view query, std::size_t limit) const = 0;

  /// Deletes one record. ErrorCode::NotFound when absent.
  [[nodiscard]] virtual std::expected<void, railwatch::core::Error> remove(
      std::int64_t id, const BeforeCommitHook& before_commit) = 0;

  [[nodiscard]] virtual std::expected<railwatch::core::InspectionStatistics, railwatch::core::Error>
  statistics() const = 0;
};

}  // namespace railwatch::catalog
