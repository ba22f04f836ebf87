#pragma once

#include <railwatch/core/criticality.hpp>
#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace railwatch::core {

/// Upload timestamps are stored with microsecond precision.
using Timestamp = std::chrono::sys_time<std::chrono::microseconds>;

/// Persisted analysis result. id, filename and upload_date never change
/// after creation; score, level and notes always follow anomalies_count.
struct Inspection {
  std::int64_t id{0};
  std::string filename;           // storage-safe name returned by the image store
  std::string original_filename;  // as supplied by the caller
  Timestamp upload_date{};
  std::uint32_t anomalies_count{0};
  double criticality_score{0.0};
  CriticalityLevel criticality_level{CriticalityLevel::Low};
  double processing_time{0.0};  // seconds
  std::string notes;
  std::string annotated_image_ref;
  std::uint32_t image_width{0};
  std::uint32_t image_height{0};

  friend bool operator==(const Inspection&, const Inspection&) = default;
};

/// Record fields known before persistence assigns the id.
struct NewInspection {
  std::string filename;
  std::string original_filename;
  Timestamp upload_date{};
  std::uint32_t anomalies_count{0};
  double criticality_score{0.0};
  CriticalityLevel criticality_level{CriticalityLevel::Low};
  double processing_time{0.0};
  std::string notes;
  std::string annotated_image_ref;
  std::uint32_t image_width{0};
  std::uint32_t image_height{0};
};

/// One page of a filtered listing. Pages are 1-based.
struct InspectionPage {
  std::vector<Inspection> items;
  std::size_t page{1};
  std::size_t page_size{0};
  std::size_t total_count{0};
  std::size_t total_pages{0};
};

/// Aggregate figures over the whole catalog.
struct InspectionStatistics {
  std::size_t total{0};
  std::array<std::size_t, 3> per_level{};  // indexed by CriticalityLevel
  double average_anomalies{0.0};

  [[nodiscard]] std::size_t count(CriticalityLevel level) const noexcept {
    return per_level[static_cast<std::size_t>(level)];
  }
};

/// ISO-8601 UTC form, e.g. 2024-05-01T12:30:00.123456Z.
[[nodiscard]] std::string format_timestamp(Timestamp ts);

[[nodiscard]] Timestamp now_timestamp();

}  // namespace railwatch::core
