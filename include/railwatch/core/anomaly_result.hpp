#pragma once

#include <railwatch/core/anomaly.hpp>
#include <cstdint>
#include <vector>

namespace railwatch::core {

/// Terminal output of the detection pipeline for one frame.
/// Regions are in contour-extraction order, which is deterministic for a
/// given edge map.
struct AnomalyResult {
  std::uint32_t source_width{0};
  std::uint32_t source_height{0};
  std::vector<AnomalyRegion> regions;
};

}  // namespace railwatch::core
