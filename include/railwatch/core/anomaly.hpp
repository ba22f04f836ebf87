#pragma once

#include <cstdint>

namespace railwatch::core {

/// Axis-aligned bounding box in pixel coordinates.
struct BBox {
  std::int32_t x{0};
  std::int32_t y{0};
  std::int32_t w{0};
  std::int32_t h{0};

  friend bool operator==(const BBox&, const BBox&) = default;
};

/// Single detected candidate defect: location and enclosed contour area (px²).
struct AnomalyRegion {
  BBox bbox{};
  double area{0.0};

  friend bool operator==(const AnomalyRegion&, const AnomalyRegion&) = default;
};

}  // namespace railwatch::core
