#pragma once

#include <railwatch/core/anomaly.hpp>
#include <railwatch/core/error.hpp>
#include <railwatch/core/frame.hpp>
#include <expected>
#include <vector>

namespace railwatch::vision {

/// Returns a BGR8 copy of original with a red box and "#n" label per region
/// and a green "Anomalies detected: N" banner. original is not modified.
[[nodiscard]] std::expected<railwatch::core::Frame, railwatch::core::Error>
render_annotations(const railwatch::core::Frame& original,
                   const std::vector<railwatch::core::AnomalyRegion>& regions);

}  // namespace railwatch::vision
