#pragma once

#include <railwatch/core/anomaly_result.hpp>
#include <railwatch/core/error.hpp>
#include <railwatch/core/frame.hpp>
#include <railwatch/core/pipeline_stage.hpp>
#include <cstddef>
#include <expected>
#include <functional>
#include <memory>
#include <vector>

namespace railwatch::core {

/// Callback for per-stage timing: (stage_index, duration_ms). Optional; pass to run().
using StageTimingCallback = std::function<void(std::size_t stage_index, double duration_ms)>;

/// Runs a sequence of stages; passes Frame through until a stage returns AnomalyResult.
class Pipeline {
 public:
  Pipeline() = default;

  void add_stage(std::unique_ptr<IPipelineStage> stage);

  /// Run pipeline on one frame; returns first AnomalyResult or error.
  /// If timing_cb is non-null, it is called after each stage with (stage_index, duration_ms).
  /// Thread-safe: stages are const during run(), so concurrent calls are fine.
  [[nodiscard]] std::expected<AnomalyResult, Error> run(
      const Frame& input,
      const StageTimingCallback* timing_cb = nullptr) const;

  [[nodiscard]] std::size_t stage_count() const noexcept {
    return stages_.size();
  }

  [[nodiscard]] const IPipelineStage& stage(std::size_t index) const {
    return *stages_.at(index);
  }

 private:
  std::vector<std::unique_ptr<IPipelineStage>> stages_;
};

}  // namespace railwatch::core
