#include <railwatch/core/pipeline.hpp>
#include <chrono>
#include <format>

namespace railwatch::core {

void Pipeline::add_stage(std::unique_ptr<IPipelineStage> stage) {
  if (stage) {
    stages_.push_back(std::move(stage));
  }
}

std::expected<AnomalyResult, Error> Pipeline::run(
    const Frame& input,
    const StageTimingCallback* timing_cb) const {
  if (stages_.empty()) {
    return std::unexpected(make_error(ErrorCode::InvalidConfig, "pipeline has no stages"));
  }

  StageOutput current = input;

  for (std::size_t i = 0; i < stages_.size(); ++i) {
    const Frame* frame_ptr = std::get_if<Frame>(&current);
    if (!frame_ptr) {
      return std::get<AnomalyResult>(current);
    }

    const auto stage_start = std::chrono::steady_clock::now();
    auto result = stages_[i]->process(*frame_ptr);
    if (timing_cb && *timing_cb) {
      const auto stage_end = std::chrono::steady_clock::now();
      const double ms = 1e-3 * static_cast<double>(
          std::chrono::duration_cast<std::chrono::microseconds>(stage_end - stage_start).count());
      (*timing_cb)(i, ms);
    }

    if (!result) {
      return std::unexpected(result.error());
    }

    current = std::move(*result);
  }

  if (auto* result = std::get_if<AnomalyResult>(&current)) {
    return std::move(*result);
  }
  return std::unexpected(make_error(
      ErrorCode::InvalidConfig,
      std::format("pipeline of {} stages ended without a result", stages_.size())));
}

}  // namespace railwatch::core
