#pragma once

#include <railwatch/core/anomaly_result.hpp>
#include <railwatch/core/error.hpp>
#include <railwatch/core/frame.hpp>
#include <expected>
#include <string_view>
#include <variant>

namespace railwatch::core {

/// Output of a pipeline stage: either pass-through Frame or final AnomalyResult.
using StageOutput = std::variant<Frame, AnomalyResult>;

/// Abstract pipeline stage: process one Frame, return Frame (continue) or
/// AnomalyResult (done). Implementations must not mutate state in process()
/// so one pipeline can serve concurrent callers.
class IPipelineStage {
 public:
  virtual ~IPipelineStage() = default;

  [[nodiscard]] virtual std::expected<StageOutput, Error> process(
      const Frame& input) const = 0;

  /// Short stage name used in timing logs.
  [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

}  // namespace railwatch::core
