#pragma once

#include <kensa/core/score_result.hpp>
#include <kensa/core/verdict.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>

namespace kensa::quality {

/// Thresholds for the verdict rules.
struct DecisionConfig {
  double uncertain_lower{0.45};  // gatekeeper band, inclusive on both ends
  double uncertain_upper{0.55};
  double pass_health_threshold{90.0};  // geometric: health below this counts against
  std::size_t max_allowed_defects{5};  // geometric: more regions than this counts against
  double classifier_fail_threshold{0.5};  // classifier: defect above this fails
};

/// Result of checking the gatekeeper score alone.
enum class GateOutcome : std::uint8_t {
  Proceed,    // no gatekeeper, or score above the uncertainty band
  Uncertain,  // score inside the band
  Invalid,    // score below the band
};

/// Maps scores to exactly one verdict per inspection:
///   gatekeeper in [lower, upper]        -> UNCERTAIN
///   gatekeeper < lower                  -> INVALID_INPUT
///   geometric modes: health < threshold AND count > max -> FAIL, else PASS
///   classifier mode: defect > threshold -> FAIL, else PASS
class DecisionPolicy {
 public:
  explicit DecisionPolicy(DecisionConfig config = {});

  /// Lets the caller skip defect evaluation when the gatekeeper already decides.
  [[nodiscard]] GateOutcome gate(std::optional<double> gatekeeper_score) const noexcept;

  [[nodiscard]] kensa::core::Verdict decide(const kensa::core::ScoreResult& scores) const noexcept;

  [[nodiscard]] const DecisionConfig& config() const noexcept { return config_; }

 private:
  DecisionConfig config_;
};

}  // namespace kensa::quality
