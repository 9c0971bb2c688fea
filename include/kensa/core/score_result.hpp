#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>

namespace kensa::core {

/// Which scoring strategy produced a ScoreResult; selects the decision rule.
enum class ScoringMode : std::uint8_t {
  Geometric,    // region area relative to image area
  EdgeDensity,  // edge pixel percentage with health floor/ceiling
  Classifier,   // external defect probability
};

/// Normalized scores for one inspection. Every field is clamped by the
/// ScoreEngine before it leaves it.
struct ScoreResult {
  std::optional<double> gatekeeper_score;  // [0, 1]; absent without a gatekeeper
  double defect_score{0.0};                // [0, 1]
  double health_score{0.0};                // [0, 100] or the configured band
  std::size_t defect_count{0};             // surviving regions (geometric modes)
  ScoringMode mode{ScoringMode::Geometric};

  friend bool operator==(const ScoreResult&, const ScoreResult&) = default;
};

}  // namespace kensa::core
