#pragma once

#include <kensa/core/error.hpp>
#include <kensa/core/score_result.hpp>
#include <cstddef>
#include <expected>
#include <memory>
#include <optional>

namespace kensa::quality {

/// Tunables for the scoring strategies.
struct ScoreConfig {
  double max_defect_fraction{0.1};    // share of image area treated as maximal damage
  double edge_impact_multiplier{2.0};  // edge-density health penalty per edge percent
  double health_floor{10.0};          // edge-density health band
  double health_ceiling{99.0};
};

/// Everything a scorer may consume. Geometric strategies read the region and edge
/// statistics, the classifier strategy reads defect_probability.
struct ScoringInput {
  std::size_t image_area{0};
  std::size_t edge_pixels{0};
  double significant_area{0.0};
  std::size_t region_count{0};
  std::optional<double> defect_probability;
  std::optional<double> gatekeeper_score;
};

/// Closed interval a strategy's health score is clamped into.
struct HealthRange {
  double min{0.0};
  double max{100.0};
};

/// Unclamped strategy output.
struct RawScore {
  double defect_score{0.0};
  double health_score{0.0};
};

/// Strategy: produce a 0-1 defect likelihood (and its health presentation).
class IDefectScorer {
 public:
  virtual ~IDefectScorer() = default;

  [[nodiscard]] virtual std::expected<RawScore, kensa::core::InspectionError> score(
      const ScoringInput& input) const = 0;

  [[nodiscard]] virtual kensa::core::ScoringMode mode() const noexcept = 0;

  [[nodiscard]] virtual HealthRange health_range() const noexcept { return {}; }
};

/// defect = min(100, area / (image_area * max_defect_fraction) * 100) / 100,
/// health = 100 - defect * 100.
class GeometricScorer : public IDefectScorer {
 public:
  explicit GeometricScorer(double max_defect_fraction = 0.1);

  [[nodiscard]] std::expected<RawScore, kensa::core::InspectionError> score(
      const ScoringInput& input) const override;
  [[nodiscard]] kensa::core::ScoringMode mode() const noexcept override {
    return kensa::core::ScoringMode::Geometric;
  }

 private:
  double max_defect_fraction_;
};

/// health = 100 - edge_percent * multiplier, held inside [floor, ceiling] so a single
/// noisy frame never reports near-zero health.
class EdgeDensityScorer : public IDefectScorer {
 public:
  EdgeDensityScorer(double impact_multiplier, HealthRange band);

  [[nodiscard]] std::expected<RawScore, kensa::core::InspectionError> score(
      const ScoringInput& input) const override;
  [[nodiscard]] kensa::core::ScoringMode mode() const noexcept override {
    return kensa::core::ScoringMode::EdgeDensity;
  }
  [[nodiscard]] HealthRange health_range() const noexcept override { return band_; }

 private:
  double impact_multiplier_;
  HealthRange band_;
};

/// Piecewise-linear mapping of a defect probability p around the FAIL threshold t:
///   p <= t -> health = 100 - 20p   (passing health stays in [80, 100])
///   p >  t -> health = (1 - p) 80  (failing health stays below (1 - t) 80)
/// t must equal DecisionConfig::classifier_fail_threshold so that a PASS never shows
/// a failing health.
class ClassifierScorer : public IDefectScorer {
 public:
  explicit ClassifierScorer(double fail_threshold = 0.5);

  [[nodiscard]] std::expected<RawScore, kensa::core::InspectionError> score(
      const ScoringInput& input) const override;
  [[nodiscard]] kensa::core::ScoringMode mode() const noexcept override {
    return kensa::core::ScoringMode::Classifier;
  }

 private:
  double fail_threshold_;
};

/// \p classifier_fail_threshold only affects ClassifierScorer.
[[nodiscard]] std::unique_ptr<IDefectScorer> make_scorer(kensa::core::ScoringMode mode,
                                                         const ScoreConfig& config,
                                                         double classifier_fail_threshold = 0.5);

/// Clamp every field into its declared range. Idempotent.
[[nodiscard]] kensa::core::ScoreResult clamp_scores(kensa::core::ScoreResult scores,
                                                    HealthRange range) noexcept;

/// Runs the configured strategy and clamps its output unconditionally.
class ScoreEngine {
 public:
  explicit ScoreEngine(std::unique_ptr<IDefectScorer> scorer);

  [[nodiscard]] std::expected<kensa::core::ScoreResult, kensa::core::InspectionError> score(
      const ScoringInput& input) const;

  /// Record for an inspection whose defect evaluation was skipped by the gatekeeper:
  /// defect 0, health at the bottom of the strategy's range.
  [[nodiscard]] kensa::core::ScoreResult gated(double gatekeeper_score) const noexcept;

  [[nodiscard]] kensa::core::ScoringMode mode() const noexcept { return scorer_->mode(); }
  [[nodiscard]] HealthRange health_range() const noexcept { return scorer_->health_range(); }

 private:
  std::unique_ptr<IDefectScorer> scorer_;
};

}  // namespace kensa::quality
