#include <kensa/quality/score_engine.hpp>
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace kensa::quality {

namespace kc = kensa::core;

GeometricScorer::GeometricScorer(double max_defect_fraction)
    : max_defect_fraction_(max_defect_fraction) {}

std::expected<RawScore, kc::InspectionError> GeometricScorer::score(
    const ScoringInput& input) const {
  if (input.image_area == 0 || max_defect_fraction_ <= 0.0) {
    return std::unexpected(kc::InspectionError::InvalidConfig);
  }
  const double max_area = static_cast<double>(input.image_area) * max_defect_fraction_;
  const double percent = std::min(100.0, input.significant_area / max_area * 100.0);
  const double defect = percent / 100.0;
  return RawScore{defect, 100.0 - defect * 100.0};
}

EdgeDensityScorer::EdgeDensityScorer(double impact_multiplier, HealthRange band)
    : impact_multiplier_(impact_multiplier), band_(band) {}

std::expected<RawScore, kc::InspectionError> EdgeDensityScorer::score(
    const ScoringInput& input) const {
  if (input.image_area == 0) {
    return std::unexpected(kc::InspectionError::InvalidConfig);
  }
  const double edge_percent =
      static_cast<double>(input.edge_pixels) / static_cast<double>(input.image_area) * 100.0;
  const double penalty = edge_percent * impact_multiplier_;
  return RawScore{penalty / 100.0, 100.0 - penalty};
}

ClassifierScorer::ClassifierScorer(double fail_threshold) : fail_threshold_(fail_threshold) {}

std::expected<RawScore, kc::InspectionError> ClassifierScorer::score(
    const ScoringInput& input) const {
  if (!input.defect_probability) {
    return std::unexpected(kc::InspectionError::InvalidConfig);
  }
  const double p = *input.defect_probability;
  if (!std::isfinite(p)) {
    return std::unexpected(kc::InspectionError::ClassifierError);
  }
  const double health = p <= fail_threshold_ ? 100.0 - p * 20.0 : (1.0 - p) * 80.0;
  return RawScore{p, health};
}

std::unique_ptr<IDefectScorer> make_scorer(kc::ScoringMode mode, const ScoreConfig& config,
                                           double classifier_fail_threshold) {
  switch (mode) {
    case kc::ScoringMode::Geometric:
      return std::make_unique<GeometricScorer>(config.max_defect_fraction);
    case kc::ScoringMode::EdgeDensity:
      return std::make_unique<EdgeDensityScorer>(
          config.edge_impact_multiplier, HealthRange{config.health_floor, config.health_ceiling});
    case kc::ScoringMode::Classifier:
      return std::make_unique<ClassifierScorer>(classifier_fail_threshold);
  }
  return nullptr;
}

kc::ScoreResult clamp_scores(kc::ScoreResult scores, HealthRange range) noexcept {
  if (scores.gatekeeper_score) {
    scores.gatekeeper_score = std::clamp(*scores.gatekeeper_score, 0.0, 1.0);
  }
  scores.defect_score = std::clamp(scores.defect_score, 0.0, 1.0);
  scores.health_score = std::clamp(scores.health_score, range.min, range.max);
  return scores;
}

ScoreEngine::ScoreEngine(std::unique_ptr<IDefectScorer> scorer) : scorer_(std::move(scorer)) {
  if (!scorer_) {
    throw std::invalid_argument("ScoreEngine: scorer must not be null");
  }
}

std::expected<kc::ScoreResult, kc::InspectionError> ScoreEngine::score(
    const ScoringInput& input) const {
  auto raw = scorer_->score(input);
  if (!raw) {
    return std::unexpected(raw.error());
  }
  kc::ScoreResult result;
  result.gatekeeper_score = input.gatekeeper_score;
  result.defect_score = raw->defect_score;
  result.health_score = raw->health_score;
  result.defect_count = input.region_count;
  result.mode = scorer_->mode();
  return clamp_scores(result, scorer_->health_range());
}

kc::ScoreResult ScoreEngine::gated(double gatekeeper_score) const noexcept {
  const HealthRange range = scorer_->health_range();
  kc::ScoreResult result;
  result.gatekeeper_score = gatekeeper_score;
  result.defect_score = 0.0;
  result.health_score = range.min;
  result.mode = scorer_->mode();
  return clamp_scores(result, range);
}

}  // namespace kensa::quality
