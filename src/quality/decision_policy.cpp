#include <kensa/quality/decision_policy.hpp>

namespace kensa::quality {

namespace kc = kensa::core;

DecisionPolicy::DecisionPolicy(DecisionConfig config) : config_(config) {}

GateOutcome DecisionPolicy::gate(std::optional<double> gatekeeper_score) const noexcept {
  if (!gatekeeper_score) {
    return GateOutcome::Proceed;
  }
  const double g = *gatekeeper_score;
  if (g >= config_.uncertain_lower && g <= config_.uncertain_upper) {
    return GateOutcome::Uncertain;
  }
  if (g < config_.uncertain_lower) {
    return GateOutcome::Invalid;
  }
  return GateOutcome::Proceed;
}

kc::Verdict DecisionPolicy::decide(const kc::ScoreResult& scores) const noexcept {
  switch (gate(scores.gatekeeper_score)) {
    case GateOutcome::Uncertain:
      return kc::Verdict{kc::VerdictStatus::Uncertain, kc::ExplanationKey::ImageUnclear, scores};
    case GateOutcome::Invalid:
      return kc::Verdict{kc::VerdictStatus::InvalidInput,
                         kc::ExplanationKey::NotInspectableSurface, scores};
    case GateOutcome::Proceed:
      break;
  }

  bool fail = false;
  if (scores.mode == kc::ScoringMode::Classifier) {
    fail = scores.defect_score > config_.classifier_fail_threshold;
  } else {
    fail = scores.health_score < config_.pass_health_threshold &&
           scores.defect_count > config_.max_allowed_defects;
  }

  if (fail) {
    return kc::Verdict{kc::VerdictStatus::Fail, kc::ExplanationKey::DefectsExceedLimit, scores};
  }
  return kc::Verdict{kc::VerdictStatus::Pass, kc::ExplanationKey::SurfaceClean, scores};
}

}  // namespace kensa::quality
