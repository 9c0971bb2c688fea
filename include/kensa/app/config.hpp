#pragma once

#include <kensa/core/error.hpp>
#include <kensa/core/score_result.hpp>
#include <kensa/quality/decision_policy.hpp>
#include <kensa/quality/score_engine.hpp>
#include <kensa/vision/feature_extractor.hpp>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace kensa::app {

/// Classifier backend: none, mock (fixed probability) or onnx (real model).
enum class ClassifierBackendType {
  None,
  Mock,
  Onnx,
};

/// One classifier slot (gatekeeper or defect).
struct ClassifierConfig {
  ClassifierBackendType backend{ClassifierBackendType::None};
  std::string model_path;
  double mock_probability{0.0};
};

/// Inspection configuration: pipeline tunables, thresholds and classifier backends.
/// Read-only after start-up; share by const reference across threads.
struct InspectionConfig {
  kensa::core::ScoringMode scoring_mode{kensa::core::ScoringMode::Geometric};
  kensa::vision::FeatureConfig features;
  double min_region_area{10.0};
  kensa::quality::ScoreConfig scoring;
  kensa::quality::DecisionConfig decision;
  std::uint32_t classifier_input_width{224};
  std::uint32_t classifier_input_height{224};
  ClassifierConfig gatekeeper;
  ClassifierConfig defect_classifier;
};

/// Load config from a simple key=value file (one per line, '#' comments) on top of the
/// defaults. A missing file yields the defaults; unknown keys and unparsable values
/// are logged and skipped.
InspectionConfig load_config(const std::string& path);

/// Default config when no file is provided.
InspectionConfig default_config();

/// InvalidConfig if any setting is out of its usable range.
[[nodiscard]] std::expected<void, kensa::core::InspectionError> validate_config(
    const InspectionConfig& config);

/// "geometric", "edge_density" or "classifier".
[[nodiscard]] std::optional<kensa::core::ScoringMode> parse_scoring_mode(std::string_view name);

}  // namespace kensa::app
