#pragma once

#include <kensa/app/config.hpp>
#include <kensa/core/error.hpp>
#include <kensa/core/pixel_grid.hpp>
#include <kensa/core/verdict.hpp>
#include <kensa/quality/decision_policy.hpp>
#include <kensa/quality/score_engine.hpp>
#include <kensa/vision/classifier.hpp>
#include <kensa/vision/feature_extractor.hpp>
#include <kensa/vision/region_analyzer.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <variant>

namespace kensa::app {

/// Typed "not configured" alternative of a classifier slot.
struct NoClassifier {};

/// Gatekeeper or defect classifier: either absent or a shared, thread-safe classifier.
using ClassifierSlot =
    std::variant<NoClassifier, std::shared_ptr<const kensa::vision::IClassifier>>;

/// Callback for per-stage timing: (stage_index, duration_ms); stage_index is an
/// InspectionStage. Only stages that actually run are reported.
using StageTimingCallback = std::function<void(std::size_t stage_index, double duration_ms)>;

enum class InspectionStage : std::size_t {
  Decode = 0,
  Gatekeeper,
  DefectClassifier,
  Features,
  Regions,
  Score,
  Decide,
};

/// Runs bytes -> PixelGrid -> features -> regions -> scores -> verdict.
///
/// With a gatekeeper, its probability is checked first; UNCERTAIN and INVALID_INPUT
/// short-circuit before any defect evaluation. In classifier mode the defect
/// probability comes from the caller or from the defect classifier (caller wins) and
/// feature extraction does not run. Each classifier is invoked at most once per call.
///
/// Thread-safe: inspect() is const and keeps all intermediate artifacts local.
class Inspector {
 public:
  /// Throws std::invalid_argument if validate_config(config) fails or a classifier is
  /// fixed to an input size other than classifier_input_width x classifier_input_height.
  explicit Inspector(InspectionConfig config,
                     ClassifierSlot gatekeeper = NoClassifier{},
                     ClassifierSlot defect_classifier = NoClassifier{});

  [[nodiscard]] std::expected<kensa::core::Verdict, kensa::core::InspectionError> inspect(
      std::span<const std::uint8_t> image_bytes,
      std::optional<double> external_probability = std::nullopt,
      const StageTimingCallback* timing_cb = nullptr) const;

  /// Same as inspect() for an already decoded image.
  [[nodiscard]] std::expected<kensa::core::Verdict, kensa::core::InspectionError> inspect_grid(
      const kensa::core::PixelGrid& grid,
      std::optional<double> external_probability = std::nullopt,
      const StageTimingCallback* timing_cb = nullptr) const;

  [[nodiscard]] const InspectionConfig& config() const noexcept { return config_; }
  [[nodiscard]] kensa::core::ScoringMode mode() const noexcept { return engine_.mode(); }

 private:
  InspectionConfig config_;
  ClassifierSlot gatekeeper_;
  ClassifierSlot defect_classifier_;
  kensa::vision::FeatureExtractor extractor_;
  kensa::vision::RegionAnalyzer analyzer_;
  kensa::quality::ScoreEngine engine_;
  kensa::quality::DecisionPolicy policy_;
};

/// One-shot inspection with a default Inspector (no classifiers) built from \p config.
[[nodiscard]] std::expected<kensa::core::Verdict, kensa::core::InspectionError> inspect(
    std::span<const std::uint8_t> image_bytes,
    const InspectionConfig& config,
    std::optional<double> external_probability = std::nullopt);

/// Build a classifier slot from config. Throws std::runtime_error when the backend
/// cannot be created (e.g. onnx without model_path or without ONNX Runtime support).
[[nodiscard]] ClassifierSlot make_classifier(const ClassifierConfig& config);

}  // namespace kensa::app
