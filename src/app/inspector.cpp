#include <kensa/app/inspector.hpp>
#include <kensa/vision/classifier_input.hpp>
#include <kensa/vision/image_decoder.hpp>
#include <kensa/vision/mock_classifier.hpp>
#ifdef KENSA_HAS_ONNXRUNTIME
#include <kensa/vision/onnx_classifier.hpp>
#endif
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

namespace kensa::app {

namespace kc = kensa::core;
namespace kv = kensa::vision;

namespace {

InspectionConfig checked(InspectionConfig config) {
  if (!validate_config(config)) {
    throw std::invalid_argument("Inspector: invalid inspection config");
  }
  return config;
}

/// Throws if the classifier in \p slot is fixed to a size other than the configured one.
void check_input_size(const ClassifierSlot& slot, const InspectionConfig& config,
                      const char* role) {
  const auto* classifier = std::get_if<std::shared_ptr<const kv::IClassifier>>(&slot);
  if (!classifier || !*classifier) return;
  const auto required = (*classifier)->required_input_size();
  const kv::InputSize configured{config.classifier_input_width, config.classifier_input_height};
  if (required && *required != configured) {
    throw std::invalid_argument(fmt::format(
        "Inspector: {} expects {}x{} input, classifier_input_width/height is {}x{}", role,
        required->width, required->height, configured.width, configured.height));
  }
}

/// Runs \p fn and reports its duration for \p stage.
template <typename Fn>
auto timed(InspectionStage stage, const StageTimingCallback* timing_cb, Fn&& fn) {
  const auto start = std::chrono::steady_clock::now();
  auto result = fn();
  if (timing_cb && *timing_cb) {
    const auto end = std::chrono::steady_clock::now();
    const double ms = 1e-6 * static_cast<double>(
        std::chrono::duration_cast<std::chrono::nanoseconds>(end - start).count());
    (*timing_cb)(static_cast<std::size_t>(stage), ms);
  }
  return result;
}

std::expected<double, kc::InspectionError> ask(const kv::IClassifier& classifier,
                                               const kv::ClassifierInput& input) {
  auto p = classifier.probability(input);
  if (!p) {
    return std::unexpected(p.error());
  }
  if (!std::isfinite(*p)) {
    return std::unexpected(kc::InspectionError::ClassifierError);
  }
  return *p;
}

}  // namespace

Inspector::Inspector(InspectionConfig config,
                     ClassifierSlot gatekeeper,
                     ClassifierSlot defect_classifier)
    : config_(checked(std::move(config))),
      gatekeeper_(std::move(gatekeeper)),
      defect_classifier_(std::move(defect_classifier)),
      extractor_(config_.features),
      analyzer_(config_.min_region_area),
      engine_(kensa::quality::make_scorer(config_.scoring_mode, config_.scoring,
                                          config_.decision.classifier_fail_threshold)),
      policy_(config_.decision) {
  check_input_size(gatekeeper_, config_, "gatekeeper");
  check_input_size(defect_classifier_, config_, "defect classifier");
}

std::expected<kc::Verdict, kc::InspectionError> Inspector::inspect(
    std::span<const std::uint8_t> image_bytes,
    std::optional<double> external_probability,
    const StageTimingCallback* timing_cb) const {
  auto grid = timed(InspectionStage::Decode, timing_cb,
                    [&] { return kv::decode(image_bytes); });
  if (!grid) {
    spdlog::debug("inspect: decode failed ({} bytes)", image_bytes.size());
    return std::unexpected(grid.error());
  }
  return inspect_grid(*grid, external_probability, timing_cb);
}

std::expected<kc::Verdict, kc::InspectionError> Inspector::inspect_grid(
    const kc::PixelGrid& grid,
    std::optional<double> external_probability,
    const StageTimingCallback* timing_cb) const {
  // Shared by both classifier calls; prepared only when a classifier runs.
  std::optional<kv::ClassifierInput> prepared;
  auto classifier_input = [&]() -> std::expected<const kv::ClassifierInput*, kc::InspectionError> {
    if (!prepared) {
      auto in = kv::prepare_classifier_input(grid, config_.classifier_input_width,
                                             config_.classifier_input_height);
      if (!in) return std::unexpected(in.error());
      prepared = std::move(*in);
    }
    return &*prepared;
  };

  kensa::quality::ScoringInput input;
  input.image_area = grid.area();

  if (const auto* gk = std::get_if<std::shared_ptr<const kv::IClassifier>>(&gatekeeper_)) {
    auto in = classifier_input();
    if (!in) return std::unexpected(in.error());
    auto p = timed(InspectionStage::Gatekeeper, timing_cb, [&] { return ask(**gk, **in); });
    if (!p) {
      spdlog::error("inspect: gatekeeper failed: {}", kc::to_string(p.error()));
      return std::unexpected(p.error());
    }
    const double g = std::clamp(*p, 0.0, 1.0);
    spdlog::debug("inspect: gatekeeper score {:.4f}", g);
    input.gatekeeper_score = g;

    if (policy_.gate(g) != kensa::quality::GateOutcome::Proceed) {
      kc::Verdict verdict = policy_.decide(engine_.gated(g));
      spdlog::info("inspect: {} | gatekeeper {:.4f} | defect evaluation skipped",
                   kc::to_string(verdict.status), g);
      return verdict;
    }
  }

  if (engine_.mode() == kc::ScoringMode::Classifier) {
    if (external_probability) {
      input.defect_probability = *external_probability;
    } else if (const auto* dc =
                   std::get_if<std::shared_ptr<const kv::IClassifier>>(&defect_classifier_)) {
      auto in = classifier_input();
      if (!in) return std::unexpected(in.error());
      auto p = timed(InspectionStage::DefectClassifier, timing_cb,
                     [&] { return ask(**dc, **in); });
      if (!p) {
        spdlog::error("inspect: defect classifier failed: {}", kc::to_string(p.error()));
        return std::unexpected(p.error());
      }
      input.defect_probability = *p;
    } else {
      spdlog::error("inspect: classifier mode needs an external probability or a defect classifier");
      return std::unexpected(kc::InspectionError::InvalidConfig);
    }
    spdlog::debug("inspect: defect probability {:.4f}", *input.defect_probability);
  } else {
    if (external_probability) {
      spdlog::debug("inspect: external probability ignored in {} mode",
                    kc::to_string(engine_.mode()));
    }
    auto features = timed(InspectionStage::Features, timing_cb,
                          [&] { return extractor_.extract(grid); });
    if (!features) {
      return std::unexpected(features.error());
    }
    const kc::RegionSet regions = timed(InspectionStage::Regions, timing_cb,
                                        [&] { return analyzer_.analyze(features->mask); });
    input.edge_pixels = features->mask.foreground_count();
    input.significant_area = regions.significant_area();
    input.region_count = regions.count();
    spdlog::debug("inspect: {} regions, area {:.0f}, {} edge pixels", regions.count(),
                  regions.significant_area(), input.edge_pixels);
  }

  auto scores = timed(InspectionStage::Score, timing_cb, [&] { return engine_.score(input); });
  if (!scores) {
    return std::unexpected(scores.error());
  }
  kc::Verdict verdict =
      timed(InspectionStage::Decide, timing_cb, [&] { return policy_.decide(*scores); });

  spdlog::info("inspect: {} | health {:.2f} | gatekeeper {} | defect {:.4f} | regions {}",
               kc::to_string(verdict.status), verdict.scores.health_score,
               verdict.scores.gatekeeper_score
                   ? fmt::format("{:.4f}", *verdict.scores.gatekeeper_score)
                   : std::string("n/a"),
               verdict.scores.defect_score, verdict.scores.defect_count);
  return verdict;
}

std::expected<kc::Verdict, kc::InspectionError> inspect(
    std::span<const std::uint8_t> image_bytes,
    const InspectionConfig& config,
    std::optional<double> external_probability) {
  if (!validate_config(config)) {
    return std::unexpected(kc::InspectionError::InvalidConfig);
  }
  const Inspector inspector(config);
  return inspector.inspect(image_bytes, external_probability);
}

ClassifierSlot make_classifier(const ClassifierConfig& config) {
  switch (config.backend) {
    case ClassifierBackendType::None:
      return NoClassifier{};
    case ClassifierBackendType::Mock:
      return std::make_shared<kv::MockClassifier>(config.mock_probability);
    case ClassifierBackendType::Onnx: {
      if (config.model_path.empty()) {
        throw std::runtime_error("classifier backend onnx requires a model path");
      }
#ifdef KENSA_HAS_ONNXRUNTIME
      auto onnx = std::make_shared<kv::OnnxClassifier>(config.model_path);
      onnx->warmup();
      return std::shared_ptr<const kv::IClassifier>(std::move(onnx));
#else
      throw std::runtime_error("ONNX Runtime support not built (configure with KENSA_USE_ONNXRUNTIME=ON)");
#endif
    }
  }
  return NoClassifier{};
}

}  // namespace kensa::app
