#pragma once

#include <kensa/core/error.hpp>
#include <kensa/vision/classifier_input.hpp>
#include <expected>
#include <optional>

namespace kensa::vision {

/// Expected input: ClassifierInput from prepare_classifier_input().

/// Abstract binary image classifier: preprocessed image -> probability in [0, 1].
/// Used both as the surface-type gatekeeper and as the defect classifier.
/// Implementations must tolerate concurrent probability() calls.
class IClassifier {
 public:
  virtual ~IClassifier() = default;

  /// Probability of the positive class. ClassifierError on any failure; never a
  /// substituted default.
  [[nodiscard]] virtual std::expected<double, kensa::core::InspectionError>
  probability(const ClassifierInput& input) const = 0;

  /// Input size the model is fixed to; nullopt if it accepts any size.
  [[nodiscard]] virtual std::optional<InputSize> required_input_size() const noexcept {
    return std::nullopt;
  }

  /// Optional: warmup run (e.g. dummy inference). Call once after construction. Default: no-op.
  virtual void warmup() {}
};

}  // namespace kensa::vision
