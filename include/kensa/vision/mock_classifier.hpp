#pragma once

#include <kensa/vision/classifier.hpp>
#include <atomic>
#include <cstddef>
#include <optional>

namespace kensa::vision {

/// Classifier that returns a configured probability (for tests/demo).
class MockClassifier : public IClassifier {
 public:
  /// With \p input_size set, behaves like a fixed-size model: reports it from
  /// required_input_size() and rejects other input sizes with ClassifierError.
  explicit MockClassifier(double probability = 0.0,
                          std::optional<InputSize> input_size = std::nullopt);

  /// Probability to return from subsequent probability() calls.
  void set_probability(double p) noexcept;

  /// When set, probability() fails with ClassifierError.
  void set_failure(bool fail) noexcept;

  [[nodiscard]] std::expected<double, kensa::core::InspectionError>
  probability(const ClassifierInput& input) const override;

  [[nodiscard]] std::optional<InputSize> required_input_size() const noexcept override {
    return input_size_;
  }

  /// Number of probability() calls so far.
  [[nodiscard]] std::size_t call_count() const noexcept { return calls_.load(); }

 private:
  std::atomic<double> probability_;
  const std::optional<InputSize> input_size_;
  std::atomic<bool> fail_{false};
  mutable std::atomic<std::size_t> calls_{0};
};

}  // namespace kensa::vision
