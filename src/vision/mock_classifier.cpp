#include <kensa/vision/mock_classifier.hpp>
#include <kensa/core/error.hpp>

namespace kensa::vision {

MockClassifier::MockClassifier(double probability, std::optional<InputSize> input_size)
    : probability_(probability), input_size_(input_size) {}

void MockClassifier::set_probability(double p) noexcept { probability_ = p; }

void MockClassifier::set_failure(bool fail) noexcept { fail_ = fail; }

std::expected<double, kensa::core::InspectionError> MockClassifier::probability(
    const ClassifierInput& input) const {
  ++calls_;
  if (fail_.load() || input.empty() || (input_size_ && input.size() != *input_size_)) {
    return std::unexpected(kensa::core::InspectionError::ClassifierError);
  }
  return probability_.load();
}

}  // namespace kensa::vision
