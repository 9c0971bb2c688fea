#pragma once

#include <kensa/core/error.hpp>
#include <kensa/vision/classifier.hpp>
#include <kensa/vision/classifier_input.hpp>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace kensa::vision {

/// ONNX Runtime classifier: loads an ONNX model and implements IClassifier.
///
/// Expected model: one float image input, [1,3,H,W] (NCHW) or [1,H,W,3] (NHWC), and a
/// first output holding the probability:
/// - **[1,1] or [1]**: the single value is the positive-class probability (sigmoid head).
/// - **[1,2]**: two-class softmax; index 1 is the positive class.
///
/// Input contract: ClassifierInput must match the model's H and W (see input_width() /
/// input_height()); HWC data is transposed to NCHW when the model expects it.
/// Thread-safety: probability() may be called concurrently (Ort::Session::Run is
/// thread-safe and all scratch buffers are per call).
class OnnxClassifier : public IClassifier {
 public:
  /// \param model_path Path to the .onnx model file. Throws Ort::Exception if it cannot
  ///        be loaded and std::runtime_error if the model shape is unsupported.
  explicit OnnxClassifier(std::string model_path);

  ~OnnxClassifier() override;

  OnnxClassifier(const OnnxClassifier&) = delete;
  OnnxClassifier& operator=(const OnnxClassifier&) = delete;

  [[nodiscard]] std::expected<double, kensa::core::InspectionError>
  probability(const ClassifierInput& input) const override;

  void warmup() override;

  [[nodiscard]] std::optional<InputSize> required_input_size() const noexcept override;

  [[nodiscard]] std::uint32_t input_width() const noexcept;
  [[nodiscard]] std::uint32_t input_height() const noexcept;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace kensa::vision
