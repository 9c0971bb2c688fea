#include <kensa/vision/onnx_classifier.hpp>
#include <kensa/core/error.hpp>
#include <onnxruntime_cxx_api.h>
#include <spdlog/spdlog.h>
#include <array>
#include <cmath>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace kensa::vision {

namespace {

constexpr int64_t kNumChannels = 3;

Ort::MemoryInfo CpuMemoryInfo() {
  return Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault);
}

/// Copy HWC (height, width, channels) float buffer to NCHW (batch, channels, height, width).
void HwcToNchw(const float* hwc, std::uint32_t h, std::uint32_t w, float* nchw) {
  const std::size_t hw = static_cast<std::size_t>(h) * w;
  for (std::uint32_t y = 0; y < h; ++y) {
    for (std::uint32_t x = 0; x < w; ++x) {
      const std::size_t src_idx = (static_cast<std::size_t>(y) * w + x) * kNumChannels;
      nchw[0 * hw + y * w + x] = hwc[src_idx + 0];
      nchw[1 * hw + y * w + x] = hwc[src_idx + 1];
      nchw[2 * hw + y * w + x] = hwc[src_idx + 2];
    }
  }
}

}  // namespace

struct OnnxClassifier::Impl {
  Ort::Env env{ORT_LOGGING_LEVEL_WARNING, "kensa"};
  Ort::SessionOptions session_options;
  Ort::Session session{nullptr};

  std::string input_name;
  std::string output_name;

  std::uint32_t input_height{0};
  std::uint32_t input_width{0};
  bool input_is_nchw{true};

  Impl() {
    session_options.SetIntraOpNumThreads(1);
    session_options.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_EXTENDED);
  }
};

OnnxClassifier::OnnxClassifier(std::string model_path) : impl_(std::make_unique<Impl>()) {
  impl_->session = Ort::Session(impl_->env, model_path.c_str(), impl_->session_options);

  Ort::AllocatorWithDefaultOptions allocator;
  if (impl_->session.GetInputCount() == 0) {
    throw std::runtime_error("OnnxClassifier: model has no inputs");
  }
  if (impl_->session.GetOutputCount() == 0) {
    throw std::runtime_error("OnnxClassifier: model has no outputs");
  }
  impl_->input_name = impl_->session.GetInputNameAllocated(0, allocator).get();
  impl_->output_name = impl_->session.GetOutputNameAllocated(0, allocator).get();

  Ort::TypeInfo input_type = impl_->session.GetInputTypeInfo(0);
  const auto shape_info = input_type.GetTensorTypeAndShapeInfo();
  std::vector<int64_t> dims = shape_info.GetShape();
  if (dims.size() != 4u) {
    throw std::runtime_error("OnnxClassifier: expected 4D input");
  }
  // NCHW: [1, C, H, W] or NHWC: [1, H, W, C]
  if (dims[1] == kNumChannels && dims[2] > 0 && dims[3] > 0) {
    impl_->input_is_nchw = true;
    impl_->input_height = static_cast<std::uint32_t>(dims[2]);
    impl_->input_width = static_cast<std::uint32_t>(dims[3]);
  } else if (dims[3] == kNumChannels && dims[1] > 0 && dims[2] > 0) {
    impl_->input_is_nchw = false;
    impl_->input_height = static_cast<std::uint32_t>(dims[1]);
    impl_->input_width = static_cast<std::uint32_t>(dims[2]);
  } else {
    throw std::runtime_error("OnnxClassifier: expected static input shape [1,3,H,W] or [1,H,W,3]");
  }
  spdlog::info("OnnxClassifier: loaded {} ({}x{}, {})", model_path, impl_->input_width,
               impl_->input_height, impl_->input_is_nchw ? "NCHW" : "NHWC");
}

OnnxClassifier::~OnnxClassifier() = default;

std::uint32_t OnnxClassifier::input_width() const noexcept { return impl_->input_width; }

std::uint32_t OnnxClassifier::input_height() const noexcept { return impl_->input_height; }

std::optional<InputSize> OnnxClassifier::required_input_size() const noexcept {
  return InputSize{impl_->input_width, impl_->input_height};
}

std::expected<double, kensa::core::InspectionError> OnnxClassifier::probability(
    const ClassifierInput& input) const {
  using kensa::core::InspectionError;

  if (input.width != impl_->input_width || input.height != impl_->input_height) {
    return std::unexpected(InspectionError::ClassifierError);
  }
  const std::uint32_t h = input.height;
  const std::uint32_t w = input.width;
  const std::size_t num_floats = static_cast<std::size_t>(h) * w * kNumChannels;
  if (input.data.size() < num_floats) {
    return std::unexpected(InspectionError::ClassifierError);
  }

  Ort::MemoryInfo mem_info = CpuMemoryInfo();
  std::vector<float> buffer;
  std::array<int64_t, 4> shape{};
  if (impl_->input_is_nchw) {
    buffer.resize(num_floats);
    HwcToNchw(input.data.data(), h, w, buffer.data());
    shape = {1, kNumChannels, static_cast<int64_t>(h), static_cast<int64_t>(w)};
  } else {
    buffer.assign(input.data.begin(), input.data.begin() + static_cast<std::ptrdiff_t>(num_floats));
    shape = {1, static_cast<int64_t>(h), static_cast<int64_t>(w), kNumChannels};
  }
  Ort::Value input_tensor = Ort::Value::CreateTensor<float>(
      mem_info, buffer.data(), buffer.size(), shape.data(), shape.size());

  const char* input_names_c[] = {impl_->input_name.c_str()};
  const char* output_names_c[] = {impl_->output_name.c_str()};
  Ort::RunOptions run_options;

  std::vector<Ort::Value> outputs;
  try {
    outputs = impl_->session.Run(run_options, input_names_c, &input_tensor, 1,
                                 output_names_c, 1);
  } catch (const Ort::Exception& e) {
    spdlog::error("OnnxClassifier: inference failed: {}", e.what());
    return std::unexpected(InspectionError::ClassifierError);
  }
  if (outputs.size() != 1u) {
    return std::unexpected(InspectionError::ClassifierError);
  }

  const auto out_info = outputs[0].GetTensorTypeAndShapeInfo();
  if (out_info.GetElementType() != ONNX_TENSOR_ELEMENT_DATA_TYPE_FLOAT) {
    return std::unexpected(InspectionError::ClassifierError);
  }
  const std::size_t count = out_info.GetElementCount();
  const float* data = outputs[0].GetTensorData<float>();
  double p = 0.0;
  if (count == 1u) {
    p = data[0];
  } else if (count == 2u) {
    p = data[1];
  } else {
    return std::unexpected(InspectionError::ClassifierError);
  }
  if (!std::isfinite(p)) {
    return std::unexpected(InspectionError::ClassifierError);
  }
  return p;
}

void OnnxClassifier::warmup() {
  ClassifierInput input;
  input.width = impl_->input_width;
  input.height = impl_->input_height;
  input.data.assign(static_cast<std::size_t>(input.width) * input.height * kNumChannels, 0.f);
  if (!probability(input)) {
    spdlog::warn("OnnxClassifier: warmup inference failed");
  }
}

}  // namespace kensa::vision
