#pragma once

#include <kensa/core/error.hpp>
#include <kensa/core/pixel_grid.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <vector>

namespace kensa::vision {

/// Width x height a classifier expects its input at.
struct InputSize {
  std::uint32_t width{0};
  std::uint32_t height{0};

  friend bool operator==(const InputSize&, const InputSize&) = default;
};

/// Preprocessed classifier input: RGB, float HWC, values in [0, 1].
struct ClassifierInput {
  std::uint32_t width{0};
  std::uint32_t height{0};
  std::vector<float> data;  // width * height * 3

  [[nodiscard]] static constexpr std::uint32_t channels() noexcept { return 3; }
  [[nodiscard]] bool empty() const noexcept { return data.empty(); }
  [[nodiscard]] InputSize size() const noexcept { return InputSize{width, height}; }
};

/// Convert to RGB, resize (area interpolation) to width x height and scale to [0, 1].
/// InvalidConfig for a zero target size.
[[nodiscard]] std::expected<ClassifierInput, kensa::core::InspectionError>
prepare_classifier_input(const kensa::core::PixelGrid& grid,
                         std::uint32_t width = 224,
                         std::uint32_t height = 224);

}  // namespace kensa::vision
