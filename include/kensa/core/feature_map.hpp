#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace kensa::core {

/// W x H gradient-magnitude map, rescaled so its maximum is 255.
/// Produced once from a PixelGrid; immutable thereafter.
class FeatureMap {
 public:
  /// Throws std::invalid_argument if values.size() != width * height or a
  /// dimension is zero.
  FeatureMap(std::uint32_t width, std::uint32_t height,
             std::vector<std::uint8_t> values);

  [[nodiscard]] std::uint32_t width() const noexcept { return width_; }
  [[nodiscard]] std::uint32_t height() const noexcept { return height_; }
  [[nodiscard]] std::uint8_t at(std::uint32_t x, std::uint32_t y) const noexcept {
    return values_[static_cast<std::size_t>(y) * width_ + x];
  }
  [[nodiscard]] std::span<const std::uint8_t> data() const noexcept {
    return std::span<const std::uint8_t>(values_.data(), values_.size());
  }

  friend bool operator==(const FeatureMap&, const FeatureMap&) = default;

 private:
  std::uint32_t width_;
  std::uint32_t height_;
  std::vector<std::uint8_t> values_;
};

/// W x H edge mask with values in {0, 1}; 1 = foreground (edge) pixel.
class BinaryMask {
 public:
  /// Throws std::invalid_argument on a size mismatch or a value other than 0/1.
  BinaryMask(std::uint32_t width, std::uint32_t height,
             std::vector<std::uint8_t> values);

  [[nodiscard]] std::uint32_t width() const noexcept { return width_; }
  [[nodiscard]] std::uint32_t height() const noexcept { return height_; }
  [[nodiscard]] bool at(std::uint32_t x, std::uint32_t y) const noexcept {
    return values_[static_cast<std::size_t>(y) * width_ + x] != 0;
  }
  [[nodiscard]] std::span<const std::uint8_t> data() const noexcept {
    return std::span<const std::uint8_t>(values_.data(), values_.size());
  }
  [[nodiscard]] std::size_t area() const noexcept {
    return static_cast<std::size_t>(width_) * height_;
  }

  /// Number of foreground pixels.
  [[nodiscard]] std::size_t foreground_count() const noexcept {
    return foreground_;
  }

  friend bool operator==(const BinaryMask&, const BinaryMask&) = default;

 private:
  std::uint32_t width_;
  std::uint32_t height_;
  std::vector<std::uint8_t> values_;
  std::size_t foreground_{0};
};

}  // namespace kensa::core
