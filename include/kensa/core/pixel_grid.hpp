#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace kensa::core {

/// Memory: PixelGrid owns a single contiguous buffer (std::vector<std::uint8_t>);
/// move semantics and RAII throughout. Use data() for std::span views (non-owning).
/// Thread-safety: distinct PixelGrid instances are independent. A grid is never
/// mutated after construction, so sharing a const one across threads is fine.

/// Pixel layout. Decoded images are Grayscale8 or BGR8; classifier input is RGB.
enum class PixelFormat : std::uint8_t {
  Grayscale8,
  BGR8,
  RGB8,
};

/// Number of 8-bit samples per pixel for \p format (1 or 3).
[[nodiscard]] std::uint32_t channel_count(PixelFormat format) noexcept;

/// Decoded raster image: width, height, format and row-major 8-bit samples.
/// Invariant: width > 0, height > 0, samples == width * height * channels.
class PixelGrid {
 public:
  /// Throws std::invalid_argument when the invariant does not hold.
  PixelGrid(std::uint32_t width,
            std::uint32_t height,
            PixelFormat format,
            std::vector<std::uint8_t> samples);

  [[nodiscard]] std::uint32_t width() const noexcept { return width_; }
  [[nodiscard]] std::uint32_t height() const noexcept { return height_; }
  [[nodiscard]] PixelFormat format() const noexcept { return format_; }
  [[nodiscard]] std::uint32_t channels() const noexcept {
    return channel_count(format_);
  }

  [[nodiscard]] std::span<const std::uint8_t> data() const noexcept {
    return std::span<const std::uint8_t>(samples_.data(), samples_.size());
  }

  [[nodiscard]] std::size_t size_bytes() const noexcept { return samples_.size(); }
  [[nodiscard]] std::size_t area() const noexcept {
    return static_cast<std::size_t>(width_) * height_;
  }

  /// Bytes required for given dimensions and format (for validation).
  [[nodiscard]] static std::size_t min_bytes(std::uint32_t width,
                                             std::uint32_t height,
                                             PixelFormat format);

  friend bool operator==(const PixelGrid&, const PixelGrid&) = default;

 private:
  std::uint32_t width_;
  std::uint32_t height_;
  PixelFormat format_;
  std::vector<std::uint8_t> samples_;
};

}  // namespace kensa::core
