#include <kensa/core/pixel_grid.hpp>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>

namespace kensa::core {

std::uint32_t channel_count(PixelFormat format) noexcept {
  switch (format) {
    case PixelFormat::Grayscale8:
      return 1;
    case PixelFormat::BGR8:
    case PixelFormat::RGB8:
      return 3;
  }
  return 0;
}

PixelGrid::PixelGrid(std::uint32_t width,
                     std::uint32_t height,
                     PixelFormat format,
                     std::vector<std::uint8_t> samples)
    : width_(width),
      height_(height),
      format_(format),
      samples_(std::move(samples)) {
  if (width_ == 0 || height_ == 0) {
    throw std::invalid_argument("PixelGrid: width and height must be positive");
  }
  const std::size_t expected = min_bytes(width_, height_, format_);
  if (samples_.size() != expected) {
    throw std::invalid_argument("PixelGrid: expected " + std::to_string(expected) +
                                " samples, got " + std::to_string(samples_.size()));
  }
}

std::size_t PixelGrid::min_bytes(std::uint32_t width,
                                 std::uint32_t height,
                                 PixelFormat format) {
  return static_cast<std::size_t>(width) * height * channel_count(format);
}

}  // namespace kensa::core
