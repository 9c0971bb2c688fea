#include <kensa/core/feature_map.hpp>
#include <stdexcept>
#include <string>
#include <utility>

namespace kensa::core {

namespace {

void check_dimensions(const char* what, std::uint32_t width, std::uint32_t height,
                      std::size_t size) {
  if (width == 0 || height == 0) {
    throw std::invalid_argument(std::string(what) + ": width and height must be positive");
  }
  if (size != static_cast<std::size_t>(width) * height) {
    throw std::invalid_argument(std::string(what) + ": value count does not match dimensions");
  }
}

}  // namespace

FeatureMap::FeatureMap(std::uint32_t width, std::uint32_t height,
                       std::vector<std::uint8_t> values)
    : width_(width), height_(height), values_(std::move(values)) {
  check_dimensions("FeatureMap", width_, height_, values_.size());
}

BinaryMask::BinaryMask(std::uint32_t width, std::uint32_t height,
                       std::vector<std::uint8_t> values)
    : width_(width), height_(height), values_(std::move(values)) {
  check_dimensions("BinaryMask", width_, height_, values_.size());
  for (const std::uint8_t v : values_) {
    if (v > 1) {
      throw std::invalid_argument("BinaryMask: values must be 0 or 1");
    }
    foreground_ += v;
  }
}

}  // namespace kensa::core
