#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace kensa::core {

/// Axis-aligned bounding box in pixel coordinates.
struct BBox {
  std::int32_t x{0};
  std::int32_t y{0};
  std::int32_t w{0};
  std::int32_t h{0};

  friend bool operator==(const BBox&, const BBox&) = default;
};

/// One connected foreground component of the edge mask; a candidate defect.
struct Region {
  double area{0.0};  // pixel count
  BBox bbox{};

  friend bool operator==(const Region&, const Region&) = default;
};

/// Regions that survived the minimum-area filter, in discovery order
/// (raster order of each component's first pixel).
class RegionSet {
 public:
  RegionSet() = default;
  explicit RegionSet(std::vector<Region> regions);

  [[nodiscard]] const std::vector<Region>& regions() const noexcept { return regions_; }
  [[nodiscard]] std::size_t count() const noexcept { return regions_.size(); }
  [[nodiscard]] bool empty() const noexcept { return regions_.empty(); }

  /// Sum of surviving region areas.
  [[nodiscard]] double significant_area() const noexcept { return significant_area_; }

  friend bool operator==(const RegionSet&, const RegionSet&) = default;

 private:
  std::vector<Region> regions_;
  double significant_area_{0.0};
};

}  // namespace kensa::core
