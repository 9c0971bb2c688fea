#pragma once

#include <kensa/core/feature_map.hpp>
#include <kensa/core/region.hpp>

namespace kensa::vision {

/// Extracts maximal 8-connected foreground components from an edge mask.
class RegionAnalyzer {
 public:
  explicit RegionAnalyzer(double min_area = 10.0);

  /// Components with area < min_area are dropped; survivors keep discovery order
  /// (raster order of their first pixel). An empty result is not an error.
  [[nodiscard]] kensa::core::RegionSet analyze(const kensa::core::BinaryMask& mask) const;

  [[nodiscard]] double min_area() const noexcept { return min_area_; }

 private:
  double min_area_;
};

}  // namespace kensa::vision
