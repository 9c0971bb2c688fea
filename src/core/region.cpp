#include <kensa/core/region.hpp>
#include <numeric>
#include <utility>

namespace kensa::core {

RegionSet::RegionSet(std::vector<Region> regions)
    : regions_(std::move(regions)),
      significant_area_(std::accumulate(
          regions_.begin(), regions_.end(), 0.0,
          [](double sum, const Region& r) { return sum + r.area; })) {}

}  // namespace kensa::core
