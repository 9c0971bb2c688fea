#include <kensa/app/inspection_runner_tbb.hpp>

#ifdef KENSA_HAS_TBB

#include <kensa/core/error.hpp>
#include <spdlog/spdlog.h>
#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <cstddef>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace kensa::app {

void run_inspection_multi_station_tbb(
    const std::unordered_map<std::string, const Inspector*>& inspectors,
    const std::vector<std::pair<std::string, ImageBytes>>& work_items,
    InspectionCallback callback) {
  if (work_items.empty() || !callback) return;

  const std::size_t n = work_items.size();
  tbb::parallel_for(
      tbb::blocked_range<std::size_t>(0, n),
      [&inspectors, &work_items, &callback](const tbb::blocked_range<std::size_t>& range) {
        for (std::size_t i = range.begin(); i != range.end(); ++i) {
          const std::string& station_id = work_items[i].first;
          const ImageBytes& image = work_items[i].second;
          auto it = inspectors.find(station_id);
          InspectionRecord record;
          if (it == inspectors.end() || it->second == nullptr) {
            spdlog::warn("station {}: no inspector registered", station_id);
            record.station_id = station_id;
            record.outcome = std::unexpected(kensa::core::InspectionError::InvalidConfig);
          } else {
            record = run_inspection(*it->second, image, nullptr, station_id);
          }
          record.index = i;
          callback(record);
        }
      });
}

}  // namespace kensa::app

#endif  // KENSA_HAS_TBB
