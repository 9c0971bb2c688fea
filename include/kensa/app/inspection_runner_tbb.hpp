#pragma once

#include <kensa/app/inspection_runner.hpp>
#include <kensa/app/inspector.hpp>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#ifdef KENSA_HAS_TBB

namespace kensa::app {

/// Runs inspections for a batch of (station_id, image) work items in parallel using TBB.
///
/// For each item, the Inspector registered for station_id inspects the image and
/// callback(record) is invoked with record.station_id = station_id. An item whose
/// station has no Inspector is reported with InspectionError::InvalidConfig.
///
/// Inspector::inspect() is const and thread-safe, so one Inspector may serve several
/// stations and several items of the same station concurrently, provided its
/// classifiers are thread-safe (all bundled ones are).
///
/// \param inspectors Map from station_id to Inspector. Caller keeps ownership.
/// \param work_items Flat list of (station_id, image bytes) pairs; read only.
/// \param callback Invoked once per work item. Must be thread-safe.
void run_inspection_multi_station_tbb(
    const std::unordered_map<std::string, const Inspector*>& inspectors,
    const std::vector<std::pair<std::string, ImageBytes>>& work_items,
    InspectionCallback callback);

}  // namespace kensa::app

#endif  // KENSA_HAS_TBB
