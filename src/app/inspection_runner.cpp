#include <kensa/app/inspection_runner.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <atomic>
#include <thread>
#include <vector>

namespace kensa::app {

namespace {

std::size_t effective_workers(std::size_t num_workers) {
  if (num_workers > 0) return num_workers;
  const unsigned hw = std::thread::hardware_concurrency();
  return hw > 0 ? static_cast<std::size_t>(hw) : 1;
}

std::optional<std::string> station_for(const std::vector<std::string>* station_ids,
                                       std::size_t n, std::size_t i) {
  if (!station_ids || station_ids->size() != n || (*station_ids)[i].empty()) {
    return std::nullopt;
  }
  return (*station_ids)[i];
}

InspectionRecord inspect_one(const Inspector& inspector, const ImageBytes& image,
                             std::size_t index, std::optional<std::string> station_id) {
  InspectionRecord record = run_inspection(inspector, image, nullptr, std::move(station_id));
  record.index = index;
  if (!record.outcome) {
    spdlog::warn("batch item {}{}: {}", index,
                 record.station_id ? " (" + *record.station_id + ")" : std::string(),
                 kensa::core::to_string(record.outcome.error()));
  }
  return record;
}

}  // namespace

InspectionRecord run_inspection(const Inspector& inspector,
                                const ImageBytes& image,
                                const StageTimingCallback* timing_cb,
                                std::optional<std::string> station_id) {
  InspectionRecord record;
  record.station_id = std::move(station_id);
  record.outcome = inspector.inspect(image, std::nullopt, timing_cb);
  return record;
}

void run_inspection_batch(const Inspector& inspector,
                          const std::vector<ImageBytes>& images,
                          InspectionCallback callback,
                          const std::vector<std::string>* station_ids) {
  if (!callback) return;
  const std::size_t n = images.size();
  for (std::size_t i = 0; i < n; ++i) {
    callback(inspect_one(inspector, images[i], i, station_for(station_ids, n, i)));
  }
}

void run_inspection_batch_parallel(const Inspector& inspector,
                                   const std::vector<ImageBytes>& images,
                                   InspectionCallback callback,
                                   std::size_t num_workers,
                                   const std::vector<std::string>* station_ids) {
  const std::size_t n = images.size();
  if (n == 0 || !callback) return;

  const std::size_t workers = std::min(effective_workers(num_workers), n);
  if (workers <= 1) {
    run_inspection_batch(inspector, images, std::move(callback), station_ids);
    return;
  }

  std::atomic<std::size_t> next{0};
  auto worker = [&]() {
    while (true) {
      const std::size_t idx = next.fetch_add(1);
      if (idx >= n) break;
      callback(inspect_one(inspector, images[idx], idx, station_for(station_ids, n, idx)));
    }
  };

  std::vector<std::thread> threads;
  threads.reserve(workers);
  for (std::size_t i = 0; i < workers; ++i) {
    threads.emplace_back(worker);
  }
  for (auto& t : threads) {
    t.join();
  }
}

}  // namespace kensa::app
