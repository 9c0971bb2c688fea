#pragma once

#include <kensa/app/inspector.hpp>
#include <kensa/core/error.hpp>
#include <kensa/core/verdict.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace kensa::app {

/// Encoded image bytes as uploaded.
using ImageBytes = std::vector<std::uint8_t>;

/// Outcome of one inspection in a batch, tagged for traceability.
struct InspectionRecord {
  std::size_t index{0};                   // position in the submitted batch
  std::optional<std::string> station_id;  // which station/camera produced the image
  std::expected<kensa::core::Verdict, kensa::core::InspectionError> outcome{
      std::unexpected(kensa::core::InspectionError::None)};
};

/// Callback for each InspectionRecord, failures included; may be invoked from worker
/// threads. Must be thread-safe if using run_inspection_batch_parallel.
using InspectionCallback = std::function<void(const InspectionRecord&)>;

/// Runs one inspection. No threading; direct call.
/// If timing_cb is non-null, it is invoked for each stage with (stage_index, duration_ms).
/// If station_id is provided, it is set on the returned record.
[[nodiscard]] InspectionRecord run_inspection(const Inspector& inspector,
                                              const ImageBytes& image,
                                              const StageTimingCallback* timing_cb = nullptr,
                                              std::optional<std::string> station_id = std::nullopt);

/// Runs inspections sequentially; calls callback for each record in submission order.
/// If station_ids is provided (same size as images), each record is tagged with the
/// corresponding id; empty string = leave unset.
void run_inspection_batch(const Inspector& inspector,
                          const std::vector<ImageBytes>& images,
                          InspectionCallback callback,
                          const std::vector<std::string>* station_ids = nullptr);

/// Runs inspections in parallel on a worker pool. Records arrive in completion order;
/// use InspectionRecord::index to restore submission order. num_workers 0 = use
/// hardware concurrency.
void run_inspection_batch_parallel(const Inspector& inspector,
                                   const std::vector<ImageBytes>& images,
                                   InspectionCallback callback,
                                   std::size_t num_workers = 0,
                                   const std::vector<std::string>* station_ids = nullptr);

}  // namespace kensa::app
