#include <kensa/vision/region_analyzer.hpp>
#include "grid_cv_utils.hpp"
#include <kensa/core/region.hpp>
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <cstdint>
#include <numeric>
#include <vector>

namespace kensa::vision {

namespace kc = kensa::core;

namespace {

/// Labels in the order their first pixel appears in a raster scan. OpenCV's label
/// numbering depends on the labeling algorithm, so it is not relied upon.
std::vector<int> discovery_order(const cv::Mat& labels, int num_labels) {
  std::vector<int> order;
  order.reserve(static_cast<std::size_t>(num_labels));
  std::vector<bool> seen(static_cast<std::size_t>(num_labels), false);
  seen[0] = true;  // background
  for (int y = 0; y < labels.rows; ++y) {
    const auto* row = labels.ptr<std::int32_t>(y);
    for (int x = 0; x < labels.cols; ++x) {
      const int label = row[x];
      if (!seen[static_cast<std::size_t>(label)]) {
        seen[static_cast<std::size_t>(label)] = true;
        order.push_back(label);
      }
    }
  }
  return order;
}

}  // namespace

RegionAnalyzer::RegionAnalyzer(double min_area) : min_area_(min_area) {}

kc::RegionSet RegionAnalyzer::analyze(const kc::BinaryMask& mask) const {
  if (mask.foreground_count() == 0) {
    return kc::RegionSet{};
  }

  const cv::Mat binary = detail::mask_to_mat(mask);
  cv::Mat labels;
  cv::Mat stats;
  cv::Mat centroids;
  const int num_labels =
      cv::connectedComponentsWithStats(binary, labels, stats, centroids, 8, CV_32S);

  const std::vector<int> order = discovery_order(labels, num_labels);
  const std::vector<kc::Region> regions = std::accumulate(
      order.begin(), order.end(), std::vector<kc::Region>{},
      [&stats, this](std::vector<kc::Region> acc, int label) {
        const double area = stats.at<int>(label, cv::CC_STAT_AREA);
        if (area >= min_area_) {
          acc.push_back(kc::Region{
              area,
              kc::BBox{stats.at<int>(label, cv::CC_STAT_LEFT),
                       stats.at<int>(label, cv::CC_STAT_TOP),
                       stats.at<int>(label, cv::CC_STAT_WIDTH),
                       stats.at<int>(label, cv::CC_STAT_HEIGHT)}});
        }
        return acc;
      });
  return kc::RegionSet(regions);
}

}  // namespace kensa::vision
