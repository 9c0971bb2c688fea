#include "grid_cv_utils.hpp"
#include <kensa/core/feature_map.hpp>
#include <kensa/core/pixel_grid.hpp>
#include <opencv2/core.hpp>
#include <cstdint>
#include <vector>

namespace kensa::vision::detail {

namespace kc = kensa::core;

namespace {

std::vector<std::uint8_t> copy_samples(const cv::Mat& mat) {
  cv::Mat continuous = mat.isContinuous() ? mat : mat.clone();
  const auto* begin = continuous.ptr<std::uint8_t>();
  return std::vector<std::uint8_t>(begin, begin + continuous.total() * continuous.elemSize());
}

}  // namespace

cv::Mat grid_to_mat(const kc::PixelGrid& grid) {
  const int type = grid.channels() == 1 ? CV_8UC1 : CV_8UC3;
  return cv::Mat(static_cast<int>(grid.height()), static_cast<int>(grid.width()), type,
                 const_cast<std::uint8_t*>(grid.data().data()));
}

kc::PixelGrid mat_to_grid(const cv::Mat& mat, kc::PixelFormat format) {
  return kc::PixelGrid(static_cast<std::uint32_t>(mat.cols),
                       static_cast<std::uint32_t>(mat.rows), format, copy_samples(mat));
}

kc::FeatureMap mat_to_feature_map(const cv::Mat& mat) {
  return kc::FeatureMap(static_cast<std::uint32_t>(mat.cols),
                        static_cast<std::uint32_t>(mat.rows), copy_samples(mat));
}

kc::BinaryMask mat_to_mask(const cv::Mat& mat) {
  return kc::BinaryMask(static_cast<std::uint32_t>(mat.cols),
                        static_cast<std::uint32_t>(mat.rows), copy_samples(mat));
}

cv::Mat mask_to_mat(const kc::BinaryMask& mask) {
  return cv::Mat(static_cast<int>(mask.height()), static_cast<int>(mask.width()), CV_8UC1,
                 const_cast<std::uint8_t*>(mask.data().data()));
}

}  // namespace kensa::vision::detail
