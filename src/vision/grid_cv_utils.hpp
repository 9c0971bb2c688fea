#pragma once

#include <kensa/core/feature_map.hpp>
#include <kensa/core/pixel_grid.hpp>
#include <opencv2/core/mat.hpp>

namespace kensa::vision::detail {

/// Non-owning cv::Mat view over a PixelGrid (CV_8UC1 or CV_8UC3). The grid must
/// outlive the view; callers never write through it.
cv::Mat grid_to_mat(const kensa::core::PixelGrid& grid);

/// Convert a continuous 8-bit cv::Mat to a PixelGrid (copy).
kensa::core::PixelGrid mat_to_grid(const cv::Mat& mat, kensa::core::PixelFormat format);

/// Copy a CV_8UC1 mat into a FeatureMap / BinaryMask.
kensa::core::FeatureMap mat_to_feature_map(const cv::Mat& mat);
kensa::core::BinaryMask mat_to_mask(const cv::Mat& mat);

/// Non-owning CV_8UC1 view over a BinaryMask.
cv::Mat mask_to_mat(const kensa::core::BinaryMask& mask);

}  // namespace kensa::vision::detail
