#include <kensa/vision/feature_extractor.hpp>
#include "grid_cv_utils.hpp"
#include <kensa/core/error.hpp>
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <spdlog/spdlog.h>
#include <cmath>

namespace kensa::vision {

namespace kc = kensa::core;

namespace {

bool is_odd_positive(int k) { return k >= 1 && k % 2 == 1; }

cv::Mat to_luma(const kc::PixelGrid& grid) {
  const cv::Mat src = detail::grid_to_mat(grid);
  cv::Mat gray;
  switch (grid.format()) {
    case kc::PixelFormat::BGR8:
      cv::cvtColor(src, gray, cv::COLOR_BGR2GRAY);
      break;
    case kc::PixelFormat::RGB8:
      cv::cvtColor(src, gray, cv::COLOR_RGB2GRAY);
      break;
    case kc::PixelFormat::Grayscale8:
      gray = src.clone();
      break;
  }
  return gray;
}

}  // namespace

bool is_valid(const FeatureConfig& config) noexcept {
  return is_odd_positive(config.blur_kernel_size) &&
         is_odd_positive(config.closing_kernel_size) &&
         config.clahe_tile_size >= 1 && config.clahe_clip_limit > 0.0;
}

FeatureExtractor::FeatureExtractor(FeatureConfig config) : config_(config) {}

std::expected<FeatureSet, kc::InspectionError> FeatureExtractor::extract(
    const kc::PixelGrid& grid) const {
  if (!is_valid(config_)) {
    return std::unexpected(kc::InspectionError::InvalidConfig);
  }

  cv::Mat gray = to_luma(grid);

  // Smoothing must precede the derivative; afterwards it would blur real edges.
  cv::Mat smoothed;
  if (config_.blur_kernel_size > 1) {
    cv::GaussianBlur(gray, smoothed,
                     cv::Size(config_.blur_kernel_size, config_.blur_kernel_size), 0);
  } else {
    smoothed = gray;
  }

  if (config_.use_clahe) {
    cv::Ptr<cv::CLAHE> clahe = cv::createCLAHE(
        config_.clahe_clip_limit, cv::Size(config_.clahe_tile_size, config_.clahe_tile_size));
    cv::Mat equalized;
    clahe->apply(smoothed, equalized);
    smoothed = equalized;
  }

  cv::Mat gx;
  cv::Mat gy;
  cv::Sobel(smoothed, gx, CV_32F, 1, 0, 3);
  cv::Sobel(smoothed, gy, CV_32F, 0, 1, 3);
  cv::Mat magnitude;
  cv::magnitude(gx, gy, magnitude);

  double max_val = 0.0;
  cv::minMaxLoc(magnitude, nullptr, &max_val);
  if (!std::isfinite(max_val) || max_val <= 0.0) {
    spdlog::debug("feature extraction: zero gradient energy ({}x{})", grid.width(),
                  grid.height());
    return std::unexpected(kc::InspectionError::FeatureExtractionError);
  }

  // Relative to this image's own gradient energy, not an absolute scale.
  cv::Mat magnitude8;
  magnitude.convertTo(magnitude8, CV_8U, 255.0 / max_val);

  cv::Mat binary;
  const double threshold =
      cv::threshold(magnitude8, binary, 0, 1, cv::THRESH_BINARY | cv::THRESH_OTSU);

  const cv::Mat element = cv::getStructuringElement(
      cv::MORPH_RECT, cv::Size(config_.closing_kernel_size, config_.closing_kernel_size));
  cv::Mat closed;
  cv::morphologyEx(binary, closed, cv::MORPH_CLOSE, element);

  spdlog::debug("feature extraction: otsu threshold {:.1f}", threshold);
  return FeatureSet{detail::mat_to_feature_map(magnitude8), detail::mat_to_mask(closed),
                    threshold};
}

}  // namespace kensa::vision
