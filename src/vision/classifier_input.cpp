#include <kensa/vision/classifier_input.hpp>
#include "grid_cv_utils.hpp"
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

namespace kensa::vision {

namespace kc = kensa::core;

std::expected<ClassifierInput, kc::InspectionError> prepare_classifier_input(
    const kc::PixelGrid& grid, std::uint32_t width, std::uint32_t height) {
  if (width == 0 || height == 0) {
    return std::unexpected(kc::InspectionError::InvalidConfig);
  }

  const cv::Mat src = detail::grid_to_mat(grid);
  cv::Mat rgb;
  switch (grid.format()) {
    case kc::PixelFormat::BGR8:
      cv::cvtColor(src, rgb, cv::COLOR_BGR2RGB);
      break;
    case kc::PixelFormat::Grayscale8:
      cv::cvtColor(src, rgb, cv::COLOR_GRAY2RGB);
      break;
    case kc::PixelFormat::RGB8:
      rgb = src;
      break;
  }

  cv::Mat resized;
  if (grid.width() == width && grid.height() == height) {
    resized = rgb;
  } else {
    cv::resize(rgb, resized, cv::Size(static_cast<int>(width), static_cast<int>(height)), 0, 0,
               cv::INTER_AREA);
  }

  cv::Mat scaled;
  resized.convertTo(scaled, CV_32FC3, 1.0 / 255.0);

  ClassifierInput out;
  out.width = width;
  out.height = height;
  const auto* begin = scaled.ptr<float>();
  out.data.assign(begin, begin + scaled.total() * ClassifierInput::channels());
  return out;
}

}  // namespace kensa::vision
