#include <kensa/vision/image_decoder.hpp>
#include "grid_cv_utils.hpp"
#include <kensa/core/error.hpp>
#include <kensa/core/pixel_grid.hpp>
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <fstream>
#include <iterator>
#include <vector>

namespace kensa::vision {

namespace kc = kensa::core;

std::expected<kc::PixelGrid, kc::InspectionError> decode(
    std::span<const std::uint8_t> bytes) {
  if (bytes.empty()) {
    return std::unexpected(kc::InspectionError::DecodeError);
  }

  const cv::Mat raw(1, static_cast<int>(bytes.size()), CV_8UC1,
                    const_cast<std::uint8_t*>(bytes.data()));
  cv::Mat mat;
  try {
    // IMREAD_ANYCOLOR keeps 8-bit depth, drops alpha, and leaves grayscale as 1 channel.
    mat = cv::imdecode(raw, cv::IMREAD_ANYCOLOR);
  } catch (const cv::Exception&) {
    return std::unexpected(kc::InspectionError::DecodeError);
  }
  if (mat.empty() || mat.cols <= 0 || mat.rows <= 0) {
    return std::unexpected(kc::InspectionError::DecodeError);
  }

  if (mat.channels() == 1) {
    return detail::mat_to_grid(mat, kc::PixelFormat::Grayscale8);
  }
  if (mat.channels() == 3) {
    return detail::mat_to_grid(mat, kc::PixelFormat::BGR8);
  }
  return std::unexpected(kc::InspectionError::DecodeError);
}

std::vector<std::uint8_t> read_file_bytes(const std::string& path) {
  std::ifstream f(path, std::ios::binary);
  if (!f) return {};
  return std::vector<std::uint8_t>(std::istreambuf_iterator<char>(f),
                                   std::istreambuf_iterator<char>());
}

std::expected<kc::PixelGrid, kc::InspectionError> decode_file(const std::string& path) {
  const std::vector<std::uint8_t> bytes = read_file_bytes(path);
  return decode(bytes);
}

}  // namespace kensa::vision
