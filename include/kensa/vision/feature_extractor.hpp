#pragma once

#include <kensa/core/error.hpp>
#include <kensa/core/feature_map.hpp>
#include <kensa/core/pixel_grid.hpp>
#include <expected>

namespace kensa::vision {

/// Tunables for edge-feature extraction.
struct FeatureConfig {
  int blur_kernel_size{5};       // odd, >= 1; Gaussian smoothing before gradients
  bool use_clahe{false};         // tiled local contrast normalization
  double clahe_clip_limit{2.0};
  int clahe_tile_size{8};        // tiles per axis
  int closing_kernel_size{3};    // odd, >= 1; rectangular structuring element
};

/// Output of FeatureExtractor::extract.
struct FeatureSet {
  kensa::core::FeatureMap magnitude;
  kensa::core::BinaryMask mask;
  double threshold{0.0};  // Otsu threshold chosen on the magnitude map
};

/// Turns a PixelGrid into a gradient-magnitude map and a cleaned edge mask:
/// luma -> Gaussian blur -> optional CLAHE -> Sobel magnitude rescaled to
/// max 255 -> Otsu binarization -> one morphological closing.
/// Stateless apart from its configuration; safe to share across threads.
class FeatureExtractor {
 public:
  explicit FeatureExtractor(FeatureConfig config = {});

  /// FeatureExtractionError when the image has no gradient (e.g. uniform colour);
  /// InvalidConfig when the kernel settings are unusable.
  [[nodiscard]] std::expected<FeatureSet, kensa::core::InspectionError> extract(
      const kensa::core::PixelGrid& grid) const;

  [[nodiscard]] const FeatureConfig& config() const noexcept { return config_; }

 private:
  FeatureConfig config_;
};

/// True if the configuration can be used by FeatureExtractor.
[[nodiscard]] bool is_valid(const FeatureConfig& config) noexcept;

}  // namespace kensa::vision
