#pragma once

#include <kensa/core/error.hpp>
#include <kensa/core/pixel_grid.hpp>
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <vector>

namespace kensa::vision {

/// Decode an encoded raster image (PNG, JPEG, BMP, TIFF, ...) into a PixelGrid.
/// Colour input becomes BGR8, grayscale input Grayscale8; alpha and 16-bit depth
/// are dropped. Returns DecodeError for empty, unparseable or zero-area input.
/// Deterministic and free of side effects.
[[nodiscard]] std::expected<kensa::core::PixelGrid, kensa::core::InspectionError>
decode(std::span<const std::uint8_t> bytes);

/// Read a file and decode() its bytes. A missing or unreadable file is a DecodeError.
[[nodiscard]] std::expected<kensa::core::PixelGrid, kensa::core::InspectionError>
decode_file(const std::string& path);

/// Read a whole file into memory; empty vector if it cannot be read.
[[nodiscard]] std::vector<std::uint8_t> read_file_bytes(const std::string& path);

}  // namespace kensa::vision
