#pragma once

#include <string_view>

namespace kensa::core {

/// Inspection error codes; used with std::expected. Every code is fatal to the
/// request that produced it and is never retried inside the core.
enum class InspectionError {
  None = 0,
  DecodeError,             // unparseable or empty image bytes
  FeatureExtractionError,  // degenerate image, e.g. zero gradient everywhere
  ClassifierError,         // classifier collaborator failed or returned garbage
  InvalidConfig,
};

/// Stable name for logs and CLI output (e.g. "DecodeError").
[[nodiscard]] std::string_view to_string(InspectionError error) noexcept;

}  // namespace kensa::core
