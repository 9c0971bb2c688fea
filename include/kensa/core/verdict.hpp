#pragma once

#include <kensa/core/score_result.hpp>
#include <cstdint>
#include <string_view>

namespace kensa::core {

enum class VerdictStatus : std::uint8_t {
  Pass,
  Fail,
  Uncertain,
  InvalidInput,
};

/// Why a verdict was reached. A key, not free text; see explanation_text().
enum class ExplanationKey : std::uint8_t {
  SurfaceClean,
  DefectsExceedLimit,
  ImageUnclear,
  NotInspectableSurface,
};

/// Final, immutable outcome of one inspection.
struct Verdict {
  VerdictStatus status{VerdictStatus::Uncertain};
  ExplanationKey explanation{ExplanationKey::ImageUnclear};
  ScoreResult scores{};

  friend bool operator==(const Verdict&, const Verdict&) = default;
};

/// Language of operator-facing report text.
enum class ReportLanguage : std::uint8_t {
  English,
  Japanese,
};

/// "PASS", "FAIL", "UNCERTAIN" or "INVALID_INPUT".
[[nodiscard]] std::string_view to_string(VerdictStatus status) noexcept;

/// Machine key, e.g. "pass.surface_clean".
[[nodiscard]] std::string_view to_string(ExplanationKey key) noexcept;

/// Operator-facing sentence for a key.
[[nodiscard]] std::string_view explanation_text(
    ExplanationKey key, ReportLanguage language = ReportLanguage::English) noexcept;

/// Status as shown in a report: the canonical name in English, e.g. "合格" in Japanese.
[[nodiscard]] std::string_view status_label(VerdictStatus status,
                                            ReportLanguage language) noexcept;

[[nodiscard]] std::string_view to_string(ScoringMode mode) noexcept;

}  // namespace kensa::core
