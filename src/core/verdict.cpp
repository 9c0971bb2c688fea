#include <kensa/core/verdict.hpp>

namespace kensa::core {

std::string_view to_string(VerdictStatus status) noexcept {
  switch (status) {
    case VerdictStatus::Pass:
      return "PASS";
    case VerdictStatus::Fail:
      return "FAIL";
    case VerdictStatus::Uncertain:
      return "UNCERTAIN";
    case VerdictStatus::InvalidInput:
      return "INVALID_INPUT";
  }
  return "UNKNOWN";
}

std::string_view to_string(ExplanationKey key) noexcept {
  switch (key) {
    case ExplanationKey::SurfaceClean:
      return "pass.surface_clean";
    case ExplanationKey::DefectsExceedLimit:
      return "fail.defects_exceed_limit";
    case ExplanationKey::ImageUnclear:
      return "uncertain.image_unclear";
    case ExplanationKey::NotInspectableSurface:
      return "invalid.not_inspectable_surface";
  }
  return "unknown";
}

namespace {

std::string_view explanation_text_ja(ExplanationKey key) noexcept {
  switch (key) {
    case ExplanationKey::SurfaceClean:
      return "表面に重大な欠陥は確認されておらず、基準内の状態であると判断されました。";
    case ExplanationKey::DefectsExceedLimit:
      return "許容基準を超える欠陥傾向が検出されました。品質基準を満たしていません。";
    case ExplanationKey::ImageUnclear:
      return "画像状態が不明瞭なため、再撮影または担当者確認を推奨します。";
    case ExplanationKey::NotInspectableSurface:
      return "産業用金属表面の検査可能な画像ではありません。";
  }
  return "検査が完了しました。";
}

}  // namespace

std::string_view explanation_text(ExplanationKey key, ReportLanguage language) noexcept {
  if (language == ReportLanguage::Japanese) {
    return explanation_text_ja(key);
  }
  switch (key) {
    case ExplanationKey::SurfaceClean:
      return "Surface appears clean with no significant defect patterns.";
    case ExplanationKey::DefectsExceedLimit:
      return "Surface shows defect patterns exceeding acceptable threshold.";
    case ExplanationKey::ImageUnclear:
      return "Surface unclear. Please retake image with better lighting.";
    case ExplanationKey::NotInspectableSurface:
      return "Image does not resemble an inspectable industrial metal surface.";
  }
  return "Inspection completed.";
}

std::string_view status_label(VerdictStatus status, ReportLanguage language) noexcept {
  if (language == ReportLanguage::English) {
    return to_string(status);
  }
  switch (status) {
    case VerdictStatus::Pass:
      return "合格";
    case VerdictStatus::Fail:
      return "不合格";
    case VerdictStatus::Uncertain:
      return "判定保留";
    case VerdictStatus::InvalidInput:
      return "無効";
  }
  return "不明";
}

std::string_view to_string(ScoringMode mode) noexcept {
  switch (mode) {
    case ScoringMode::Geometric:
      return "geometric";
    case ScoringMode::EdgeDensity:
      return "edge_density";
    case ScoringMode::Classifier:
      return "classifier";
  }
  return "unknown";
}

}  // namespace kensa::core
