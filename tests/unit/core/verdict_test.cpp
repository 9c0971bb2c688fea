#include <kensa/core/error.hpp>
#include <kensa/core/verdict.hpp>
#include <gtest/gtest.h>
#include <string>

namespace kc = kensa::core;

TEST(Verdict, StatusNames) {
  EXPECT_EQ(kc::to_string(kc::VerdictStatus::Pass), "PASS");
  EXPECT_EQ(kc::to_string(kc::VerdictStatus::Fail), "FAIL");
  EXPECT_EQ(kc::to_string(kc::VerdictStatus::Uncertain), "UNCERTAIN");
  EXPECT_EQ(kc::to_string(kc::VerdictStatus::InvalidInput), "INVALID_INPUT");
}

TEST(Verdict, ExplanationKeysAreNamespacedByOutcome) {
  EXPECT_EQ(kc::to_string(kc::ExplanationKey::SurfaceClean), "pass.surface_clean");
  EXPECT_EQ(kc::to_string(kc::ExplanationKey::DefectsExceedLimit), "fail.defects_exceed_limit");
  EXPECT_EQ(kc::to_string(kc::ExplanationKey::ImageUnclear), "uncertain.image_unclear");
  EXPECT_EQ(kc::to_string(kc::ExplanationKey::NotInspectableSurface),
            "invalid.not_inspectable_surface");
}

TEST(Verdict, ExplanationTextForUnclearImageAsksForRetake) {
  const std::string text(kc::explanation_text(kc::ExplanationKey::ImageUnclear));
  EXPECT_NE(text.find("retake"), std::string::npos);
}

TEST(Verdict, EqualityIncludesScores) {
  kc::Verdict a{kc::VerdictStatus::Pass, kc::ExplanationKey::SurfaceClean, {}};
  kc::Verdict b = a;
  EXPECT_EQ(a, b);
  b.scores.health_score = 99.0;
  EXPECT_NE(a, b);
}

TEST(InspectionError, Names) {
  EXPECT_EQ(kc::to_string(kc::InspectionError::DecodeError), "DecodeError");
  EXPECT_EQ(kc::to_string(kc::InspectionError::ClassifierError), "ClassifierError");
  EXPECT_EQ(kc::to_string(kc::ScoringMode::EdgeDensity), "edge_density");
}

TEST(Verdict, JapaneseReportText) {
  EXPECT_EQ(kc::status_label(kc::VerdictStatus::Pass, kc::ReportLanguage::Japanese), "合格");
  EXPECT_EQ(kc::status_label(kc::VerdictStatus::Fail, kc::ReportLanguage::Japanese), "不合格");
  EXPECT_EQ(kc::status_label(kc::VerdictStatus::Uncertain, kc::ReportLanguage::Japanese),
            "判定保留");
  EXPECT_EQ(kc::status_label(kc::VerdictStatus::InvalidInput, kc::ReportLanguage::Japanese),
            "無効");
  EXPECT_EQ(kc::status_label(kc::VerdictStatus::Fail, kc::ReportLanguage::English), "FAIL");

  const std::string ja(
      kc::explanation_text(kc::ExplanationKey::ImageUnclear, kc::ReportLanguage::Japanese));
  EXPECT_NE(ja.find("再撮影"), std::string::npos);
  EXPECT_EQ(kc::explanation_text(kc::ExplanationKey::SurfaceClean),
            kc::explanation_text(kc::ExplanationKey::SurfaceClean, kc::ReportLanguage::English));
}
