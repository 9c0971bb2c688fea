#include <kensa/app/config.hpp>
#include <kensa/app/inspector.hpp>
#include <kensa/core/error.hpp>
#include <kensa/core/verdict.hpp>
#include <kensa/vision/mock_classifier.hpp>
#include <synthetic_images.hpp>
#include <gtest/gtest.h>
#include <opencv2/core.hpp>
#include <memory>
#include <stdexcept>
#include <variant>
#include <vector>

namespace ka = kensa::app;
namespace kc = kensa::core;
namespace kv = kensa::vision;

namespace {

ka::InspectionConfig config_for(kc::ScoringMode mode) {
  ka::InspectionConfig c = ka::default_config();
  c.scoring_mode = mode;
  c.classifier_input_width = 32;
  c.classifier_input_height = 32;
  return c;
}

}  // namespace

TEST(Inspector, FewScratchesPass) {
  ka::Inspector inspector(config_for(kc::ScoringMode::Geometric));
  auto v = inspector.inspect(kensa::testing::scratched_png(2));
  ASSERT_TRUE(v.has_value());
  EXPECT_EQ(v->status, kc::VerdictStatus::Pass);
  EXPECT_EQ(v->explanation, kc::ExplanationKey::SurfaceClean);
  EXPECT_EQ(v->scores.defect_count, 2u);
  EXPECT_FALSE(v->scores.gatekeeper_score.has_value());
}

TEST(Inspector, ManyScratchesFail) {
  ka::Inspector inspector(config_for(kc::ScoringMode::Geometric));
  auto v = inspector.inspect(kensa::testing::scratched_png(10));
  ASSERT_TRUE(v.has_value());
  EXPECT_EQ(v->status, kc::VerdictStatus::Fail);
  EXPECT_EQ(v->explanation, kc::ExplanationKey::DefectsExceedLimit);
  EXPECT_GT(v->scores.defect_count, 5u);
  EXPECT_LT(v->scores.health_score, 90.0);
}

TEST(Inspector, GarbageBytesAreDecodeError) {
  ka::Inspector inspector(config_for(kc::ScoringMode::Geometric));
  std::vector<std::uint8_t> garbage(64, 0x5a);
  auto v = inspector.inspect(garbage);
  ASSERT_FALSE(v.has_value());
  EXPECT_EQ(v.error(), kc::InspectionError::DecodeError);
}

TEST(Inspector, FlatPlateIsFeatureExtractionError) {
  ka::Inspector inspector(config_for(kc::ScoringMode::Geometric));
  auto v = inspector.inspect(kensa::testing::encode_png(kensa::testing::flat_plate()));
  ASSERT_FALSE(v.has_value());
  EXPECT_EQ(v.error(), kc::InspectionError::FeatureExtractionError);
}

TEST(Inspector, UncertainGatekeeperShortCircuits) {
  auto gatekeeper = std::make_shared<kv::MockClassifier>(0.5);
  auto defect = std::make_shared<kv::MockClassifier>(0.99);
  ka::Inspector inspector(config_for(kc::ScoringMode::Classifier), gatekeeper, defect);

  // A flat plate would fail feature extraction; the gatekeeper decides first.
  auto v = inspector.inspect(kensa::testing::encode_png(kensa::testing::flat_plate()));
  ASSERT_TRUE(v.has_value());
  EXPECT_EQ(v->status, kc::VerdictStatus::Uncertain);
  EXPECT_EQ(v->explanation, kc::ExplanationKey::ImageUnclear);
  EXPECT_DOUBLE_EQ(*v->scores.gatekeeper_score, 0.5);
  EXPECT_DOUBLE_EQ(v->scores.defect_score, 0.0);
  EXPECT_EQ(gatekeeper->call_count(), 1u);
  EXPECT_EQ(defect->call_count(), 0u);
}

TEST(Inspector, LowGatekeeperIsInvalidInput) {
  auto gatekeeper = std::make_shared<kv::MockClassifier>(0.2);
  ka::Inspector inspector(config_for(kc::ScoringMode::Geometric), gatekeeper);
  auto v = inspector.inspect(kensa::testing::encode_png(kensa::testing::flat_plate()));
  ASSERT_TRUE(v.has_value());
  EXPECT_EQ(v->status, kc::VerdictStatus::InvalidInput);
  EXPECT_EQ(v->explanation, kc::ExplanationKey::NotInspectableSurface);
}

TEST(Inspector, GatekeeperFailurePropagates) {
  auto gatekeeper = std::make_shared<kv::MockClassifier>(0.9);
  gatekeeper->set_failure(true);
  ka::Inspector inspector(config_for(kc::ScoringMode::Geometric), gatekeeper);
  auto v = inspector.inspect(kensa::testing::scratched_png(2));
  ASSERT_FALSE(v.has_value());
  EXPECT_EQ(v.error(), kc::InspectionError::ClassifierError);
}

TEST(Inspector, ConfidentGatekeeperProceedsToDefectClassifier) {
  auto gatekeeper = std::make_shared<kv::MockClassifier>(0.93);
  auto defect = std::make_shared<kv::MockClassifier>(0.8);
  ka::Inspector inspector(config_for(kc::ScoringMode::Classifier), gatekeeper, defect);
  auto v = inspector.inspect(kensa::testing::scratched_png(1));
  ASSERT_TRUE(v.has_value());
  EXPECT_EQ(v->status, kc::VerdictStatus::Fail);
  EXPECT_DOUBLE_EQ(v->scores.defect_score, 0.8);
  EXPECT_NEAR(v->scores.health_score, 16.0, 1e-9);
  EXPECT_DOUBLE_EQ(*v->scores.gatekeeper_score, 0.93);
  EXPECT_EQ(gatekeeper->call_count(), 1u);
  EXPECT_EQ(defect->call_count(), 1u);
}

TEST(Inspector, ExternalProbabilityTakesPrecedence) {
  auto defect = std::make_shared<kv::MockClassifier>(0.9);
  ka::Inspector inspector(config_for(kc::ScoringMode::Classifier), ka::NoClassifier{}, defect);
  auto v = inspector.inspect(kensa::testing::scratched_png(1), 0.1);
  ASSERT_TRUE(v.has_value());
  EXPECT_EQ(v->status, kc::VerdictStatus::Pass);
  EXPECT_NEAR(v->scores.health_score, 98.0, 1e-9);
  EXPECT_EQ(defect->call_count(), 0u);
}

TEST(Inspector, ClassifierModeWithoutProbabilityIsInvalidConfig) {
  ka::Inspector inspector(config_for(kc::ScoringMode::Classifier));
  auto v = inspector.inspect(kensa::testing::scratched_png(1));
  ASSERT_FALSE(v.has_value());
  EXPECT_EQ(v.error(), kc::InspectionError::InvalidConfig);
}

TEST(Inspector, DefectClassifierFailurePropagates) {
  auto defect = std::make_shared<kv::MockClassifier>(0.3);
  defect->set_failure(true);
  ka::Inspector inspector(config_for(kc::ScoringMode::Classifier), ka::NoClassifier{}, defect);
  auto v = inspector.inspect(kensa::testing::scratched_png(1));
  ASSERT_FALSE(v.has_value());
  EXPECT_EQ(v.error(), kc::InspectionError::ClassifierError);
}

TEST(Inspector, RepeatedInspectionIsIdentical) {
  ka::Inspector inspector(config_for(kc::ScoringMode::Geometric));
  const auto bytes = kensa::testing::scratched_png(7);
  auto a = inspector.inspect(bytes);
  auto b = inspector.inspect(bytes);
  ASSERT_TRUE(a.has_value());
  ASSERT_TRUE(b.has_value());
  EXPECT_EQ(*a, *b);
}

TEST(Inspector, ScoresStayInRangeForAnyProbability) {
  ka::Inspector inspector(config_for(kc::ScoringMode::Classifier));
  const auto bytes = kensa::testing::scratched_png(1);
  for (double p : {-5.0, -0.01, 0.0, 0.25, 0.5, 0.50001, 0.75, 1.0, 1.01, 42.0}) {
    auto v = inspector.inspect(bytes, p);
    ASSERT_TRUE(v.has_value()) << "p=" << p;
    EXPECT_GE(v->scores.defect_score, 0.0) << "p=" << p;
    EXPECT_LE(v->scores.defect_score, 1.0) << "p=" << p;
    EXPECT_GE(v->scores.health_score, 0.0) << "p=" << p;
    EXPECT_LE(v->scores.health_score, 100.0) << "p=" << p;
  }
}

TEST(Inspector, RandomGridsScoreInRange) {
  cv::RNG rng(20240611);
  for (kc::ScoringMode mode : {kc::ScoringMode::Geometric, kc::ScoringMode::EdgeDensity}) {
    ka::Inspector inspector(config_for(mode));
    const auto& scoring = inspector.config().scoring;
    const bool banded = mode == kc::ScoringMode::EdgeDensity;
    const double health_min = banded ? scoring.health_floor : 0.0;
    const double health_max = banded ? scoring.health_ceiling : 100.0;
    for (int i = 0; i < 8; ++i) {
      cv::Mat noise(16 + 24 * i, 40 + 8 * i, CV_8UC3);
      rng.fill(noise, cv::RNG::UNIFORM, 0, 256);
      auto v = inspector.inspect(kensa::testing::encode_png(noise));
      ASSERT_TRUE(v.has_value()) << i;
      EXPECT_GE(v->scores.defect_score, 0.0);
      EXPECT_LE(v->scores.defect_score, 1.0);
      EXPECT_GE(v->scores.health_score, health_min) << i;
      EXPECT_LE(v->scores.health_score, health_max) << i;
    }
  }
}

TEST(Inspector, EdgeDensityHealthStaysInBand) {
  ka::Inspector inspector(config_for(kc::ScoringMode::EdgeDensity));
  for (int scratches : {1, 6, 16}) {
    auto v = inspector.inspect(kensa::testing::scratched_png(scratches));
    ASSERT_TRUE(v.has_value()) << scratches;
    EXPECT_GE(v->scores.health_score, 10.0);
    EXPECT_LE(v->scores.health_score, 99.0);
  }
}

TEST(Inspector, MoreScratchesNeverImproveHealth) {
  ka::Inspector inspector(config_for(kc::ScoringMode::Geometric));
  double previous_health = 101.0;
  double previous_defect = -1.0;
  std::size_t previous_count = 0;
  for (int scratches : {1, 3, 6, 10}) {
    auto v = inspector.inspect(kensa::testing::scratched_png(scratches));
    ASSERT_TRUE(v.has_value()) << scratches;
    EXPECT_LE(v->scores.health_score, previous_health) << scratches;
    EXPECT_GE(v->scores.defect_score, previous_defect) << scratches;
    EXPECT_GE(v->scores.defect_count, previous_count) << scratches;
    previous_health = v->scores.health_score;
    previous_defect = v->scores.defect_score;
    previous_count = v->scores.defect_count;
  }
}

TEST(Inspector, TimingCallbackSeesEveryStageThatRuns) {
  ka::Inspector inspector(config_for(kc::ScoringMode::Geometric));
  std::vector<std::size_t> stages;
  ka::StageTimingCallback cb = [&stages](std::size_t stage, double ms) {
    EXPECT_GE(ms, 0.0);
    stages.push_back(stage);
  };
  auto v = inspector.inspect(kensa::testing::scratched_png(2), std::nullopt, &cb);
  ASSERT_TRUE(v.has_value());
  const std::vector<std::size_t> expected = {
      static_cast<std::size_t>(ka::InspectionStage::Decode),
      static_cast<std::size_t>(ka::InspectionStage::Features),
      static_cast<std::size_t>(ka::InspectionStage::Regions),
      static_cast<std::size_t>(ka::InspectionStage::Score),
      static_cast<std::size_t>(ka::InspectionStage::Decide),
  };
  EXPECT_EQ(stages, expected);
}

TEST(Inspector, InvalidConfigThrows) {
  ka::InspectionConfig c = ka::default_config();
  c.features.blur_kernel_size = 0;
  EXPECT_THROW({ ka::Inspector inspector(c); }, std::invalid_argument);
}

TEST(Inspector, FixedSizeClassifierMustMatchConfiguredInput) {
  // config_for() prepares 32x32 classifier input.
  auto model_256 = std::make_shared<kv::MockClassifier>(0.9, kv::InputSize{256, 256});
  EXPECT_THROW({ ka::Inspector inspector(config_for(kc::ScoringMode::Geometric), model_256); },
               std::invalid_argument);
  EXPECT_THROW(
      {
        ka::Inspector inspector(config_for(kc::ScoringMode::Classifier), ka::NoClassifier{},
                                model_256);
      },
      std::invalid_argument);

  auto model_32 = std::make_shared<kv::MockClassifier>(0.9, kv::InputSize{32, 32});
  ka::Inspector inspector(config_for(kc::ScoringMode::Geometric), model_32);
  auto v = inspector.inspect(kensa::testing::scratched_png(2));
  ASSERT_TRUE(v.has_value());
  EXPECT_DOUBLE_EQ(*v->scores.gatekeeper_score, 0.9);
  EXPECT_EQ(model_32->call_count(), 1u);
}

TEST(Inspector, OneShotInspectRejectsInvalidConfig) {
  ka::InspectionConfig c = ka::default_config();
  c.scoring.max_defect_fraction = -1.0;
  auto v = ka::inspect(kensa::testing::scratched_png(1), c);
  ASSERT_FALSE(v.has_value());
  EXPECT_EQ(v.error(), kc::InspectionError::InvalidConfig);
}

TEST(MakeClassifier, BuildsConfiguredBackend) {
  ka::ClassifierConfig none;
  EXPECT_TRUE(std::holds_alternative<ka::NoClassifier>(ka::make_classifier(none)));

  ka::ClassifierConfig mock;
  mock.backend = ka::ClassifierBackendType::Mock;
  mock.mock_probability = 0.7;
  const ka::ClassifierSlot slot = ka::make_classifier(mock);
  ASSERT_TRUE(std::holds_alternative<std::shared_ptr<const kv::IClassifier>>(slot));

  ka::ClassifierConfig onnx;
  onnx.backend = ka::ClassifierBackendType::Onnx;
  EXPECT_THROW({ auto s = ka::make_classifier(onnx); }, std::runtime_error);
}
